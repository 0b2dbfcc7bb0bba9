#ifndef BTRFS_HPP
#define BTRFS_HPP

#include "strata/device_model.hpp"
#include "strata/error.hpp"
#include "strata/io_utils.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::fs {

auto gen_subvolume_create_command(std::string_view subvolume_path) noexcept -> std::vector<std::string>;

// Creates btrfs subvolumes on a freshly formatted device.
// The device is mounted at scratch_dir for the duration, and unmounted again
// even when a subvolume cannot be created.
auto btrfs_create_subvols(utils::CommandRunner& runner, const std::vector<disk::SubvolumeModification>& subvols,
    std::string_view device, std::string_view scratch_dir) noexcept -> Result<void>;

}  // namespace strata::fs

#endif  // BTRFS_HPP
