#ifndef FSTAB_HPP
#define FSTAB_HPP

#include "strata/mount_partitions.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::fs {

// Generate fstab entry for a single mount, std::nullopt for entries fstab cannot describe
auto gen_fstab_entry(const mount::MountEntry& entry) noexcept -> std::optional<std::string>;

// Generate fstab into string, swap entries are appended after the mount plan
auto generate_fstab_content(const std::vector<mount::MountEntry>& plan, const std::vector<mount::MountEntry>& swap = {}) noexcept -> std::string;

// Generate fstab into <root_mountpoint>/etc/fstab
auto generate_fstab(const std::vector<mount::MountEntry>& plan, const std::vector<mount::MountEntry>& swap, std::string_view root_mountpoint) noexcept -> bool;

}  // namespace strata::fs

#endif  // FSTAB_HPP
