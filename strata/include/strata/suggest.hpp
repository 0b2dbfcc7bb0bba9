#ifndef SUGGEST_HPP
#define SUGGEST_HPP

#include "strata/device_inventory.hpp"
#include "strata/device_model.hpp"
#include "strata/disk_layout.hpp"
#include "strata/error.hpp"
#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::disk {

/// Answers the interactive installer would otherwise ask for.
struct SuggestionOptions final {
    /// Separate /home partition when the device is large enough (ignored with subvolumes).
    bool separate_home{true};
    /// Default subvolume scheme on a btrfs root instead of a /home partition.
    bool use_subvolumes{true};
    /// Adds compress=zstd to btrfs partitions and subvolumes.
    bool compression{false};
    fs::PartitionTable partition_table{fs::PartitionTable::Gpt};
    /// Extra mount options for root and home.
    std::vector<std::string> mount_options{};
};

/// @brief Why no layout could be suggested. An expected outcome on small disks, not an Error.
struct CapacityShortfall final {
    std::string device{};
    Size required{};
    Size available{};
    std::string reason{};
};

template <typename T>
using Suggestion = std::expected<T, CapacityShortfall>;

inline constexpr Size BOOT_PARTITION_SIZE{1, Unit::GiB};
inline constexpr Size MIN_ROOT_SIZE{8, Unit::GiB};
inline constexpr Size MIN_HOME_DEVICE_SIZE{40, Unit::GiB};
inline constexpr Size ROOT_TARGET_SIZE{32, Unit::GiB};
inline constexpr Size MAX_ROOT_SIZE{50, Unit::GiB};
inline constexpr Size LVM_ROOT_SIZE{20, Unit::GiB};

/// @brief @ -> /, @home -> /home, @log -> /var/log, @pkg -> /var/cache/pacman/pkg
auto default_btrfs_subvolumes(bool compress = false) noexcept -> std::vector<SubvolumeModification>;

/// @brief Boot + root (+ home) layout for one wiped device.
///
/// The boot partition is 1 GiB FAT32 at 1 MiB. Without a home partition root takes
/// the rest of the usable range, otherwise root is 10% of the device clamped to
/// [32 GiB, 50 GiB] and home gets the remainder.
auto suggest_single_disk(const DeviceInfo& device, fs::FilesystemType fs_type, const SuggestionOptions& options = {}) noexcept -> Suggestion<DeviceModification>;

/// @brief Root+boot on one device, home on another.
///
/// Home goes on the largest device of at least 40 GiB, root on the remaining
/// device whose size is closest to 32 GiB.
auto suggest_multi_disk(const std::vector<DeviceInfo>& devices, fs::FilesystemType fs_type, const SuggestionOptions& options = {}) noexcept -> Suggestion<std::vector<DeviceModification>>;

/// @brief Turns a default layout into an LVM one.
///
/// Every non-boot partition becomes a PV of @p vg_name and loses its filesystem
/// and mountpoint. The group gets a 20 GiB root volume and a home volume with the
/// remainder, or a single root volume carrying the subvolumes of the old root.
/// Fails with InvalidState for a non-default layout or one without PV candidates.
auto suggest_lvm(const DiskLayoutConfiguration& layout, std::string_view vg_name = "vg0") noexcept -> Result<DiskLayoutConfiguration>;

}  // namespace strata::disk

#endif  // SUGGEST_HPP
