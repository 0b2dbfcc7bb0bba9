#ifndef MOUNT_PARTITIONS_HPP
#define MOUNT_PARTITIONS_HPP

#include "strata/error.hpp"
#include "strata/partition_config.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::mount {

/// @brief One mount operation of the final plan.
struct MountEntry final {
    /// Block device mounted (partition, LV or mapper path).
    std::string source{};
    /// Absolute path inside the target root.
    std::string mountpoint{};
    fs::FilesystemType fs_type{fs::FilesystemType::Unknown};
    std::vector<std::string> options{};
    /// btrfs subvolume name, when the entry mounts one.
    std::optional<std::string> subvolume{};
    /// Filesystem UUID of the source, empty until resolved.
    std::string uuid{};
    /// Object id of the partition or volume the entry comes from.
    std::string object_id{};

    /// Options passed to mount(8), with subvol= in front for subvolumes.
    [[nodiscard]] auto mount_options() const noexcept -> std::vector<std::string>;

    bool operator==(const MountEntry&) const = default;
};

/// @brief Number of path components, "/" is 0 and "/var/log" is 2.
auto mountpoint_depth(std::string_view mountpoint) noexcept -> std::size_t;

/// @brief Orders entries so every parent is mounted before its children.
///
/// Sorted by depth; on equal depth plain filesystems go before subvolumes,
/// then by mountpoint. Pure function.
/// Fails with InvalidMountOrder when "/" is missing, a mountpoint is relative
/// or a mountpoint is used twice.
auto compute_mount_plan(std::vector<MountEntry> entries) noexcept -> Result<std::vector<MountEntry>>;

/// @brief Host path of @p mountpoint below @p target_root.
auto target_path(std::string_view target_root, std::string_view mountpoint) noexcept -> std::string;

auto gen_mount_command(const MountEntry& entry, std::string_view target_root) noexcept -> std::vector<std::string>;
auto gen_umount_command(std::string_view path) noexcept -> std::vector<std::string>;

}  // namespace strata::mount

#endif  // MOUNT_PARTITIONS_HPP
