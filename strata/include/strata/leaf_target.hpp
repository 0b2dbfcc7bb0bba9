#ifndef LEAF_TARGET_HPP
#define LEAF_TARGET_HPP

#include "strata/device_model.hpp"
#include "strata/lvm.hpp"
#include "strata/mount_partitions.hpp"
#include "strata/partition_config.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <type_traits>  // for is_same_v, remove_cvref_t
#include <variant>      // for variant, visit
#include <vector>       // for vector

namespace strata::provision {

/// Partition carrying a filesystem directly.
struct RawPartition final {
    disk::PartitionModification* partition{};
};

/// Logical volume carrying a filesystem directly.
struct LvmVolumeTarget final {
    lvm::LvmVolume* volume{};
    std::string vg_name{};
};

/// Unlocked LUKS volume; the filesystem lives on the mapper, the model on the backing target.
struct CryptoMapper final {
    std::string mapper_path{};
    std::variant<disk::PartitionModification*, lvm::LvmVolume*> backing{};
};

/// @brief Block device at the bottom of the storage stack, the one that gets formatted and mounted.
///
/// Targets point into the DiskLayoutConfiguration being provisioned, which must outlive them.
using LeafTarget = std::variant<RawPartition, LvmVolumeTarget, CryptoMapper>;

/// @brief Invokes @p func with the partition or volume model behind @p leaf.
template <typename Func>
auto visit_model(const LeafTarget& leaf, Func&& func) {
    return std::visit([&func](auto&& target) {
        using T = std::remove_cvref_t<decltype(target)>;
        if constexpr (std::is_same_v<T, RawPartition>) {
            return func(*target.partition);
        } else if constexpr (std::is_same_v<T, LvmVolumeTarget>) {
            return func(*target.volume);
        } else {
            return std::visit([&func](auto* model) { return func(*model); }, target.backing);
        }
    },
        leaf);
}

/// @brief Device node the filesystem lives on, std::nullopt while unresolved.
auto leaf_device_path(const LeafTarget& leaf) noexcept -> std::optional<std::string>;
auto leaf_object_id(const LeafTarget& leaf) noexcept -> std::string;
auto leaf_fs_type(const LeafTarget& leaf) noexcept -> std::optional<fs::FilesystemType>;
/// @brief Explicitly marked for (re)formatting: Create/Modify with a filesystem type.
auto leaf_is_formattable(const LeafTarget& leaf) noexcept -> bool;
auto leaf_subvolumes(const LeafTarget& leaf) noexcept -> std::vector<disk::SubvolumeModification>;
auto leaf_uuid(const LeafTarget& leaf) noexcept -> std::optional<std::string>;
void leaf_set_uuid(LeafTarget& leaf, std::string uuid) noexcept;

/// @brief Mount entries contributed by the leaf: one per subvolume with a mountpoint,
/// otherwise one for the filesystem itself if it has a mountpoint.
auto leaf_mount_entries(const LeafTarget& leaf) noexcept -> std::vector<mount::MountEntry>;
/// @brief Swap entry for fstab, std::nullopt unless the leaf is swap.
auto leaf_swap_entry(const LeafTarget& leaf) noexcept -> std::optional<mount::MountEntry>;

}  // namespace strata::provision

#endif  // LEAF_TARGET_HPP
