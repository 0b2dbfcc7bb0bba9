#ifndef DISK_LAYOUT_HPP
#define DISK_LAYOUT_HPP

#include "strata/device_inventory.hpp"
#include "strata/device_model.hpp"
#include "strata/error.hpp"
#include "strata/luks.hpp"
#include "strata/lvm.hpp"

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace strata::disk {

enum class LayoutType : std::uint8_t {
    /// Produced by the suggestion engine.
    Default,
    /// Hand-edited partitioning.
    Manual,
    /// The user mounted everything under a base directory already.
    PreMounted,
};

auto layout_type_to_string(LayoutType type) noexcept -> std::string_view;
auto string_to_layout_type(std::string_view type) noexcept -> std::optional<LayoutType>;

/// @brief The whole desired disk state: devices, optional LVM, optional pre-mount base.
///
/// Cross-entity invariants (unique object ids, PV references, partition geometry)
/// are checked once in create(), so the executor only deals with environmental failures.
class DiskLayoutConfiguration final {
 public:
    /// Fails with InvalidState when:
    /// - two partitions or volumes share an object id
    /// - a wiped device keeps an existing partition
    /// - a partition to create starts before 1 MiB or is not MiB-aligned
    /// - two partitions of a device overlap, or one ends past the usable end
    /// - an LVM PV names no partition of the layout
    /// - a PreMounted layout has no absolute mountpoint
    static auto create(LayoutType type, std::vector<DeviceModification> device_modifications,
        std::optional<lvm::LvmConfiguration> lvm_config = std::nullopt,
        std::optional<std::string> mountpoint = std::nullopt) noexcept -> Result<DiskLayoutConfiguration>;

    [[nodiscard]] auto type() const noexcept -> LayoutType { return m_type; }
    [[nodiscard]] auto mountpoint() const noexcept -> const std::optional<std::string>& { return m_mountpoint; }
    [[nodiscard]] auto device_modifications() const noexcept -> const std::vector<DeviceModification>& { return m_device_modifications; }
    [[nodiscard]] auto device_modifications() noexcept -> std::vector<DeviceModification>& { return m_device_modifications; }
    [[nodiscard]] auto lvm_config() const noexcept -> const std::optional<lvm::LvmConfiguration>& { return m_lvm_config; }
    [[nodiscard]] auto lvm_config() noexcept -> std::optional<lvm::LvmConfiguration>& { return m_lvm_config; }

    /// @brief Attaches an LVM configuration after checking its PV references.
    auto set_lvm_config(lvm::LvmConfiguration lvm_config) noexcept -> Result<void>;

    /// @brief Checks that every encryption target exists in this layout and may be encrypted.
    [[nodiscard]] auto validate_encryption(const crypto::DiskEncryption& encryption) const noexcept -> Result<void>;

    [[nodiscard]] auto find_partition(std::string_view obj_id) noexcept -> PartitionModification*;
    [[nodiscard]] auto find_partition(std::string_view obj_id) const noexcept -> const PartitionModification*;
    /// @brief Device owning the partition with @p obj_id.
    [[nodiscard]] auto find_device_of(std::string_view obj_id) const noexcept -> const DeviceModification*;
    [[nodiscard]] auto find_volume(std::string_view obj_id) const noexcept -> const lvm::LvmVolume*;

 private:
    DiskLayoutConfiguration(LayoutType type, std::vector<DeviceModification> device_modifications,
        std::optional<lvm::LvmConfiguration> lvm_config, std::optional<std::string> mountpoint) noexcept
      : m_type(type), m_device_modifications(std::move(device_modifications)),
        m_lvm_config(std::move(lvm_config)), m_mountpoint(std::move(mountpoint)) { }

    LayoutType m_type{LayoutType::Manual};
    std::vector<DeviceModification> m_device_modifications{};
    std::optional<lvm::LvmConfiguration> m_lvm_config{};
    std::optional<std::string> m_mountpoint{};
};

/// @brief Exist modifications for every partition mounted at or below @p base.
///
/// Mountpoints (and btrfs subvolume mountpoints) are rewritten relative to @p base,
/// so "/mnt/boot" becomes "/boot" for base "/mnt".
auto pre_mounted_modifications(const std::vector<DeviceInfo>& devices, std::string_view base) noexcept -> Result<std::vector<DeviceModification>>;

}  // namespace strata::disk

#endif  // DISK_LAYOUT_HPP
