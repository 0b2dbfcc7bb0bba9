#ifndef LVM_HPP
#define LVM_HPP

#include "strata/device_model.hpp"
#include "strata/error.hpp"
#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <cstdint>      // for uint8_t, uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace strata::lvm {

/// @brief Input for LvmVolume::create.
struct LvmVolumeSpec final {
    disk::ModificationStatus status{disk::ModificationStatus::Create};
    std::string name{};
    std::optional<fs::FilesystemType> fs_type{};
    disk::Size length{};
    std::optional<std::string> mountpoint{};
    std::vector<std::string> mount_options{};
    std::vector<disk::SubvolumeModification> btrfs_subvols{};
    /// Generated when absent.
    std::optional<disk::ObjectId> obj_id{};
    /// Mapper device path, known once the volume exists.
    std::optional<std::string> dev_path{};
    std::optional<std::string> uuid{};
};

/// @brief Desired logical volume, same shape as a partition.
class LvmVolume final {
 public:
    /// Fails with InvalidState for an empty or reserved name, a relative mountpoint
    /// or invalid subvolumes.
    static auto create(LvmVolumeSpec spec) noexcept -> Result<LvmVolume>;

    [[nodiscard]] auto obj_id() const noexcept -> const disk::ObjectId& { return *m_spec.obj_id; }
    [[nodiscard]] auto status() const noexcept -> disk::ModificationStatus { return m_spec.status; }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return m_spec.name; }
    [[nodiscard]] auto fs_type() const noexcept -> const std::optional<fs::FilesystemType>& { return m_spec.fs_type; }
    [[nodiscard]] auto length() const noexcept -> const disk::Size& { return m_spec.length; }
    [[nodiscard]] auto mountpoint() const noexcept -> const std::optional<std::string>& { return m_spec.mountpoint; }
    [[nodiscard]] auto mount_options() const noexcept -> const std::vector<std::string>& { return m_spec.mount_options; }
    [[nodiscard]] auto btrfs_subvols() const noexcept -> const std::vector<disk::SubvolumeModification>& { return m_spec.btrfs_subvols; }
    [[nodiscard]] auto dev_path() const noexcept -> const std::optional<std::string>& { return m_spec.dev_path; }
    [[nodiscard]] auto uuid() const noexcept -> const std::optional<std::string>& { return m_spec.uuid; }

    void set_length(disk::Size length) noexcept { m_spec.length = length; }
    void set_dev_path(std::string dev_path) noexcept { m_spec.dev_path = std::move(dev_path); }
    void set_uuid(std::string uuid) noexcept { m_spec.uuid = std::move(uuid); }

    [[nodiscard]] auto is_root() const noexcept -> bool;
    [[nodiscard]] auto is_create_or_modify() const noexcept -> bool;
    /// @brief Name of the mapper device used when the volume is encrypted, e.g. "luks-vg0-root".
    [[nodiscard]] auto mapper_name(std::string_view vg_name) const noexcept -> std::string;

 private:
    explicit LvmVolume(LvmVolumeSpec spec) noexcept
      : m_spec(std::move(spec)) { }

    LvmVolumeSpec m_spec;
};

/// @brief Volume group built from physical-volume partitions, referenced by object id.
class LvmVolumeGroup final {
 public:
    /// Fails with InvalidState for an empty name, no PVs, a PV listed twice
    /// or two volumes with the same name.
    static auto create(std::string name, std::vector<disk::ObjectId> pvs, std::vector<LvmVolume> volumes) noexcept -> Result<LvmVolumeGroup>;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return m_name; }
    [[nodiscard]] auto pvs() const noexcept -> const std::vector<disk::ObjectId>& { return m_pvs; }
    [[nodiscard]] auto volumes() const noexcept -> const std::vector<LvmVolume>& { return m_volumes; }
    [[nodiscard]] auto volumes() noexcept -> std::vector<LvmVolume>& { return m_volumes; }

 private:
    LvmVolumeGroup(std::string name, std::vector<disk::ObjectId> pvs, std::vector<LvmVolume> volumes) noexcept
      : m_name(std::move(name)), m_pvs(std::move(pvs)), m_volumes(std::move(volumes)) { }

    std::string m_name;
    std::vector<disk::ObjectId> m_pvs;
    std::vector<LvmVolume> m_volumes;
};

/// @brief All volume groups of a layout.
class LvmConfiguration final {
 public:
    /// Fails with InvalidState when a PV belongs to more than one group,
    /// or two groups share a name.
    static auto create(std::vector<LvmVolumeGroup> vol_groups) noexcept -> Result<LvmConfiguration>;

    [[nodiscard]] auto vol_groups() const noexcept -> const std::vector<LvmVolumeGroup>& { return m_vol_groups; }
    [[nodiscard]] auto vol_groups() noexcept -> std::vector<LvmVolumeGroup>& { return m_vol_groups; }

    [[nodiscard]] auto find_volume(std::string_view obj_id) noexcept -> LvmVolume*;
    [[nodiscard]] auto find_volume(std::string_view obj_id) const noexcept -> const LvmVolume*;
    /// @brief Group owning the volume with @p obj_id.
    [[nodiscard]] auto find_group_of(std::string_view obj_id) const noexcept -> const LvmVolumeGroup*;
    [[nodiscard]] auto is_pv(std::string_view obj_id) const noexcept -> bool;

 private:
    explicit LvmConfiguration(std::vector<LvmVolumeGroup> vol_groups) noexcept
      : m_vol_groups(std::move(vol_groups)) { }

    std::vector<LvmVolumeGroup> m_vol_groups;
};

/// @brief Device-mapper path of a logical volume, dashes doubled as device-mapper does.
/// @return e.g. "/dev/mapper/my--vg-root"
auto lvm_mapper_path(std::string_view vg_name, std::string_view lv_name) noexcept -> std::string;

auto gen_pvcreate_command(const std::vector<std::string>& pv_paths) noexcept -> std::vector<std::string>;
auto gen_vgcreate_command(std::string_view vg_name, const std::vector<std::string>& pv_paths) noexcept -> std::vector<std::string>;
auto gen_lvcreate_command(std::string_view vg_name, std::string_view lv_name, const disk::Size& length) noexcept -> std::vector<std::string>;
/// @brief `vgs` report of a single group in JSON with byte units.
auto gen_vg_report_command(std::string_view vg_name) noexcept -> std::vector<std::string>;

/// @brief Extracts vg_free (bytes) from `vgs --reportformat json` output.
auto parse_vg_free_bytes(std::string_view report_json, std::string_view vg_name) noexcept -> std::optional<std::uint64_t>;

}  // namespace strata::lvm

#endif  // LVM_HPP
