#ifndef DEVICE_MODEL_HPP
#define DEVICE_MODEL_HPP

#include "strata/device_inventory.hpp"
#include "strata/error.hpp"
#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <cstdint>      // for uint8_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace strata::disk {

/// Opaque identity of a staged partition or volume.
/// Device paths are not usable as identity, a partition to be created has none yet.
using ObjectId = std::string;

/// @brief Generates a random (v4) UUID string.
auto generate_object_id() noexcept -> ObjectId;

enum class ModificationStatus : std::uint8_t {
    Exist,
    Modify,
    Delete,
    Create,
};

enum class PartitionType : std::uint8_t {
    Primary,
    Boot,
};

auto modification_status_to_string(ModificationStatus status) noexcept -> std::string_view;
auto string_to_modification_status(std::string_view status) noexcept -> std::optional<ModificationStatus>;
auto partition_type_to_string(PartitionType type) noexcept -> std::string_view;
auto string_to_partition_type(std::string_view type) noexcept -> std::optional<PartitionType>;

/// btrfs subvolume to be created on a partition or logical volume.
struct SubvolumeModification final {
    /// Subvolume name relative to the filesystem root, e.g. "@home".
    std::string name;
    std::string mountpoint;
    bool compress{false};
    bool nodatacow{false};

    /// Mount options derived from the compress/nodatacow switches.
    [[nodiscard]] auto mount_options() const noexcept -> std::vector<std::string>;

    constexpr bool operator==(const SubvolumeModification&) const = default;
};

/// @brief Validates a subvolume list, shared by partitions and logical volumes.
auto validate_subvolumes(const std::vector<SubvolumeModification>& subvols) noexcept -> Result<void>;

/// @brief Deduplicates mount options by key ("compress=zstd" and "compress=lzo" share "compress").
///
/// Keeps the position of the first occurrence and the value of the last one.
auto normalize_mount_options(const std::vector<std::string>& options) noexcept -> std::vector<std::string>;

/// @brief Input for PartitionModification::create.
struct PartitionSpec final {
    ModificationStatus status{ModificationStatus::Create};
    PartitionType type{PartitionType::Primary};
    Size start{};
    Size length{};
    std::optional<fs::FilesystemType> fs_type{};
    std::optional<std::string> mountpoint{};
    std::vector<std::string> mount_options{};
    std::vector<fs::PartitionFlag> flags{};
    std::vector<SubvolumeModification> btrfs_subvols{};
    /// Required for Exist/Modify/Delete.
    std::optional<std::string> dev_path{};
    /// Generated when absent.
    std::optional<ObjectId> obj_id{};
    std::optional<std::string> partuuid{};
    std::optional<std::string> uuid{};
    std::optional<std::uint32_t> partn{};
};

/// @brief Desired state of one partition.
///
/// Built only through create(), so an instance always satisfies its invariants.
class PartitionModification final {
 public:
    /// @brief Validates and builds a modification.
    ///
    /// Fails with InvalidState when:
    /// - status is Exist/Modify/Delete and there is no dev_path
    /// - status is Modify and there is no fs_type
    /// - the mountpoint is not absolute
    /// - a subvolume is invalid (see validate_subvolumes)
    static auto create(PartitionSpec spec) noexcept -> Result<PartitionModification>;

    /// @brief Exist modification mirroring a probed partition.
    static auto from_existing(const PartitionInfo& info) noexcept -> PartitionModification;

    [[nodiscard]] auto obj_id() const noexcept -> const ObjectId& { return *m_spec.obj_id; }
    [[nodiscard]] auto status() const noexcept -> ModificationStatus { return m_spec.status; }
    [[nodiscard]] auto type() const noexcept -> PartitionType { return m_spec.type; }
    [[nodiscard]] auto start() const noexcept -> const Size& { return m_spec.start; }
    [[nodiscard]] auto length() const noexcept -> const Size& { return m_spec.length; }
    [[nodiscard]] auto end() const noexcept -> Size { return m_spec.start + m_spec.length; }
    [[nodiscard]] auto fs_type() const noexcept -> const std::optional<fs::FilesystemType>& { return m_spec.fs_type; }
    [[nodiscard]] auto mountpoint() const noexcept -> const std::optional<std::string>& { return m_spec.mountpoint; }
    [[nodiscard]] auto mount_options() const noexcept -> const std::vector<std::string>& { return m_spec.mount_options; }
    [[nodiscard]] auto flags() const noexcept -> const std::vector<fs::PartitionFlag>& { return m_spec.flags; }
    [[nodiscard]] auto btrfs_subvols() const noexcept -> const std::vector<SubvolumeModification>& { return m_spec.btrfs_subvols; }
    [[nodiscard]] auto dev_path() const noexcept -> const std::optional<std::string>& { return m_spec.dev_path; }
    [[nodiscard]] auto partuuid() const noexcept -> const std::optional<std::string>& { return m_spec.partuuid; }
    [[nodiscard]] auto uuid() const noexcept -> const std::optional<std::string>& { return m_spec.uuid; }
    [[nodiscard]] auto partn() const noexcept -> const std::optional<std::uint32_t>& { return m_spec.partn; }

    /// @brief Changes the lifecycle status, re-checking the status dependent invariants.
    auto set_status(ModificationStatus status) noexcept -> Result<void>;
    /// @brief Clearing the fs type of a Modify partition is refused.
    auto set_fs_type(std::optional<fs::FilesystemType> fs_type) noexcept -> Result<void>;
    auto set_mountpoint(std::optional<std::string> mountpoint) noexcept -> Result<void>;
    auto set_btrfs_subvols(std::vector<SubvolumeModification> subvols) noexcept -> Result<void>;
    void set_mount_options(const std::vector<std::string>& options) noexcept;
    void set_flag(fs::PartitionFlag flag) noexcept;
    void clear_flag(fs::PartitionFlag flag) noexcept;
    void set_geometry(Size start, Size length) noexcept;

    /// @brief Records the identity the kernel assigned, once the partition exists.
    void resolve(std::string dev_path, std::string partuuid, std::uint32_t partn) noexcept;
    void set_uuid(std::string uuid) noexcept;

    [[nodiscard]] auto has_flag(fs::PartitionFlag flag) const noexcept -> bool;
    [[nodiscard]] auto is_boot() const noexcept -> bool;
    /// FAT32 with Boot or ESP flag, and not an XBOOTLDR partition.
    [[nodiscard]] auto is_efi() const noexcept -> bool;
    /// Mounted at "/" directly or through one of its subvolumes.
    [[nodiscard]] auto is_root() const noexcept -> bool;
    [[nodiscard]] auto is_home() const noexcept -> bool;
    [[nodiscard]] auto is_swap() const noexcept -> bool;
    [[nodiscard]] auto is_exists_or_modify() const noexcept -> bool;
    [[nodiscard]] auto is_create_or_modify() const noexcept -> bool;

    /// @brief Name of the mapper device the partition is unlocked to, e.g. "luks-sda2".
    /// @return std::nullopt while the partition has no device path.
    [[nodiscard]] auto mapper_name() const noexcept -> std::optional<std::string>;

 private:
    explicit PartitionModification(PartitionSpec spec) noexcept
      : m_spec(std::move(spec)) { }

    PartitionSpec m_spec;
};

/// @brief Desired state of one physical device.
class DeviceModification final {
 public:
    /// @param partition_table Label written on wipe, or the label the layout assumes otherwise.
    ///                        Defaults to the device's current label, GPT for a blank device.
    DeviceModification(DeviceInfo device, bool wipe, std::optional<fs::PartitionTable> partition_table = std::nullopt) noexcept;

    [[nodiscard]] auto device() const noexcept -> const DeviceInfo& { return m_device; }
    [[nodiscard]] auto device_path() const noexcept -> const std::string& { return m_device.path; }
    [[nodiscard]] auto wipe() const noexcept -> bool { return m_wipe; }
    [[nodiscard]] auto partition_table() const noexcept -> fs::PartitionTable { return m_partition_table; }

    [[nodiscard]] auto partitions() const noexcept -> const std::vector<PartitionModification>& { return m_partitions; }
    [[nodiscard]] auto partitions() noexcept -> std::vector<PartitionModification>& { return m_partitions; }
    void add_partition(PartitionModification partition) noexcept;

    [[nodiscard]] auto get_efi_partition() const noexcept -> const PartitionModification*;
    /// XBOOTLDR only counts as boot partition when a separate EFI partition exists.
    [[nodiscard]] auto get_boot_partition() const noexcept -> const PartitionModification*;
    [[nodiscard]] auto get_root_partition() const noexcept -> const PartitionModification*;

    [[nodiscard]] auto find_partition(std::string_view obj_id) noexcept -> PartitionModification*;
    [[nodiscard]] auto find_partition(std::string_view obj_id) const noexcept -> const PartitionModification*;

    /// @brief Free space left between the staged partitions (Delete ones ignored).
    [[nodiscard]] auto free_space(Size min_gap = Size{1, Unit::MiB}) const noexcept -> std::vector<FreeSpaceRegion>;

 private:
    DeviceInfo m_device;
    bool m_wipe{false};
    fs::PartitionTable m_partition_table{fs::PartitionTable::Gpt};
    std::vector<PartitionModification> m_partitions{};
};

/// @brief Free space left on @p device once @p partitions are applied.
auto compute_free_space(const DeviceInfo& device, const std::vector<PartitionModification>& partitions, fs::PartitionTable table, Size min_gap = Size{1, Unit::MiB}) noexcept -> std::vector<FreeSpaceRegion>;

}  // namespace strata::disk

#endif  // DEVICE_MODEL_HPP
