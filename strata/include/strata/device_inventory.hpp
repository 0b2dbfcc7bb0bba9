#ifndef DEVICE_INVENTORY_HPP
#define DEVICE_INVENTORY_HPP

#include "strata/block_devices.hpp"
#include "strata/error.hpp"
#include "strata/free_space.hpp"
#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::disk {

/// btrfs subvolume currently mounted from a partition.
struct BtrfsSubvolumeInfo final {
    std::string name;
    std::string mountpoint;

    constexpr bool operator==(const BtrfsSubvolumeInfo&) const = default;
};

/// @brief Partition as it exists right now, per the last probe.
struct PartitionInfo final {
    std::string path{};
    /// Path of the disk holding the partition.
    std::string device_path{};
    std::uint32_t partn{};
    /// GPT type GUID or MBR type code.
    std::string part_type{};
    fs::FilesystemType fs_type{fs::FilesystemType::Unknown};
    Size start{};
    Size length{};
    std::vector<fs::PartitionFlag> flags{};
    std::string partuuid{};
    std::string uuid{};
    std::vector<std::string> mountpoints{};
    std::vector<BtrfsSubvolumeInfo> btrfs_subvols{};

    [[nodiscard]] auto has_flag(fs::PartitionFlag flag) const noexcept -> bool;
    /// Last sector covered by the partition (inclusive).
    [[nodiscard]] auto end_sector() const noexcept -> std::uint64_t;
};

/// @brief Disk-like block device as it exists right now, per the last probe.
struct DeviceInfo final {
    std::string model{};
    std::string path{};
    /// disk, loop, raid*, crypt
    std::string type{};
    Size total_size{};
    SectorSize sector_size{};
    /// std::nullopt for a device without partition table.
    std::optional<fs::PartitionTable> partition_table{};
    bool read_only{};
    bool rotational{};
    std::vector<FreeSpaceRegion> free_space_regions{};
    std::vector<PartitionInfo> partitions{};

    [[nodiscard]] auto geometry(fs::PartitionTable fallback_table = fs::PartitionTable::Gpt) const noexcept -> DeviceGeometry;
};

/// @brief Builds the immutable device description from a probed node.
auto build_device_info(const BlockDevice& node) noexcept -> DeviceInfo;

/// @brief Single authoritative snapshot of the machine's block devices.
///
/// The snapshot is replaced wholesale on every list_devices() call and
/// never patched, partitions get renamed by the kernel while provisioning.
class DeviceInventory final {
 public:
    explicit DeviceInventory(DeviceProbe& probe) noexcept
      : m_probe(probe) { }

    /// @brief Re-probes and replaces the snapshot.
    /// @return The new device list, or ProbeError (the old snapshot is dropped).
    auto list_devices() noexcept -> Result<std::vector<DeviceInfo>>;

    /// @brief Looks up a disk in the last snapshot, absence is not an error.
    [[nodiscard]] auto get_device(std::string_view path) const noexcept -> std::optional<DeviceInfo>;
    [[nodiscard]] auto find_partition(std::string_view path) const noexcept -> std::optional<PartitionInfo>;
    /// @brief Looks up any node (disk, part, crypt, lvm) of the last snapshot.
    [[nodiscard]] auto find_node(std::string_view path) const noexcept -> std::optional<BlockDevice>;

    [[nodiscard]] auto devices() const noexcept -> const std::vector<DeviceInfo>& { return m_devices; }

 private:
    DeviceProbe& m_probe;
    std::vector<DeviceInfo> m_devices{};
    std::vector<BlockDevice> m_nodes{};
};

}  // namespace strata::disk

#endif  // DEVICE_INVENTORY_HPP
