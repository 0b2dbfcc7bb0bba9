#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include "strata/error.hpp"

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::utils {
class CommandRunner;
}  // namespace strata::utils

namespace strata::disk {

/// @brief Represents a block device node as reported by lsblk.
struct BlockDevice {
    /// Device name (e.g., /dev/nvme0n1).
    std::string name;
    /// Device path, same as name when lsblk runs with --paths.
    std::string path;
    /// Device type (e.g., disk, part, crypt, lvm, loop).
    std::string type;
    /// Filesystem type (e.g., ext4, btrfs, crypto_LUKS).
    std::string fstype;
    /// Filesystem UUID.
    std::string uuid;
    /// Device model.
    std::optional<std::string> model;
    /// Parent device name.
    std::optional<std::string> pkname;
    /// Filesystem label.
    std::optional<std::string> label;
    /// Partition UUID.
    std::optional<std::string> partuuid;
    /// Partition type GUID (GPT) or type code (MBR).
    std::optional<std::string> parttype;
    /// Partition attribute flags.
    std::optional<std::string> partflags;
    /// Partition table type (gpt, dos).
    std::optional<std::string> pttype;
    /// Size of the device in bytes.
    std::optional<std::uint64_t> size;
    /// Partition start offset, in 512-byte units regardless of the logical sector size.
    std::optional<std::uint64_t> start;
    /// Logical sector size in bytes.
    std::optional<std::uint64_t> log_sec;
    /// Partition number.
    std::optional<std::uint32_t> partn;
    /// Rotational device.
    bool rota{};
    /// Read-only device.
    bool read_only{};
    /// All current mountpoints.
    std::vector<std::string> mountpoints{};
    /// Filesystem roots, index-aligned with mountpoints (btrfs subvolume per mount).
    std::vector<std::string> fsroots{};
    /// Nested block devices (partitions, mapper devices, logical volumes).
    std::vector<BlockDevice> children{};
};

/// @brief Source of the device tree.
///
/// Every call must return fresh kernel state, implementations never cache.
class DeviceProbe {
 public:
    virtual ~DeviceProbe() = default;

    /// @brief Enumerates all top-level block devices with nested children.
    /// @return Device tree, or ProbeError.
    virtual auto probe() noexcept -> Result<std::vector<BlockDevice>> = 0;
};

/// @brief DeviceProbe backed by lsblk JSON output.
class LsblkProbe final : public DeviceProbe {
 public:
    explicit LsblkProbe(utils::CommandRunner& runner) noexcept
      : m_runner(runner) { }

    auto probe() noexcept -> Result<std::vector<BlockDevice>> override;

 private:
    utils::CommandRunner& m_runner;
};

/// @brief Parses lsblk --json output.
/// @param json_output Output of lsblk with the columns requested by LsblkProbe.
/// @return Device tree, std::nullopt if the document is malformed.
auto parse_lsblk_json(std::string_view json_output) noexcept -> std::optional<std::vector<BlockDevice>>;

/// @brief Finds a block device by its name, searching nested children too.
/// @param devices A vector of BlockDevice objects.
/// @param device_name A string view containing the name of the device to find.
/// @return An optional BlockDevice object if found, std::nullopt otherwise.
auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> std::optional<BlockDevice>;

}  // namespace strata::disk

#endif  // BLOCK_DEVICES_HPP
