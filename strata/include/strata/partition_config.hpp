#ifndef PARTITION_CONFIG_HPP
#define PARTITION_CONFIG_HPP

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::fs {

/// @brief Filesystem types the provisioning core knows about
enum class FilesystemType : std::uint8_t {
    Btrfs,
    Ext2,
    Ext3,
    Ext4,
    F2fs,
    Fat12,
    Fat16,
    Fat32,
    Ntfs,
    Xfs,
    LinuxSwap,
    CryptoLuks,
    Unknown
};

/// @brief Partition table label written to / read from a device
enum class PartitionTable : std::uint8_t {
    Gpt,
    Mbr,
};

/// @brief Partition flags, derived from the partition type on probe
enum class PartitionFlag : std::uint8_t {
    Boot,
    /// Extended boot loader partition (bls_boot)
    Xbootldr,
    Esp,
    LinuxHome,
    Swap,
};

/// @brief Convert FilesystemType enum to string representation
/// @param fs_type The filesystem type to convert
/// @return String representation of the filesystem type (e.g. "linux-swap")
auto filesystem_type_to_string(FilesystemType fs_type) noexcept -> std::string_view;

/// @brief Convert string to FilesystemType enum
/// @param fs_name The filesystem name string, both our names and lsblk names are accepted
/// @return FilesystemType enum value (Unknown if not recognized)
auto string_to_filesystem_type(std::string_view fs_name) noexcept -> FilesystemType;

/// @brief Get default mount options for a filesystem type based on device type
/// @param fs_type The filesystem type
/// @param is_ssd Whether the target device is an SSD
/// @return Ordered list of default mount options
auto get_default_mount_opts(FilesystemType fs_type, bool is_ssd) noexcept -> std::vector<std::string>;

/// @brief Get the mkfs invocation for a filesystem type, without the target device
/// @param fs_type The filesystem type
/// @return argv prefix (e.g. {"mkfs.btrfs", "-f"}), std::nullopt if the type cannot be formatted
auto get_mkfs_command(FilesystemType fs_type) noexcept -> std::optional<std::vector<std::string>>;

/// @brief Filesystem name understood by mount(8) -t
auto get_mount_fs_name(FilesystemType fs_type) noexcept -> std::string_view;

/// @brief Convert internal filesystem name to fstab-compatible name
/// @param fs_type The filesystem type
/// @return The fstab-compatible filesystem name
auto get_fstab_fs_name(FilesystemType fs_type) noexcept -> std::string_view;

auto partition_table_to_string(PartitionTable table) noexcept -> std::string_view;
/// @brief Accepts "gpt", "msdos" and lsblk's "dos"
auto string_to_partition_table(std::string_view table_name) noexcept -> std::optional<PartitionTable>;

auto partition_flag_to_string(PartitionFlag flag) noexcept -> std::string_view;
auto string_to_partition_flag(std::string_view flag_name) noexcept -> std::optional<PartitionFlag>;

/// @brief Flags implied by a partition type.
/// @param part_type GPT type GUID or MBR type code (e.g. "0xef") as reported by lsblk
/// @param part_flags Raw partition attribute flags (MBR "0x80" marks bootable)
auto flags_from_partition_type(std::string_view part_type, std::string_view part_flags) noexcept -> std::vector<PartitionFlag>;

/// @brief sfdisk type for a new partition.
/// @return GPT type GUID for Gpt, hex type code for Mbr
auto get_sfdisk_partition_type(PartitionTable table, FilesystemType fs_type, const std::vector<PartitionFlag>& flags) noexcept -> std::string_view;

}  // namespace strata::fs

#endif  // PARTITION_CONFIG_HPP
