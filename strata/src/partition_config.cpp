#include "strata/partition_config.hpp"

#include <algorithm>  // for equal, find
#include <cctype>     // for tolower

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace {

// https://uapi-group.org/specifications/specs/discoverable_partitions_specification/
constexpr auto GPT_ESP_GUID       = "C12A7328-F81F-11D2-BA4B-00A0C93EC93B"sv;
constexpr auto GPT_XBOOTLDR_GUID  = "BC13C2FF-59E6-4262-A352-B275FD6F7172"sv;
constexpr auto GPT_HOME_GUID      = "933AC7E1-2EB4-4F13-B844-0E14E2AEF915"sv;
constexpr auto GPT_SWAP_GUID      = "0657FD6D-A4AB-43C4-84E5-0933C84B4F4F"sv;
constexpr auto GPT_LINUX_FS_GUID  = "0FC63DAF-8483-4772-8E79-3D69D8477DE4"sv;

constexpr auto MBR_ESP_CODE   = "ef"sv;
constexpr auto MBR_FAT32_CODE = "0c"sv;
constexpr auto MBR_SWAP_CODE  = "82"sv;
constexpr auto MBR_LINUX_CODE = "83"sv;

auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
    return std::ranges::equal(lhs, rhs, [](char lch, char rch) {
        return std::tolower(static_cast<unsigned char>(lch)) == std::tolower(static_cast<unsigned char>(rch));
    });
}

constexpr auto strip_hex_prefix(std::string_view value) noexcept -> std::string_view {
    if (value.starts_with("0x"sv) || value.starts_with("0X"sv)) {
        value.remove_prefix(2);
    }
    return value;
}

}  // namespace

namespace strata::fs {

auto filesystem_type_to_string(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Btrfs:
        return "btrfs"sv;
    case FilesystemType::Ext2:
        return "ext2"sv;
    case FilesystemType::Ext3:
        return "ext3"sv;
    case FilesystemType::Ext4:
        return "ext4"sv;
    case FilesystemType::F2fs:
        return "f2fs"sv;
    case FilesystemType::Fat12:
        return "fat12"sv;
    case FilesystemType::Fat16:
        return "fat16"sv;
    case FilesystemType::Fat32:
        return "fat32"sv;
    case FilesystemType::Ntfs:
        return "ntfs"sv;
    case FilesystemType::Xfs:
        return "xfs"sv;
    case FilesystemType::LinuxSwap:
        return "linux-swap"sv;
    case FilesystemType::CryptoLuks:
        return "crypto_LUKS"sv;
    case FilesystemType::Unknown:
    default:
        return "unknown"sv;
    }
}

auto string_to_filesystem_type(std::string_view fs_name) noexcept -> FilesystemType {
    if (fs_name == "btrfs"sv) {
        return FilesystemType::Btrfs;
    } else if (fs_name == "ext2"sv) {
        return FilesystemType::Ext2;
    } else if (fs_name == "ext3"sv) {
        return FilesystemType::Ext3;
    } else if (fs_name == "ext4"sv) {
        return FilesystemType::Ext4;
    } else if (fs_name == "f2fs"sv) {
        return FilesystemType::F2fs;
    } else if (fs_name == "fat12"sv) {
        return FilesystemType::Fat12;
    } else if (fs_name == "fat16"sv) {
        return FilesystemType::Fat16;
    } else if (fs_name == "fat32"sv || fs_name == "vfat"sv) {
        // lsblk does not tell the FAT variants apart
        return FilesystemType::Fat32;
    } else if (fs_name == "ntfs"sv || fs_name == "ntfs3"sv) {
        return FilesystemType::Ntfs;
    } else if (fs_name == "xfs"sv) {
        return FilesystemType::Xfs;
    } else if (fs_name == "linux-swap"sv || fs_name == "swap"sv) {
        return FilesystemType::LinuxSwap;
    } else if (fs_name == "crypto_LUKS"sv) {
        return FilesystemType::CryptoLuks;
    }
    return FilesystemType::Unknown;
}

auto get_default_mount_opts(FilesystemType fs_type, bool is_ssd) noexcept -> std::vector<std::string> {
    switch (fs_type) {
    case FilesystemType::Btrfs:
        if (is_ssd) {
            return {"noatime"s, "compress=zstd:1"s};
        }
        return {"noatime"s, "compress=zstd"s};
    case FilesystemType::Ext2:
    case FilesystemType::Ext3:
    case FilesystemType::Ext4:
        return {"noatime"s};
    case FilesystemType::F2fs:
        return {"compress_algorithm=lz4"s, "compress_chksum"s, "gc_merge"s, "lazytime"s};
    case FilesystemType::Xfs:
        return {"lazytime"s, "noatime"s, "inode64"s, "logbsize=256k"s, "noquota"s};
    case FilesystemType::Fat12:
    case FilesystemType::Fat16:
    case FilesystemType::Fat32:
        return {"umask=0077"s};
    case FilesystemType::Ntfs:
    case FilesystemType::LinuxSwap:
    case FilesystemType::CryptoLuks:
    case FilesystemType::Unknown:
    default:
        return {};
    }
}

auto get_mkfs_command(FilesystemType fs_type) noexcept -> std::optional<std::vector<std::string>> {
    switch (fs_type) {
    case FilesystemType::Btrfs:
        return std::vector{"mkfs.btrfs"s, "-f"s};
    case FilesystemType::Ext2:
        return std::vector{"mkfs.ext2"s, "-F"s};
    case FilesystemType::Ext3:
        return std::vector{"mkfs.ext3"s, "-F"s};
    case FilesystemType::Ext4:
        return std::vector{"mkfs.ext4"s, "-F"s};
    case FilesystemType::F2fs:
        return std::vector{"mkfs.f2fs"s, "-f"s};
    case FilesystemType::Fat12:
        return std::vector{"mkfs.fat"s, "-F"s, "12"s};
    case FilesystemType::Fat16:
        return std::vector{"mkfs.fat"s, "-F"s, "16"s};
    case FilesystemType::Fat32:
        return std::vector{"mkfs.fat"s, "-F"s, "32"s};
    case FilesystemType::Ntfs:
        return std::vector{"mkfs.ntfs"s, "--fast"s};
    case FilesystemType::Xfs:
        return std::vector{"mkfs.xfs"s, "-f"s};
    case FilesystemType::LinuxSwap:
        return std::vector{"mkswap"s};
    case FilesystemType::CryptoLuks:
    case FilesystemType::Unknown:
    default:
        // crypto_LUKS is produced by cryptsetup, never by mkfs
        return std::nullopt;
    }
}

auto get_mount_fs_name(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Fat12:
    case FilesystemType::Fat16:
    case FilesystemType::Fat32:
        return "vfat"sv;
    case FilesystemType::Ntfs:
        return "ntfs3"sv;
    case FilesystemType::LinuxSwap:
        return "swap"sv;
    default:
        return filesystem_type_to_string(fs_type);
    }
}

auto get_fstab_fs_name(FilesystemType fs_type) noexcept -> std::string_view {
    if (fs_type == FilesystemType::Unknown || fs_type == FilesystemType::CryptoLuks) {
        return "auto"sv;
    }
    return get_mount_fs_name(fs_type);
}

auto partition_table_to_string(PartitionTable table) noexcept -> std::string_view {
    return table == PartitionTable::Gpt ? "gpt"sv : "msdos"sv;
}

auto string_to_partition_table(std::string_view table_name) noexcept -> std::optional<PartitionTable> {
    if (table_name == "gpt"sv) {
        return PartitionTable::Gpt;
    } else if (table_name == "msdos"sv || table_name == "dos"sv || table_name == "mbr"sv) {
        return PartitionTable::Mbr;
    }
    return std::nullopt;
}

auto partition_flag_to_string(PartitionFlag flag) noexcept -> std::string_view {
    switch (flag) {
    case PartitionFlag::Boot:
        return "boot"sv;
    case PartitionFlag::Xbootldr:
        return "bls_boot"sv;
    case PartitionFlag::Esp:
        return "esp"sv;
    case PartitionFlag::LinuxHome:
        return "linux-home"sv;
    case PartitionFlag::Swap:
        return "swap"sv;
    }
    return "unknown"sv;
}

auto string_to_partition_flag(std::string_view flag_name) noexcept -> std::optional<PartitionFlag> {
    if (flag_name == "boot"sv) {
        return PartitionFlag::Boot;
    } else if (flag_name == "bls_boot"sv) {
        return PartitionFlag::Xbootldr;
    } else if (flag_name == "esp"sv) {
        return PartitionFlag::Esp;
    } else if (flag_name == "linux-home"sv) {
        return PartitionFlag::LinuxHome;
    } else if (flag_name == "swap"sv) {
        return PartitionFlag::Swap;
    }
    return std::nullopt;
}

auto flags_from_partition_type(std::string_view part_type, std::string_view part_flags) noexcept -> std::vector<PartitionFlag> {
    std::vector<PartitionFlag> flags{};
    if (iequals(part_type, GPT_ESP_GUID)) {
        flags = {PartitionFlag::Boot, PartitionFlag::Esp};
    } else if (iequals(part_type, GPT_XBOOTLDR_GUID)) {
        flags = {PartitionFlag::Xbootldr};
    } else if (iequals(part_type, GPT_HOME_GUID)) {
        flags = {PartitionFlag::LinuxHome};
    } else if (iequals(part_type, GPT_SWAP_GUID)) {
        flags = {PartitionFlag::Swap};
    } else if (iequals(strip_hex_prefix(part_type), MBR_ESP_CODE)) {
        flags = {PartitionFlag::Esp};
    } else if (iequals(strip_hex_prefix(part_type), MBR_SWAP_CODE)) {
        flags = {PartitionFlag::Swap};
    }

    // MBR active flag
    if (iequals(part_flags, "0x80"sv) && std::ranges::find(flags, PartitionFlag::Boot) == flags.end()) {
        flags.insert(flags.begin(), PartitionFlag::Boot);
    }
    return flags;
}

auto get_sfdisk_partition_type(PartitionTable table, FilesystemType fs_type, const std::vector<PartitionFlag>& flags) noexcept -> std::string_view {
    const auto has_flag = [&flags](PartitionFlag flag) { return std::ranges::find(flags, flag) != flags.end(); };
    const bool is_gpt   = table == PartitionTable::Gpt;

    if (has_flag(PartitionFlag::Xbootldr) && is_gpt) {
        return GPT_XBOOTLDR_GUID;
    }
    if (has_flag(PartitionFlag::Esp)) {
        return is_gpt ? GPT_ESP_GUID : MBR_ESP_CODE;
    }
    if (is_gpt && has_flag(PartitionFlag::Boot) && fs_type == FilesystemType::Fat32) {
        return GPT_ESP_GUID;
    }
    if (has_flag(PartitionFlag::Swap) || fs_type == FilesystemType::LinuxSwap) {
        return is_gpt ? GPT_SWAP_GUID : MBR_SWAP_CODE;
    }
    if (has_flag(PartitionFlag::LinuxHome) && is_gpt) {
        return GPT_HOME_GUID;
    }
    // BIOS /boot on MBR, the active flag marks it
    if (!is_gpt && fs_type == FilesystemType::Fat32) {
        return MBR_FAT32_CODE;
    }
    return is_gpt ? GPT_LINUX_FS_GUID : MBR_LINUX_CODE;
}

}  // namespace strata::fs
