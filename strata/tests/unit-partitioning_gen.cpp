#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/partition_config.hpp"
#include "strata/partitioning.hpp"

#include <string>  // for string
#include <vector>  // for vector

using namespace strata::disk;
using strata::fs::FilesystemType;
using strata::fs::PartitionFlag;
using strata::fs::PartitionTable;

TEST_CASE("partitioning gen test")
{
    strata::test::install_null_logger();

    auto esp = PartitionModification::create(PartitionSpec{
        .type = PartitionType::Boot, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .fs_type = FilesystemType::Fat32, .mountpoint = "/boot", .flags = {PartitionFlag::Boot, PartitionFlag::Esp}});
    REQUIRE(esp.has_value());
    auto root = PartitionModification::create(PartitionSpec{.start = Size(1025, Unit::MiB), .length = Size(20, Unit::GiB), .fs_type = FilesystemType::Btrfs, .mountpoint = "/"});
    REQUIRE(root.has_value());

    SECTION("gpt esp")
    {
        REQUIRE_EQ(gen_sfdisk_line(*esp, PartitionTable::Gpt, SectorSize{512}), "start=2048, size=2097152, type=C12A7328-F81F-11D2-BA4B-00A0C93EC93B\n");
    }
    SECTION("mbr bootable")
    {
        REQUIRE_EQ(gen_sfdisk_line(*esp, PartitionTable::Mbr, SectorSize{512}), "start=2048, size=2097152, type=ef, bootable\n");
        REQUIRE_EQ(gen_sfdisk_line(*root, PartitionTable::Mbr, SectorSize{512}), "start=2099200, size=41943040, type=83\n");
    }
    SECTION("mbr bios boot partition")
    {
        auto fat_boot = PartitionModification::create(PartitionSpec{
            .type = PartitionType::Boot, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .fs_type = FilesystemType::Fat32, .mountpoint = "/boot", .flags = {PartitionFlag::Boot}});
        REQUIRE(fat_boot.has_value());
        REQUIRE_EQ(gen_sfdisk_line(*fat_boot, PartitionTable::Mbr, SectorSize{512}), "start=2048, size=2097152, type=0c, bootable\n");

        auto ext4_boot = PartitionModification::create(PartitionSpec{
            .type = PartitionType::Boot, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .fs_type = FilesystemType::Ext4, .mountpoint = "/boot", .flags = {PartitionFlag::Boot}});
        REQUIRE(ext4_boot.has_value());
        REQUIRE_EQ(gen_sfdisk_line(*ext4_boot, PartitionTable::Mbr, SectorSize{512}), "start=2048, size=2097152, type=83, bootable\n");

        // the same partition on a UEFI layout is an ESP
        REQUIRE_EQ(strata::fs::get_sfdisk_partition_type(PartitionTable::Gpt, FilesystemType::Fat32, {PartitionFlag::Boot}), "C12A7328-F81F-11D2-BA4B-00A0C93EC93B");
    }
    SECTION("4k sectors")
    {
        REQUIRE_EQ(gen_sfdisk_line(*root, PartitionTable::Gpt, SectorSize{4096}), "start=262400, size=5242880, type=0FC63DAF-8483-4772-8E79-3D69D8477DE4\n");
    }
    SECTION("swap and home types")
    {
        auto swap = PartitionModification::create(PartitionSpec{.start = Size(1, Unit::MiB), .length = Size(4, Unit::GiB), .fs_type = FilesystemType::LinuxSwap});
        REQUIRE(swap.has_value());
        REQUIRE_EQ(gen_sfdisk_line(*swap, PartitionTable::Gpt, SectorSize{512}), "start=2048, size=8388608, type=0657FD6D-A4AB-43C4-84E5-0933C84B4F4F\n");
        REQUIRE_EQ(strata::fs::get_sfdisk_partition_type(PartitionTable::Gpt, FilesystemType::Ext4, {PartitionFlag::LinuxHome}), "933AC7E1-2EB4-4F13-B844-0E14E2AEF915");
        REQUIRE_EQ(strata::fs::get_sfdisk_partition_type(PartitionTable::Gpt, FilesystemType::Fat32, {PartitionFlag::Xbootldr}), "BC13C2FF-59E6-4262-A352-B275FD6F7172");
        REQUIRE_EQ(strata::fs::get_sfdisk_partition_type(PartitionTable::Mbr, FilesystemType::LinuxSwap, {}), "82");
    }
    SECTION("table commands")
    {
        REQUIRE_EQ(gen_wipe_command("/dev/sda"), std::vector<std::string>{"wipefs", "--all", "/dev/sda"});
        REQUIRE_EQ(gen_mklabel_command("/dev/sda", PartitionTable::Gpt), std::vector<std::string>{"parted", "--script", "/dev/sda", "mklabel", "gpt"});
        REQUIRE_EQ(gen_mklabel_command("/dev/sda", PartitionTable::Mbr), std::vector<std::string>{"parted", "--script", "/dev/sda", "mklabel", "msdos"});
        REQUIRE_EQ(gen_sfdisk_append_command("/dev/nvme0n1"), std::vector<std::string>{"sfdisk", "--append", "--no-reread", "/dev/nvme0n1"});
        REQUIRE_EQ(gen_sfdisk_delete_command("/dev/sda", 3), std::vector<std::string>{"sfdisk", "--no-reread", "--delete", "/dev/sda", "3"});

        const auto reread = gen_reread_commands("/dev/sda");
        REQUIRE_EQ(reread.size(), 2);
        REQUIRE_EQ(reread[1], std::vector<std::string>{"partprobe", "/dev/sda"});
    }
}

TEST_CASE("partition config test")
{
    strata::test::install_null_logger();

    using namespace strata::fs;

    SECTION("filesystem names")
    {
        REQUIRE_EQ(filesystem_type_to_string(FilesystemType::LinuxSwap), "linux-swap");
        REQUIRE_EQ(string_to_filesystem_type("vfat"), FilesystemType::Fat32);
        REQUIRE_EQ(string_to_filesystem_type("swap"), FilesystemType::LinuxSwap);
        REQUIRE_EQ(string_to_filesystem_type("zfs"), FilesystemType::Unknown);
        REQUIRE_EQ(get_mount_fs_name(FilesystemType::Fat32), "vfat");
        REQUIRE_EQ(get_mount_fs_name(FilesystemType::Ntfs), "ntfs3");
        REQUIRE_EQ(get_fstab_fs_name(FilesystemType::Unknown), "auto");
    }
    SECTION("mkfs commands")
    {
        REQUIRE_EQ(get_mkfs_command(FilesystemType::Fat32), std::vector<std::string>{"mkfs.fat", "-F", "32"});
        REQUIRE_EQ(get_mkfs_command(FilesystemType::Btrfs), std::vector<std::string>{"mkfs.btrfs", "-f"});
        REQUIRE_EQ(get_mkfs_command(FilesystemType::LinuxSwap), std::vector<std::string>{"mkswap"});
        REQUIRE_FALSE(get_mkfs_command(FilesystemType::CryptoLuks).has_value());
        REQUIRE_FALSE(get_mkfs_command(FilesystemType::Unknown).has_value());
    }
    SECTION("default mount options")
    {
        REQUIRE_EQ(get_default_mount_opts(FilesystemType::Btrfs, true), std::vector<std::string>{"noatime", "compress=zstd:1"});
        REQUIRE_EQ(get_default_mount_opts(FilesystemType::Ext4, false), std::vector<std::string>{"noatime"});
        REQUIRE(get_default_mount_opts(FilesystemType::LinuxSwap, true).empty());
    }
    SECTION("tables and flags")
    {
        REQUIRE_EQ(string_to_partition_table("dos"), PartitionTable::Mbr);
        REQUIRE_EQ(partition_table_to_string(PartitionTable::Mbr), "msdos");
        REQUIRE_FALSE(string_to_partition_table("apm").has_value());
        REQUIRE_EQ(partition_flag_to_string(PartitionFlag::Xbootldr), "bls_boot");
        REQUIRE_EQ(string_to_partition_flag("linux-home"), PartitionFlag::LinuxHome);
    }
    SECTION("flags from partition types")
    {
        REQUIRE_EQ(flags_from_partition_type("c12a7328-f81f-11d2-ba4b-00a0c93ec93b", ""), std::vector<PartitionFlag>{PartitionFlag::Boot, PartitionFlag::Esp});
        REQUIRE_EQ(flags_from_partition_type("0x82", ""), std::vector<PartitionFlag>{PartitionFlag::Swap});
        REQUIRE_EQ(flags_from_partition_type("0x83", "0x80"), std::vector<PartitionFlag>{PartitionFlag::Boot});
        REQUIRE_EQ(flags_from_partition_type("0xef", "0x80"), std::vector<PartitionFlag>{PartitionFlag::Boot, PartitionFlag::Esp});
        REQUIRE(flags_from_partition_type("0fc63daf-8483-4772-8e79-3d69d8477de4", "").empty());
    }
}
