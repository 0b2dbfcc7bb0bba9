#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/disk_layout.hpp"

#include <string>   // for string
#include <utility>  // for move
#include <vector>   // for vector

using namespace strata::disk;
using strata::crypto::DiskEncryption;
using strata::crypto::EncryptionType;
using strata::fs::FilesystemType;
using strata::fs::PartitionFlag;

namespace {

auto make_partition(PartitionSpec spec) -> PartitionModification {
    auto part = PartitionModification::create(std::move(spec));
    REQUIRE(part.has_value());
    return std::move(*part);
}

auto make_device(std::vector<PartitionModification> partitions, bool wipe = true) -> DeviceModification {
    DeviceModification device{strata::test::blank_device("/dev/sda", Size(64, Unit::GiB)), wipe};
    for (auto& part : partitions) {
        device.add_partition(std::move(part));
    }
    return device;
}

auto make_lvm(std::string pv_id, std::string root_id = "lv-root") -> strata::lvm::LvmConfiguration {
    auto root = strata::lvm::LvmVolume::create({.name = "root", .fs_type = FilesystemType::Ext4, .length = Size(20, Unit::GiB), .mountpoint = "/", .obj_id = std::move(root_id)});
    REQUIRE(root.has_value());
    auto group = strata::lvm::LvmVolumeGroup::create("vg0", {std::move(pv_id)}, {std::move(*root)});
    REQUIRE(group.has_value());
    auto config = strata::lvm::LvmConfiguration::create({std::move(*group)});
    REQUIRE(config.has_value());
    return std::move(*config);
}

}  // namespace

TEST_CASE("disk layout test")
{
    strata::test::install_null_logger();

    SECTION("a valid layout")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({
            make_partition({.start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .fs_type = FilesystemType::Fat32, .mountpoint = "/boot", .flags = {PartitionFlag::Boot, PartitionFlag::Esp}}),
            make_partition({.start = Size(1025, Unit::MiB), .length = Size(30, Unit::GiB), .fs_type = FilesystemType::Ext4, .mountpoint = "/"}),
        }));
        const auto layout = DiskLayoutConfiguration::create(LayoutType::Default, std::move(devices));
        REQUIRE(layout.has_value());
        REQUIRE_EQ(layout->type(), LayoutType::Default);
        REQUIRE_EQ(layout->device_modifications().size(), 1);
        REQUIRE_FALSE(layout->lvm_config().has_value());
    }
    SECTION("duplicate object ids")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({
            make_partition({.start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .obj_id = "same"}),
            make_partition({.start = Size(2, Unit::GiB), .length = Size(1, Unit::GiB), .obj_id = "same"}),
        }));
        const auto layout = DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices));
        REQUIRE_FALSE(layout.has_value());
        REQUIRE_EQ(layout.error().kind, strata::ErrorKind::InvalidState);
        REQUIRE_EQ(layout.error().device, "same");
    }
    SECTION("overlapping partitions")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({
            make_partition({.start = Size(1, Unit::MiB), .length = Size(2, Unit::GiB)}),
            make_partition({.start = Size(1, Unit::GiB), .length = Size(1, Unit::GiB)}),
        }));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices)).has_value());
    }
    SECTION("geometry of partitions to create")
    {
        std::vector<DeviceModification> early{};
        early.emplace_back(make_device({make_partition({.start = Size(34, Unit::sectors), .length = Size(1, Unit::GiB)})}));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(early)).has_value());

        std::vector<DeviceModification> unaligned{};
        unaligned.emplace_back(make_device({make_partition({.start = Size(1, Unit::MiB), .length = Size(1000, Unit::kB)})}));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(unaligned)).has_value());

        // the backup GPT header takes the last 33 sectors
        std::vector<DeviceModification> too_long{};
        too_long.emplace_back(make_device({make_partition({.start = Size(1, Unit::MiB), .length = Size(64, Unit::GiB) - Size(1, Unit::MiB)})}));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(too_long)).has_value());

        std::vector<DeviceModification> fits{};
        fits.emplace_back(make_device({make_partition({.start = Size(1, Unit::MiB), .length = Size(64, Unit::GiB) - Size(2, Unit::MiB)})}));
        REQUIRE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(fits)).has_value());
    }
    SECTION("wiped devices cannot keep partitions")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({
            make_partition({.status = ModificationStatus::Exist, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .dev_path = "/dev/sda1"}),
        }));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices)).has_value());
    }
    SECTION("untouched partitions still occupy space")
    {
        auto info = strata::test::blank_device("/dev/sda", Size(64, Unit::GiB));
        info.partitions.push_back(PartitionInfo{.path = "/dev/sda1", .device_path = "/dev/sda", .partn = 1, .start = Size(1, Unit::MiB), .length = Size(10, Unit::GiB)});
        DeviceModification device{info, false};
        device.add_partition(make_partition({.start = Size(5, Unit::GiB), .length = Size(10, Unit::GiB)}));

        std::vector<DeviceModification> devices{};
        devices.emplace_back(std::move(device));
        const auto layout = DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices));
        REQUIRE_FALSE(layout.has_value());
    }
    SECTION("pre-mounted layouts need a base")
    {
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::PreMounted, {}).has_value());
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::PreMounted, {}, std::nullopt, "mnt").has_value());
        const auto layout = DiskLayoutConfiguration::create(LayoutType::PreMounted, {}, std::nullopt, "/mnt");
        REQUIRE(layout.has_value());
        REQUIRE_EQ(layout->mountpoint(), "/mnt");
    }
    SECTION("physical volumes must exist")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({make_partition({.start = Size(1, Unit::MiB), .length = Size(60, Unit::GiB), .obj_id = "pv"})}));
        auto layout = DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices));
        REQUIRE(layout.has_value());

        const auto res = layout->set_lvm_config(make_lvm("missing"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().device, "missing");

        REQUIRE(layout->set_lvm_config(make_lvm("pv")).has_value());
        REQUIRE(layout->find_volume("lv-root") != nullptr);
        REQUIRE(layout->find_device_of("pv") != nullptr);
        REQUIRE(layout->find_device_of("lv-root") == nullptr);
    }
    SECTION("kept partitions only back existing volume groups")
    {
        auto info = strata::test::blank_device("/dev/sda", Size(64, Unit::GiB), 512, strata::fs::PartitionTable::Gpt);
        info.partitions.push_back(PartitionInfo{.path = "/dev/sda1", .device_path = "/dev/sda", .partn = 1, .start = Size(1, Unit::MiB), .length = Size(20, Unit::GiB)});
        DeviceModification device{info, false};
        device.add_partition(make_partition({.status = ModificationStatus::Exist, .start = Size(1, Unit::MiB), .length = Size(20, Unit::GiB), .fs_type = FilesystemType::Ext4, .dev_path = "/dev/sda1", .obj_id = "kept"}));
        std::vector<DeviceModification> devices{};
        devices.emplace_back(std::move(device));
        auto layout = DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices));
        REQUIRE(layout.has_value());

        // a new root volume would run pvcreate over the kept partition
        const auto res = layout->set_lvm_config(make_lvm("kept"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().kind, strata::ErrorKind::InvalidState);
        REQUIRE_EQ(res.error().device, "/dev/sda1");
        REQUIRE_FALSE(layout->lvm_config().has_value());

        auto data = strata::lvm::LvmVolume::create({.status = ModificationStatus::Exist, .name = "data", .length = Size(10, Unit::GiB), .obj_id = "lv-data"});
        REQUIRE(data.has_value());
        auto group = strata::lvm::LvmVolumeGroup::create("vg0", {"kept"}, {std::move(*data)});
        REQUIRE(group.has_value());
        auto existing = strata::lvm::LvmConfiguration::create({std::move(*group)});
        REQUIRE(existing.has_value());
        REQUIRE(layout->set_lvm_config(std::move(*existing)).has_value());
    }
    SECTION("object ids are unique across partitions and volumes")
    {
        std::vector<DeviceModification> devices{};
        devices.emplace_back(make_device({make_partition({.start = Size(1, Unit::MiB), .length = Size(60, Unit::GiB), .obj_id = "pv"})}));
        REQUIRE_FALSE(DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices), make_lvm("pv", "pv")).has_value());
    }
    SECTION("layout type names")
    {
        REQUIRE_EQ(layout_type_to_string(LayoutType::PreMounted), "pre_mounted_config");
        REQUIRE_EQ(string_to_layout_type("default_layout"), LayoutType::Default);
        REQUIRE_FALSE(string_to_layout_type("manual").has_value());
    }
}

TEST_CASE("encryption target test")
{
    strata::test::install_null_logger();

    std::vector<DeviceModification> devices{};
    auto info = strata::test::blank_device("/dev/sda", Size(64, Unit::GiB), 512, strata::fs::PartitionTable::Gpt);
    info.partitions.push_back(PartitionInfo{.path = "/dev/sda1", .device_path = "/dev/sda", .partn = 1, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB)});
    DeviceModification device{info, false};
    device.add_partition(make_partition({.status = ModificationStatus::Exist, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .dev_path = "/dev/sda1", .obj_id = "kept"}));
    device.add_partition(make_partition({.start = Size(1025, Unit::MiB), .length = Size(20, Unit::GiB), .fs_type = FilesystemType::Ext4, .mountpoint = "/", .obj_id = "root"}));
    device.add_partition(make_partition({.start = Size(22, Unit::GiB), .length = Size(20, Unit::GiB), .obj_id = "pv"}));
    devices.emplace_back(std::move(device));

    auto layout = DiskLayoutConfiguration::create(LayoutType::Manual, std::move(devices), make_lvm("pv"));
    REQUIRE(layout.has_value());

    SECTION("plain LUKS on a new partition")
    {
        const auto encryption = DiskEncryption::create(EncryptionType::Luks, "secret", {"root"}, {});
        REQUIRE(encryption.has_value());
        REQUIRE(layout->validate_encryption(*encryption).has_value());
    }
    SECTION("kept partitions cannot be encrypted")
    {
        const auto encryption = DiskEncryption::create(EncryptionType::Luks, "secret", {"kept"}, {});
        REQUIRE(encryption.has_value());
        const auto res = layout->validate_encryption(*encryption);
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().device, "/dev/sda1");
    }
    SECTION("unknown targets")
    {
        const auto encryption = DiskEncryption::create(EncryptionType::Luks, "secret", {"nope"}, {});
        REQUIRE(encryption.has_value());
        REQUIRE_FALSE(layout->validate_encryption(*encryption).has_value());
    }
    SECTION("physical volumes go through lvm_on_luks")
    {
        const auto plain = DiskEncryption::create(EncryptionType::Luks, "secret", {"pv"}, {});
        REQUIRE(plain.has_value());
        REQUIRE_FALSE(layout->validate_encryption(*plain).has_value());

        const auto lvm_on_luks = DiskEncryption::create(EncryptionType::LvmOnLuks, "secret", {"pv"}, {});
        REQUIRE(lvm_on_luks.has_value());
        REQUIRE(layout->validate_encryption(*lvm_on_luks).has_value());

        const auto not_pv = DiskEncryption::create(EncryptionType::LvmOnLuks, "secret", {"root"}, {});
        REQUIRE(not_pv.has_value());
        REQUIRE_FALSE(layout->validate_encryption(*not_pv).has_value());
    }
    SECTION("logical volumes go through luks_on_lvm")
    {
        const auto encryption = DiskEncryption::create(EncryptionType::LuksOnLvm, "secret", {}, {"lv-root"});
        REQUIRE(encryption.has_value());
        REQUIRE(layout->validate_encryption(*encryption).has_value());

        const auto unknown = DiskEncryption::create(EncryptionType::LuksOnLvm, "secret", {}, {"lv-home"});
        REQUIRE(unknown.has_value());
        REQUIRE_FALSE(layout->validate_encryption(*unknown).has_value());
    }
}

TEST_CASE("pre-mounted discovery test")
{
    strata::test::install_null_logger();

    auto disk = strata::test::blank_device("/dev/nvme0n1", Size(256, Unit::GiB));
    disk.partitions = {
        PartitionInfo{.path = "/dev/nvme0n1p1", .partn = 1, .fs_type = FilesystemType::Fat32, .start = Size(1, Unit::MiB), .length = Size(1, Unit::GiB), .mountpoints = {"/mnt/boot"}},
        PartitionInfo{
            .path          = "/dev/nvme0n1p2",
            .partn         = 2,
            .fs_type       = FilesystemType::Btrfs,
            .start         = Size(1025, Unit::MiB),
            .length        = Size(200, Unit::GiB),
            .mountpoints   = {"/mnt", "/mnt/home"},
            .btrfs_subvols = {{.name = "/@", .mountpoint = "/mnt"}, {.name = "/@home", .mountpoint = "/mnt/home"}},
        },
        PartitionInfo{.path = "/dev/nvme0n1p3", .partn = 3, .fs_type = FilesystemType::Ext4, .start = Size(201, Unit::GiB), .length = Size(10, Unit::GiB), .mountpoints = {"/srv"}},
    };
    auto other = strata::test::blank_device("/dev/sdb", Size(8, Unit::GiB));

    SECTION("partitions below the base are picked up")
    {
        const auto devices = pre_mounted_modifications({disk, other}, "/mnt/");
        REQUIRE(devices.has_value());
        REQUIRE_EQ(devices->size(), 1);

        const auto& parts = (*devices)[0].partitions();
        REQUIRE_EQ(parts.size(), 2);
        REQUIRE_EQ(parts[0].mountpoint(), "/boot");
        REQUIRE_EQ(parts[0].status(), ModificationStatus::Exist);
        REQUIRE_FALSE(parts[1].mountpoint().has_value());
        REQUIRE_EQ(parts[1].btrfs_subvols(), std::vector<SubvolumeModification>{{.name = "@", .mountpoint = "/"}, {.name = "@home", .mountpoint = "/home"}});
        REQUIRE(parts[1].is_root());
    }
    SECTION("the layout accepts them as they are")
    {
        auto devices = pre_mounted_modifications({disk}, "/mnt");
        REQUIRE(devices.has_value());
        const auto layout = DiskLayoutConfiguration::create(LayoutType::PreMounted, std::move(*devices), std::nullopt, "/mnt");
        REQUIRE(layout.has_value());
    }
}
