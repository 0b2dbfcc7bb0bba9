#include "strata/provisioner.hpp"
#include "strata/btrfs.hpp"
#include "strata/partitioning.hpp"
#include "strata/string_utils.hpp"

#include <algorithm>   // for sort, find_if, any_of
#include <filesystem>  // for create_directories, permissions
#include <set>         // for set
#include <utility>     // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

using strata::ErrorKind;
using strata::ProvisionStep;
using strata::make_error;

constexpr auto MAPPER_DIR = "/dev/mapper/"sv;

auto with_step(strata::Error error, ProvisionStep step) noexcept -> std::unexpected<strata::Error> {
    if (error.step == ProvisionStep::None) {
        error.step = step;
    }
    return std::unexpected(std::move(error));
}

auto round_up(std::uint64_t value, std::uint64_t granularity) noexcept -> std::uint64_t {
    if (granularity == 0) {
        return value;
    }
    return ((value + granularity - 1) / granularity) * granularity;
}

// LvmOnLuks: a PV unlocks the root filesystem when its group holds the root volume
auto pv_carries_root(const strata::disk::DiskLayoutConfiguration& layout, std::string_view pv_id) noexcept -> bool {
    const auto& lvm_config = layout.lvm_config();
    if (!lvm_config) {
        return false;
    }
    for (const auto& vol_group : lvm_config->vol_groups()) {
        if (std::ranges::find(vol_group.pvs(), pv_id) == vol_group.pvs().end()) {
            continue;
        }
        return std::ranges::any_of(vol_group.volumes(), [](auto&& volume) { return volume.is_root(); });
    }
    return false;
}

}  // namespace

namespace strata::provision {

auto Provisioner::refresh(ProvisionStep step) noexcept -> Result<void> {
    if (auto devices = m_inventory.list_devices(); !devices) {
        return with_step(std::move(devices.error()), step);
    }
    return {};
}

auto Provisioner::reread_partitions(std::string_view device, ProvisionStep step) noexcept -> Result<void> {
    // partprobe fails on a busy disk while the kernel already picked up the change,
    // the poll that follows decides. A tool that cannot be started is fatal.
    for (const auto& cmd : disk::gen_reread_commands(device)) {
        const auto& res = m_runner.run(cmd);
        if (res.exit_code < 0 || res.exit_code == 127) {
            return make_error(ErrorKind::CommandFailed, fmt::format(FMT_COMPILE("cannot run '{}'"), utils::format_command(cmd)), std::string{device}, step);
        }
        if (!res.success()) {
            spdlog::warn("'{}' exited with {}, relying on device polling", utils::format_command(cmd), res.exit_code);
        }
    }
    return {};
}

auto Provisioner::prepare_partition_table(disk::DeviceModification& device_mod) noexcept -> Result<void> {
    const auto& device_path = device_mod.device_path();
    const auto table        = device_mod.partition_table();

    if (auto res = refresh(ProvisionStep::PartitionTable); !res) {
        return res;
    }
    const auto live = m_inventory.get_device(device_path);
    if (!live) {
        return make_error(ErrorKind::ProbeError, "device is not present"s, device_path, ProvisionStep::PartitionTable);
    }

    if (device_mod.wipe()) {
        spdlog::info("Wiping {} and writing a new {} label", device_path, fs::partition_table_to_string(table));
        for (const auto& partition : live->partitions) {
            for (const auto& mountpoint : partition.mountpoints) {
                if (auto res = utils::run_checked(m_runner, mount::gen_umount_command(mountpoint), partition.path, ProvisionStep::PartitionTable); !res) {
                    return std::unexpected(res.error());
                }
            }
        }
        if (auto res = utils::run_checked(m_runner, disk::gen_wipe_command(device_path), device_path, ProvisionStep::PartitionTable); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = utils::run_checked(m_runner, disk::gen_mklabel_command(device_path, table), device_path, ProvisionStep::PartitionTable); !res) {
            return std::unexpected(res.error());
        }

        // every attempt asks the kernel to rescan before probing
        const auto relabeled = utils::poll_until(m_config.poll, fmt::format(FMT_COMPILE("label of {}"), device_path), [&]() -> std::optional<Result<void>> {
            if (auto res = reread_partitions(device_path, ProvisionStep::PartitionTable); !res) {
                return res;
            }
            if (!m_inventory.list_devices()) {
                return std::nullopt;
            }
            const auto device = m_inventory.get_device(device_path);
            if (!device || device->partition_table != table || !device->partitions.empty()) {
                return std::nullopt;
            }
            return Result<void>{};
        });
        if (relabeled && !*relabeled) {
            return std::unexpected(relabeled->error());
        }
        if (!relabeled) {
            return make_error(ErrorKind::PartitionTableMismatch,
                fmt::format(FMT_COMPILE("device does not report an empty {} table after wiping"), fs::partition_table_to_string(table)),
                device_path, ProvisionStep::PartitionTable);
        }
        return {};
    }

    if (live->partition_table != table) {
        const auto live_table = live->partition_table ? fs::partition_table_to_string(*live->partition_table) : "none"sv;
        return make_error(ErrorKind::PartitionTableMismatch,
            fmt::format(FMT_COMPILE("layout expects a {} table, device has {}"), fs::partition_table_to_string(table), live_table),
            device_path, ProvisionStep::PartitionTable);
    }

    bool deleted_any{false};
    for (const auto& part : device_mod.partitions()) {
        if (part.status() != disk::ModificationStatus::Delete) {
            continue;
        }
        auto partn = part.partn();
        if (!partn && part.dev_path()) {
            if (const auto info = m_inventory.find_partition(*part.dev_path()); info) {
                partn = info->partn;
            }
        }
        if (!partn) {
            return make_error(ErrorKind::ProbeError, "partition to delete has no partition number"s,
                part.dev_path().value_or(part.obj_id()), ProvisionStep::PartitionTable);
        }
        spdlog::info("Deleting partition {} of {}", *partn, device_path);
        if (auto res = utils::run_checked(m_runner, disk::gen_sfdisk_delete_command(device_path, *partn), device_path, ProvisionStep::PartitionTable); !res) {
            return std::unexpected(res.error());
        }
        deleted_any = true;
    }
    if (deleted_any) {
        return reread_partitions(device_path, ProvisionStep::PartitionTable);
    }
    return {};
}

auto Provisioner::create_partitions(disk::DeviceModification& device_mod) noexcept -> Result<void> {
    const auto& device_path = device_mod.device_path();

    std::vector<disk::PartitionModification*> to_create{};
    for (auto& part : device_mod.partitions()) {
        if (part.status() == disk::ModificationStatus::Create) {
            to_create.push_back(&part);
        }
    }
    std::ranges::sort(to_create, {}, [](auto* part) { return part->start().normalize(); });

    for (auto* part : to_create) {
        if (auto res = refresh(ProvisionStep::PartitionCreation); !res) {
            return res;
        }
        const auto live = m_inventory.get_device(device_path);
        if (!live) {
            return make_error(ErrorKind::ProbeError, "device is not present"s, device_path, ProvisionStep::PartitionCreation);
        }

        std::set<std::string> known_partuuids{};
        for (const auto& info : live->partitions) {
            known_partuuids.insert(info.partuuid);
        }

        const auto& script = disk::gen_sfdisk_line(*part, device_mod.partition_table(), live->sector_size);
        spdlog::info("Creating partition on {}: {}", device_path, script.substr(0, script.size() - 1));
        if (auto res = utils::run_checked(m_runner, disk::gen_sfdisk_append_command(device_path), device_path, ProvisionStep::PartitionCreation, script); !res) {
            return std::unexpected(res.error());
        }

        // the new partition is the one with an unseen PARTUUID at the requested offset
        const auto requested_start = part->start().normalize();
        const auto created         = utils::poll_until(m_config.poll, fmt::format(FMT_COMPILE("new partition on {}"), device_path),
                    [&]() -> std::optional<Result<disk::PartitionInfo>> {
                if (auto res = reread_partitions(device_path, ProvisionStep::PartitionCreation); !res) {
                    return std::unexpected(res.error());
                }
                if (!m_inventory.list_devices()) {
                    return std::nullopt;
                }
                const auto device = m_inventory.get_device(device_path);
                if (!device) {
                    return std::nullopt;
                }
                for (const auto& info : device->partitions) {
                    if (!info.partuuid.empty() && !known_partuuids.contains(info.partuuid) && info.start.normalize() == requested_start) {
                        return info;
                    }
                }
                return std::nullopt;
            });
        if (!created) {
            return make_error(ErrorKind::PartitionNeverAppeared,
                fmt::format(FMT_COMPILE("no partition appeared at offset {}"), requested_start),
                device_path, ProvisionStep::PartitionCreation);
        }
        if (!*created) {
            return std::unexpected(created->error());
        }

        const auto& info = **created;
        spdlog::info("Partition {} created (PARTUUID={})", info.path, info.partuuid);
        part->resolve(info.path, info.partuuid, info.partn);
    }
    return {};
}

auto Provisioner::realize_lvm(disk::DiskLayoutConfiguration& layout) noexcept -> Result<void> {
    auto& lvm_config = layout.lvm_config();
    if (!lvm_config) {
        return {};
    }

    for (auto& vol_group : lvm_config->vol_groups()) {
        const auto& vg_name = vol_group.name();
        auto& volumes       = vol_group.volumes();

        const bool needs_volumes = std::ranges::any_of(volumes, [](auto&& volume) { return volume.status() == disk::ModificationStatus::Create; });
        if (needs_volumes) {
            // a group on kept partitions already exists, new volumes go into it
            bool new_group{true};
            std::vector<std::string> pv_paths{};
            for (const auto& pv_id : vol_group.pvs()) {
                const auto* part = layout.find_partition(pv_id);
                if (part == nullptr) {
                    return make_error(ErrorKind::InvalidState, "physical volume names no partition of the layout"s, pv_id, ProvisionStep::Lvm);
                }
                if (part->status() != disk::ModificationStatus::Create) {
                    new_group = false;
                    continue;
                }
                if (auto it = m_mappers.find(pv_id); it != m_mappers.end()) {
                    pv_paths.push_back(it->second);
                    continue;
                }
                if (!part->dev_path()) {
                    return make_error(ErrorKind::InvalidState, "physical volume has no device path"s, pv_id, ProvisionStep::Lvm);
                }
                pv_paths.push_back(*part->dev_path());
            }
            if (!new_group && !pv_paths.empty()) {
                return make_error(ErrorKind::InvalidState, "volume group mixes kept and new physical volumes"s, vg_name, ProvisionStep::Lvm);
            }

            if (new_group) {
                spdlog::info("Creating volume group {} on {}", vg_name, utils::join(pv_paths, " "sv));
                if (auto res = utils::run_checked(m_runner, lvm::gen_pvcreate_command(pv_paths), vg_name, ProvisionStep::Lvm); !res) {
                    return std::unexpected(res.error());
                }
                if (auto res = utils::run_checked(m_runner, lvm::gen_vgcreate_command(vg_name, pv_paths), vg_name, ProvisionStep::Lvm); !res) {
                    return std::unexpected(res.error());
                }
            } else {
                spdlog::info("Adding volumes to existing volume group {}", vg_name);
            }

            const auto& report = utils::run_checked(m_runner, lvm::gen_vg_report_command(vg_name), vg_name, ProvisionStep::Lvm);
            if (!report) {
                return std::unexpected(report.error());
            }
            const auto vg_free = lvm::parse_vg_free_bytes(*report, vg_name);
            if (!vg_free) {
                return make_error(ErrorKind::ProbeError, "cannot read free space of volume group"s, vg_name, ProvisionStep::Lvm);
            }

            std::uint64_t requested{};
            lvm::LvmVolume* last_created{};
            for (auto& volume : volumes) {
                if (volume.status() == disk::ModificationStatus::Create) {
                    requested += volume.length().normalize();
                    last_created = &volume;
                }
            }
            // LVM metadata eats into the group, the last volume absorbs the difference
            if (requested > *vg_free) {
                const auto shrink_by  = round_up(requested - *vg_free, m_config.alignment_buffer.normalize());
                const auto old_length = last_created->length().normalize();
                if (old_length <= shrink_by) {
                    return make_error(ErrorKind::InvalidState,
                        fmt::format(FMT_COMPILE("volumes need {} but the group has {} free"), disk::Size::bytes(requested).format_highest(), disk::Size::bytes(*vg_free).format_highest()),
                        vg_name, ProvisionStep::Lvm);
                }
                spdlog::warn("Volume group {} is {} short, shrinking {} by {}", vg_name, disk::Size::bytes(requested - *vg_free).format_highest(),
                    last_created->name(), disk::Size::bytes(shrink_by).format_highest());
                last_created->set_length(disk::Size::bytes(old_length - shrink_by));
            }
        }

        for (auto& volume : volumes) {
            const auto& mapper_path = lvm::lvm_mapper_path(vg_name, volume.name());
            if (volume.status() != disk::ModificationStatus::Create) {
                if (volume.status() != disk::ModificationStatus::Delete) {
                    volume.set_dev_path(mapper_path);
                }
                continue;
            }

            spdlog::info("Creating logical volume {}/{} ({})", vg_name, volume.name(), volume.length().format_highest());
            if (auto res = utils::run_checked(m_runner, lvm::gen_lvcreate_command(vg_name, volume.name(), volume.length()), mapper_path, ProvisionStep::Lvm); !res) {
                return std::unexpected(res.error());
            }
            const auto appeared = utils::poll_until(m_config.poll, mapper_path, [&]() -> std::optional<bool> {
                if (!m_inventory.list_devices() || !m_inventory.find_node(mapper_path)) {
                    return std::nullopt;
                }
                return true;
            });
            if (!appeared) {
                return make_error(ErrorKind::PartitionNeverAppeared, "logical volume never appeared"s, mapper_path, ProvisionStep::Lvm);
            }
            volume.set_dev_path(mapper_path);
        }
    }
    return {};
}

auto Provisioner::encrypt_target(const std::string& obj_id, const std::string& device, const std::string& mapper_name, bool is_root,
    const crypto::DiskEncryption& encryption) noexcept -> Result<void> {
    const auto& password    = encryption.password();
    const auto& mapper_path = fmt::format(FMT_COMPILE("{}{}"), MAPPER_DIR, mapper_name);

    spdlog::info("Encrypting {} as {}", device, mapper_name);
    if (auto res = utils::run_checked(m_runner, crypto::gen_luks_format_command(device, encryption.iter_time()), device, ProvisionStep::Encryption, password); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = utils::run_checked(m_runner, crypto::gen_luks_open_command(device, mapper_name), device, ProvisionStep::Encryption, password); !res) {
        return std::unexpected(res.error());
    }

    const auto luks_uuid = utils::poll_until(m_config.poll, mapper_path, [&]() -> std::optional<std::string> {
        if (!m_inventory.list_devices() || !m_inventory.find_node(mapper_path)) {
            return std::nullopt;
        }
        const auto backing = m_inventory.find_node(device);
        if (!backing || backing->fstype != "crypto_LUKS"sv || backing->uuid.empty()) {
            return std::nullopt;
        }
        return backing->uuid;
    });
    if (!luks_uuid) {
        return make_error(ErrorKind::PartitionNeverAppeared, "unlocked mapper never appeared"s, mapper_path, ProvisionStep::Encryption);
    }

    crypto::CryptTarget target{
        .mapper_name = mapper_name,
        .device      = device,
        .luks_uuid   = *luks_uuid,
        .is_root     = is_root,
    };

    // the root volume is unlocked by the initramfs prompt, everything else by keyfile
    if (!is_root) {
        std::error_code err{};
        ::fs::create_directories(m_config.keyfile_dir, err);
        if (!err) {
            ::fs::permissions(m_config.keyfile_dir, ::fs::perms::owner_all, ::fs::perm_options::replace, err);
        }
        if (err) {
            return make_error(ErrorKind::CommandFailed, fmt::format(FMT_COMPILE("cannot prepare {}: {}"), m_config.keyfile_dir, err.message()), device, ProvisionStep::Encryption);
        }

        auto keyfile = crypto::keyfile_path(m_config.keyfile_dir, mapper_name);
        if (auto res = utils::run_checked(m_runner, crypto::gen_keyfile_command(keyfile), device, ProvisionStep::Encryption); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = utils::run_checked(m_runner, {"chmod"s, "600"s, keyfile}, device, ProvisionStep::Encryption); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = utils::run_checked(m_runner, crypto::gen_luks_add_key_command(device, keyfile), device, ProvisionStep::Encryption, password); !res) {
            return std::unexpected(res.error());
        }
        target.keyfile = std::move(keyfile);
    }

    if (const auto& hsm = encryption.hsm_device(); hsm) {
        spdlog::info("Enrolling FIDO2 token {} for {}", hsm->path, device);
        if (auto res = utils::run_checked(m_runner, crypto::gen_fido2_enroll_command(device, *hsm), device, ProvisionStep::Encryption, password); !res) {
            return std::unexpected(res.error());
        }
        target.hsm_enrolled = true;
    }

    m_mappers[obj_id] = mapper_path;
    m_crypt_targets.emplace_back(std::move(target));
    return {};
}

auto Provisioner::encrypt_partitions(disk::DiskLayoutConfiguration& layout, const crypto::DiskEncryption& encryption) noexcept -> Result<void> {
    for (const auto& obj_id : encryption.partitions()) {
        const auto* part = layout.find_partition(obj_id);
        if (part == nullptr || !part->dev_path()) {
            return make_error(ErrorKind::InvalidState, "encryption target has no device path"s, obj_id, ProvisionStep::Encryption);
        }
        const bool is_root = encryption.type() == crypto::EncryptionType::LvmOnLuks ? pv_carries_root(layout, obj_id) : part->is_root();
        if (auto res = encrypt_target(obj_id, *part->dev_path(), *part->mapper_name(), is_root, encryption); !res) {
            return res;
        }
    }
    return {};
}

auto Provisioner::encrypt_volumes(disk::DiskLayoutConfiguration& layout, const crypto::DiskEncryption& encryption) noexcept -> Result<void> {
    const auto& lvm_config = layout.lvm_config();
    for (const auto& obj_id : encryption.lvm_volumes()) {
        const auto* vol_group = lvm_config ? lvm_config->find_group_of(obj_id) : nullptr;
        const auto* volume    = lvm_config ? lvm_config->find_volume(obj_id) : nullptr;
        if (vol_group == nullptr || volume == nullptr || !volume->dev_path()) {
            return make_error(ErrorKind::InvalidState, "encryption target has no device path"s, obj_id, ProvisionStep::Encryption);
        }
        if (auto res = encrypt_target(obj_id, *volume->dev_path(), volume->mapper_name(vol_group->name()), volume->is_root(), encryption); !res) {
            return res;
        }
    }
    return {};
}

auto Provisioner::collect_leaves(disk::DiskLayoutConfiguration& layout) const noexcept -> std::vector<LeafTarget> {
    std::vector<LeafTarget> leaves{};
    auto& lvm_config = layout.lvm_config();

    for (auto& device_mod : layout.device_modifications()) {
        for (auto& part : device_mod.partitions()) {
            if (part.status() == disk::ModificationStatus::Delete || (lvm_config && lvm_config->is_pv(part.obj_id()))) {
                continue;
            }
            if (auto it = m_mappers.find(part.obj_id()); it != m_mappers.end()) {
                leaves.emplace_back(CryptoMapper{.mapper_path = it->second, .backing = &part});
            } else {
                leaves.emplace_back(RawPartition{.partition = &part});
            }
        }
    }
    if (!lvm_config) {
        return leaves;
    }
    for (auto& vol_group : lvm_config->vol_groups()) {
        for (auto& volume : vol_group.volumes()) {
            if (volume.status() == disk::ModificationStatus::Delete) {
                continue;
            }
            if (auto it = m_mappers.find(volume.obj_id()); it != m_mappers.end()) {
                leaves.emplace_back(CryptoMapper{.mapper_path = it->second, .backing = &volume});
            } else {
                leaves.emplace_back(LvmVolumeTarget{.volume = &volume, .vg_name = vol_group.name()});
            }
        }
    }
    return leaves;
}

auto Provisioner::format_leaf(LeafTarget& leaf) noexcept -> Result<void> {
    const auto& path = leaf_device_path(leaf);
    if (!path) {
        return make_error(ErrorKind::InvalidState, "target has no device path"s, leaf_object_id(leaf), ProvisionStep::Format);
    }

    if (!leaf_is_formattable(leaf)) {
        // existing filesystem, only its identity is needed
        if (const auto node = m_inventory.find_node(*path); node && !node->uuid.empty()) {
            leaf_set_uuid(leaf, node->uuid);
        }
        return {};
    }

    const auto fs_type = *leaf_fs_type(leaf);
    auto mkfs_cmd      = fs::get_mkfs_command(fs_type);
    if (!mkfs_cmd) {
        return make_error(ErrorKind::UnknownFilesystemFormat,
            fmt::format(FMT_COMPILE("no way to create a {} filesystem"), fs::filesystem_type_to_string(fs_type)),
            *path, ProvisionStep::Format);
    }
    mkfs_cmd->push_back(*path);

    spdlog::info("Formatting {} as {}", *path, fs::filesystem_type_to_string(fs_type));
    if (auto res = utils::run_checked(m_runner, *mkfs_cmd, *path, ProvisionStep::Format); !res) {
        return std::unexpected(res.error());
    }

    const auto expected_fstype = fs::get_mount_fs_name(fs_type);
    const auto uuid            = utils::poll_until(m_config.poll, fmt::format(FMT_COMPILE("filesystem on {}"), *path), [&]() -> std::optional<std::string> {
        if (!m_inventory.list_devices()) {
            return std::nullopt;
        }
        const auto node = m_inventory.find_node(*path);
        if (!node || node->uuid.empty() || fs::get_mount_fs_name(fs::string_to_filesystem_type(node->fstype)) != expected_fstype) {
            return std::nullopt;
        }
        return node->uuid;
    });
    if (!uuid) {
        return make_error(ErrorKind::PartitionNeverAppeared, "formatted filesystem never reported a UUID"s, *path, ProvisionStep::Format);
    }
    leaf_set_uuid(leaf, *uuid);

    if (fs_type == fs::FilesystemType::Btrfs) {
        return fs::btrfs_create_subvols(m_runner, leaf_subvolumes(leaf), *path, m_config.btrfs_scratch_dir);
    }
    return {};
}

auto Provisioner::mount_entry(const mount::MountEntry& entry, std::string_view target_root, bool issue_mount) noexcept -> Result<void> {
    const auto& host_path = mount::target_path(target_root, entry.mountpoint);

    if (issue_mount) {
        std::error_code err{};
        ::fs::create_directories(host_path, err);
        if (err) {
            return make_error(ErrorKind::CommandFailed, fmt::format(FMT_COMPILE("cannot create {}: {}"), host_path, err.message()), entry.source, ProvisionStep::Mount);
        }
        spdlog::info("Mounting {} at {}", entry.source, host_path);
        if (auto res = utils::run_checked(m_runner, mount::gen_mount_command(entry, target_root), entry.source, ProvisionStep::Mount); !res) {
            return std::unexpected(res.error());
        }
    }

    const auto mounted = utils::poll_until(m_config.poll, fmt::format(FMT_COMPILE("mount of {}"), host_path), [&]() -> std::optional<bool> {
        if (!m_inventory.list_devices()) {
            return std::nullopt;
        }
        const auto node = m_inventory.find_node(entry.source);
        if (!node || std::ranges::find(node->mountpoints, host_path) == node->mountpoints.end()) {
            return std::nullopt;
        }
        return true;
    });
    if (!mounted) {
        return make_error(ErrorKind::MountVerificationFailed,
            fmt::format(FMT_COMPILE("{} is not reported as mounted at {}"), entry.source, host_path), entry.source, ProvisionStep::Mount);
    }
    return {};
}

auto Provisioner::provision(disk::DiskLayoutConfiguration& layout, const std::optional<crypto::DiskEncryption>& encryption) noexcept -> Result<ProvisioningResult> {
    m_mappers.clear();
    m_crypt_targets.clear();

    const bool pre_mounted     = layout.type() == disk::LayoutType::PreMounted;
    const auto encryption_type = encryption ? encryption->type() : crypto::EncryptionType::NoEncryption;

    if (pre_mounted) {
        spdlog::info("Layout is pre-mounted at {}, only verifying", layout.mountpoint().value_or(""s));
        if (auto res = refresh(ProvisionStep::Mount); !res) {
            return std::unexpected(res.error());
        }
    } else {
        if (encryption) {
            if (auto res = layout.validate_encryption(*encryption); !res) {
                return with_step(std::move(res.error()), ProvisionStep::Encryption);
            }
        }

        for (auto& device_mod : layout.device_modifications()) {
            if (auto res = prepare_partition_table(device_mod); !res) {
                return std::unexpected(res.error());
            }
        }
        for (auto& device_mod : layout.device_modifications()) {
            if (auto res = create_partitions(device_mod); !res) {
                return std::unexpected(res.error());
            }
        }

        // LVM on LUKS puts the PVs on the mappers, so those get unlocked first
        if (encryption_type == crypto::EncryptionType::Luks || encryption_type == crypto::EncryptionType::LvmOnLuks) {
            if (auto res = encrypt_partitions(layout, *encryption); !res) {
                return std::unexpected(res.error());
            }
        }
        if (auto res = realize_lvm(layout); !res) {
            return std::unexpected(res.error());
        }
        if (encryption_type == crypto::EncryptionType::LuksOnLvm) {
            if (auto res = encrypt_volumes(layout, *encryption); !res) {
                return std::unexpected(res.error());
            }
        }

        if (auto res = refresh(ProvisionStep::Format); !res) {
            return std::unexpected(res.error());
        }
    }

    auto leaves = collect_leaves(layout);
    for (auto& leaf : leaves) {
        if (pre_mounted) {
            if (const auto path = leaf_device_path(leaf); path) {
                if (const auto node = m_inventory.find_node(*path); node && !node->uuid.empty()) {
                    leaf_set_uuid(leaf, node->uuid);
                }
            }
            continue;
        }
        if (auto res = format_leaf(leaf); !res) {
            return std::unexpected(res.error());
        }
    }

    ProvisioningResult result{};
    std::vector<mount::MountEntry> entries{};
    for (const auto& leaf : leaves) {
        for (auto&& entry : leaf_mount_entries(leaf)) {
            entries.emplace_back(std::move(entry));
        }
        if (auto swap = leaf_swap_entry(leaf); swap) {
            result.swap.emplace_back(std::move(*swap));
        }
    }

    auto plan = mount::compute_mount_plan(std::move(entries));
    if (!plan) {
        return std::unexpected(plan.error());
    }

    const auto& target_root = pre_mounted ? *layout.mountpoint() : m_config.target_root;
    for (const auto& entry : *plan) {
        if (auto res = mount_entry(entry, target_root, !pre_mounted); !res) {
            return std::unexpected(res.error());
        }
        result.mount_devices[entry.mountpoint] = entry.source;
    }

    for (const auto& entry : *plan) {
        if (entry.mountpoint != "/"sv) {
            continue;
        }
        ResolvedIds root_ids{.uuid = entry.uuid};
        if (const auto* part = layout.find_partition(entry.object_id); part != nullptr) {
            root_ids.partuuid = part->partuuid().value_or(""s);
        }
        result.root = std::move(root_ids);
        break;
    }
    for (const auto& device_mod : layout.device_modifications()) {
        if (const auto* boot = device_mod.get_boot_partition(); boot != nullptr) {
            result.boot = ResolvedIds{.partuuid = boot->partuuid().value_or(""s), .uuid = boot->uuid().value_or(""s)};
            break;
        }
    }

    result.mount_plan    = std::move(*plan);
    result.crypt_targets = m_crypt_targets;
    spdlog::info("Provisioning finished: {} mounts, {} encrypted targets", result.mount_plan.size(), result.crypt_targets.size());
    return result;
}

}  // namespace strata::provision
