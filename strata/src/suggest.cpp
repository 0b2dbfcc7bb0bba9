#include "strata/suggest.hpp"

#include <algorithm>  // for clamp, max_element, min_element, sort
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

using namespace strata::disk;
using strata::fs::FilesystemType;
using strata::fs::PartitionFlag;
using strata::fs::PartitionTable;

constexpr Size BOOT_START{1, Unit::MiB};

auto align_down_mib(std::uint64_t bytes) noexcept -> std::uint64_t {
    return bytes - (bytes % MIB_BYTES);
}

// first byte past the last usable sector, rounded down to a MiB boundary
auto usable_end_bytes(const DeviceInfo& device, PartitionTable table) noexcept -> std::uint64_t {
    const auto geometry = device.geometry(table);
    return align_down_mib((last_usable_sector(geometry) + 1) * geometry.sector_size.value);
}

auto fs_mount_options(FilesystemType fs_type, const SuggestionOptions& options) noexcept -> std::vector<std::string> {
    auto mount_options = options.mount_options;
    if (options.compression && fs_type == FilesystemType::Btrfs) {
        mount_options.emplace_back("compress=zstd"s);
    }
    return mount_options;
}

auto make_boot_partition(const DeviceInfo& device, PartitionTable table) noexcept -> PartitionModification {
    std::vector<PartitionFlag> flags{PartitionFlag::Boot};
    if (table == PartitionTable::Gpt) {
        flags.push_back(PartitionFlag::Esp);
    }
    auto boot = PartitionModification::create(PartitionSpec{
        .status     = ModificationStatus::Create,
        .type       = PartitionType::Boot,
        .start      = Size{1, Unit::MiB, device.sector_size},
        .length     = Size{1, Unit::GiB, device.sector_size},
        .fs_type    = FilesystemType::Fat32,
        .mountpoint = "/boot"s,
        .flags      = std::move(flags),
    });
    // fixed values, cannot fail validation
    return std::move(*boot);
}

auto make_data_partition(const DeviceInfo& device, std::uint64_t start, std::uint64_t length, FilesystemType fs_type,
    std::optional<std::string> mountpoint, std::vector<std::string> mount_options) noexcept -> strata::Result<PartitionModification> {
    return PartitionModification::create(PartitionSpec{
        .status        = ModificationStatus::Create,
        .type          = PartitionType::Primary,
        .start         = Size::bytes(start, device.sector_size),
        .length        = Size::bytes(length, device.sector_size),
        .fs_type       = fs_type,
        .mountpoint    = std::move(mountpoint),
        .mount_options = std::move(mount_options),
    });
}

auto shortfall(const DeviceInfo& device, Size required, std::string reason) noexcept -> std::unexpected<CapacityShortfall> {
    spdlog::warn("No layout suggestion for {}: {} (needs {}, has {})", device.path, reason, required.format_highest(), device.total_size.format_highest());
    return std::unexpected(CapacityShortfall{.device = device.path, .required = required, .available = device.total_size, .reason = std::move(reason)});
}

}  // namespace

namespace strata::disk {

auto default_btrfs_subvolumes(bool compress) noexcept -> std::vector<SubvolumeModification> {
    return {
        SubvolumeModification{.name = "@"s, .mountpoint = "/"s, .compress = compress},
        SubvolumeModification{.name = "@home"s, .mountpoint = "/home"s, .compress = compress},
        SubvolumeModification{.name = "@log"s, .mountpoint = "/var/log"s, .compress = compress},
        SubvolumeModification{.name = "@pkg"s, .mountpoint = "/var/cache/pacman/pkg"s, .compress = compress},
    };
}

auto suggest_single_disk(const DeviceInfo& device, fs::FilesystemType fs_type, const SuggestionOptions& options) noexcept -> Suggestion<DeviceModification> {
    const auto table      = options.partition_table;
    const auto usable_end = usable_end_bytes(device, table);
    const auto root_start = BOOT_START.normalize() + BOOT_PARTITION_SIZE.normalize();
    const auto required   = Size::bytes(root_start + MIN_ROOT_SIZE.normalize());

    if (usable_end < required.normalize()) {
        return shortfall(device, required, "device too small for boot and root partitions");
    }

    const bool use_subvolumes = fs_type == FilesystemType::Btrfs && options.use_subvolumes;
    const bool use_home       = !use_subvolumes && options.separate_home && device.total_size >= MIN_HOME_DEVICE_SIZE;

    DeviceModification device_mod{device, true, table};
    device_mod.add_partition(make_boot_partition(device, table));

    std::uint64_t root_length = usable_end - root_start;
    if (use_home) {
        const auto tenth = device.total_size.normalize() / 10;
        root_length      = align_down_mib(std::clamp(tenth, ROOT_TARGET_SIZE.normalize(), MAX_ROOT_SIZE.normalize()));
    }

    auto root = make_data_partition(device, root_start, root_length, fs_type,
        use_subvolumes ? std::nullopt : std::make_optional("/"s), fs_mount_options(fs_type, options));
    if (!root) {
        return shortfall(device, required, root.error().message);
    }
    if (use_subvolumes) {
        if (auto res = root->set_btrfs_subvols(default_btrfs_subvolumes(options.compression)); !res) {
            return shortfall(device, required, res.error().message);
        }
    }
    device_mod.add_partition(std::move(*root));

    if (use_home) {
        const auto home_start = root_start + root_length;
        auto home             = make_data_partition(device, home_start, usable_end - home_start, fs_type, "/home"s, fs_mount_options(fs_type, options));
        if (!home) {
            return shortfall(device, required, home.error().message);
        }
        device_mod.add_partition(std::move(*home));
    }

    spdlog::info("Suggested layout for {}: {} partitions (home: {}, subvolumes: {})", device.path, device_mod.partitions().size(), use_home, use_subvolumes);
    return device_mod;
}

auto suggest_multi_disk(const std::vector<DeviceInfo>& devices, fs::FilesystemType fs_type, const SuggestionOptions& options) noexcept -> Suggestion<std::vector<DeviceModification>> {
    const auto min_root_device = Size::bytes(BOOT_START.normalize() + BOOT_PARTITION_SIZE.normalize() + MIN_ROOT_SIZE.normalize());

    const DeviceInfo* home_device = nullptr;
    for (const auto& device : devices) {
        if (device.total_size < MIN_HOME_DEVICE_SIZE) {
            continue;
        }
        if (home_device == nullptr || device.total_size > home_device->total_size) {
            home_device = &device;
        }
    }
    if (home_device == nullptr) {
        return std::unexpected(CapacityShortfall{
            .device    = devices.empty() ? ""s : devices.front().path,
            .required  = MIN_HOME_DEVICE_SIZE,
            .available = devices.empty() ? Size{} : devices.front().total_size,
            .reason    = "no device large enough for /home"s,
        });
    }

    const DeviceInfo* root_device = nullptr;
    for (const auto& device : devices) {
        if (&device == home_device || device.total_size < min_root_device) {
            continue;
        }
        if (root_device == nullptr || (device.total_size - ROOT_TARGET_SIZE) < (root_device->total_size - ROOT_TARGET_SIZE)) {
            root_device = &device;
        }
    }
    if (root_device == nullptr) {
        return shortfall(*home_device, min_root_device, "no second device large enough for boot and root");
    }

    spdlog::debug("Multi-disk suggestion: root on {}, home on {}", root_device->path, home_device->path);

    SuggestionOptions root_options = options;
    root_options.separate_home     = false;
    root_options.use_subvolumes    = false;
    auto root_mod                  = suggest_single_disk(*root_device, fs_type, root_options);
    if (!root_mod) {
        return std::unexpected(root_mod.error());
    }

    const auto table      = options.partition_table;
    const auto home_start = Size{1, Unit::MiB, home_device->sector_size}.normalize();
    DeviceModification home_mod{*home_device, true, table};
    auto home = make_data_partition(*home_device, home_start, usable_end_bytes(*home_device, table) - home_start, fs_type, "/home"s, fs_mount_options(fs_type, options));
    if (!home) {
        return shortfall(*home_device, MIN_HOME_DEVICE_SIZE, home.error().message);
    }
    home_mod.add_partition(std::move(*home));

    std::vector<DeviceModification> result{};
    result.emplace_back(std::move(*root_mod));
    result.emplace_back(std::move(home_mod));
    return result;
}

auto suggest_lvm(const DiskLayoutConfiguration& layout, std::string_view vg_name) noexcept -> Result<DiskLayoutConfiguration> {
    if (layout.type() != LayoutType::Default) {
        return make_error(ErrorKind::InvalidState, "LVM can only be suggested for a default layout");
    }

    auto device_mods = layout.device_modifications();

    std::vector<ObjectId> pv_ids{};
    std::uint64_t vg_bytes{};
    std::optional<FilesystemType> fs_type{};
    std::vector<SubvolumeModification> root_subvols{};
    std::vector<std::string> mount_options{};

    for (auto& device_mod : device_mods) {
        for (auto& part : device_mod.partitions()) {
            if (part.is_boot() || part.status() == ModificationStatus::Delete) {
                continue;
            }
            if (part.is_root() || !fs_type) {
                fs_type       = part.fs_type();
                mount_options = part.mount_options();
            }
            if (part.is_root()) {
                root_subvols = part.btrfs_subvols();
            }

            // PVs carry no filesystem of their own
            if (auto res = part.set_fs_type(std::nullopt); !res) {
                return std::unexpected(res.error());
            }
            if (auto res = part.set_mountpoint(std::nullopt); !res) {
                return std::unexpected(res.error());
            }
            if (auto res = part.set_btrfs_subvols({}); !res) {
                return std::unexpected(res.error());
            }
            part.set_mount_options({});

            pv_ids.push_back(part.obj_id());
            vg_bytes += part.length().normalize();
        }
    }
    if (pv_ids.empty()) {
        return make_error(ErrorKind::InvalidState, "layout has no partition to turn into a physical volume");
    }

    std::vector<lvm::LvmVolume> volumes{};
    const bool use_subvolumes = !root_subvols.empty();
    const auto root_bytes     = use_subvolumes ? vg_bytes : std::min(vg_bytes, LVM_ROOT_SIZE.normalize());

    auto root_volume = lvm::LvmVolume::create(lvm::LvmVolumeSpec{
        .name          = "root"s,
        .fs_type       = fs_type,
        .length        = Size::bytes(root_bytes),
        .mountpoint    = use_subvolumes ? std::nullopt : std::make_optional("/"s),
        .mount_options = mount_options,
        .btrfs_subvols = root_subvols,
    });
    if (!root_volume) {
        return std::unexpected(root_volume.error());
    }
    volumes.emplace_back(std::move(*root_volume));

    if (!use_subvolumes && vg_bytes > root_bytes) {
        auto home_volume = lvm::LvmVolume::create(lvm::LvmVolumeSpec{
            .name          = "home"s,
            .fs_type       = fs_type,
            .length        = Size::bytes(vg_bytes - root_bytes),
            .mountpoint    = "/home"s,
            .mount_options = mount_options,
        });
        if (!home_volume) {
            return std::unexpected(home_volume.error());
        }
        volumes.emplace_back(std::move(*home_volume));
    }

    auto group = lvm::LvmVolumeGroup::create(std::string{vg_name}, std::move(pv_ids), std::move(volumes));
    if (!group) {
        return std::unexpected(group.error());
    }
    std::vector<lvm::LvmVolumeGroup> groups{};
    groups.emplace_back(std::move(*group));
    auto lvm_config = lvm::LvmConfiguration::create(std::move(groups));
    if (!lvm_config) {
        return std::unexpected(lvm_config.error());
    }

    spdlog::info("Suggested LVM layout: volume group {} over {} of physical volumes", vg_name, Size::bytes(vg_bytes).format_highest());
    return DiskLayoutConfiguration::create(LayoutType::Default, std::move(device_mods), std::move(*lvm_config), layout.mountpoint());
}

}  // namespace strata::disk
