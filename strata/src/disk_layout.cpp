#include "strata/disk_layout.hpp"

#include <algorithm>  // for sort, find_if, any_of, all_of
#include <set>        // for set

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using strata::ErrorKind;
using strata::make_error;
using strata::Result;
using strata::disk::ModificationStatus;

struct Occupied final {
    std::uint64_t start{};
    std::uint64_t end{};
    std::string_view label{};
};

auto is_mib_aligned(std::uint64_t bytes) noexcept -> bool {
    return bytes % strata::disk::MIB_BYTES == 0;
}

auto check_device_geometry(const strata::disk::DeviceModification& device_mod) noexcept -> Result<void> {
    using namespace strata::disk;

    const auto& device = device_mod.device();
    const auto geometry = device.geometry(device_mod.partition_table());
    const auto usable_end = (last_usable_sector(geometry) + 1) * geometry.sector_size.value;

    std::vector<Occupied> occupied{};
    for (const auto& part : device_mod.partitions()) {
        const std::string_view label = part.dev_path() ? std::string_view{*part.dev_path()} : std::string_view{part.obj_id()};
        if (device_mod.wipe() && part.status() != ModificationStatus::Create) {
            return make_error(ErrorKind::InvalidState,
                fmt::format(FMT_COMPILE("device {} is wiped but partition has status '{}'"), device.path, modification_status_to_string(part.status())),
                std::string{label});
        }
        if (part.status() == ModificationStatus::Delete) {
            continue;
        }

        const auto start  = part.start().normalize();
        const auto length = part.length().normalize();
        if (part.status() == ModificationStatus::Create) {
            if (length == 0) {
                return make_error(ErrorKind::InvalidState, "partition to create has zero length", std::string{label});
            }
            if (!part.start().is_valid_start()) {
                return make_error(ErrorKind::InvalidState,
                    fmt::format(FMT_COMPILE("partition starts at {} before the first MiB"), part.start().format_highest()), std::string{label});
            }
            if (!is_mib_aligned(start) || !is_mib_aligned(length)) {
                return make_error(ErrorKind::InvalidState, "partition start and length must be aligned to 1 MiB", std::string{label});
            }
            if (start + length > usable_end) {
                return make_error(ErrorKind::InvalidState,
                    fmt::format(FMT_COMPILE("partition ends past the usable end of {} ({})"), device.path, Size::bytes(usable_end).format_highest()),
                    std::string{label});
            }
        }
        occupied.push_back(Occupied{.start = start, .end = start + length, .label = label});
    }

    // partitions the layout does not mention stay on disk untouched
    if (!device_mod.wipe()) {
        for (const auto& probed : device.partitions) {
            const bool mentioned = std::ranges::any_of(device_mod.partitions(), [&probed](auto&& part) { return part.dev_path() == probed.path; });
            if (!mentioned) {
                const auto start = probed.start.normalize();
                occupied.push_back(Occupied{.start = start, .end = start + probed.length.normalize(), .label = probed.path});
            }
        }
    }

    std::ranges::sort(occupied, {}, &Occupied::start);
    for (std::size_t i = 1; i < occupied.size(); ++i) {
        if (occupied[i - 1].end > occupied[i].start) {
            return make_error(ErrorKind::InvalidState,
                fmt::format(FMT_COMPILE("partition overlaps {} on {}"), occupied[i - 1].label, device.path), std::string{occupied[i].label});
        }
    }
    return {};
}

// Returns the path as seen from inside base, e.g. ("/mnt", "/mnt/boot") -> "/boot".
auto relative_to_base(std::string_view base, std::string_view path) noexcept -> std::optional<std::string> {
    while (base.size() > 1 && base.ends_with('/')) {
        base.remove_suffix(1);
    }
    if (base == "/"sv) {
        return std::string{path};
    }
    if (path == base) {
        return std::string{"/"};
    }
    if (path.starts_with(base) && path.size() > base.size() && path[base.size()] == '/') {
        return std::string{path.substr(base.size())};
    }
    return std::nullopt;
}

}  // namespace

namespace strata::disk {

auto layout_type_to_string(LayoutType type) noexcept -> std::string_view {
    switch (type) {
    case LayoutType::Default:
        return "default_layout"sv;
    case LayoutType::Manual:
        return "manual_partitioning"sv;
    case LayoutType::PreMounted:
        return "pre_mounted_config"sv;
    }
    return "manual_partitioning"sv;
}

auto string_to_layout_type(std::string_view type) noexcept -> std::optional<LayoutType> {
    if (type == "default_layout"sv) {
        return LayoutType::Default;
    } else if (type == "manual_partitioning"sv) {
        return LayoutType::Manual;
    } else if (type == "pre_mounted_config"sv) {
        return LayoutType::PreMounted;
    }
    return std::nullopt;
}

auto DiskLayoutConfiguration::create(LayoutType type, std::vector<DeviceModification> device_modifications,
    std::optional<lvm::LvmConfiguration> lvm_config, std::optional<std::string> mountpoint) noexcept -> Result<DiskLayoutConfiguration> {
    if (type == LayoutType::PreMounted && (!mountpoint || !mountpoint->starts_with('/'))) {
        return make_error(ErrorKind::InvalidState, "pre-mounted layout requires an absolute base mountpoint");
    }

    std::set<std::string_view> seen_devices{};
    std::set<std::string_view> seen_ids{};
    for (const auto& device_mod : device_modifications) {
        if (!seen_devices.insert(device_mod.device_path()).second) {
            return make_error(ErrorKind::InvalidState, "device is listed more than once", device_mod.device_path());
        }
        for (const auto& part : device_mod.partitions()) {
            if (!seen_ids.insert(part.obj_id()).second) {
                return make_error(ErrorKind::InvalidState, "object id is used more than once", part.obj_id());
            }
        }
        // a pre-mounted layout only describes what is already there
        if (type == LayoutType::PreMounted) {
            continue;
        }
        if (auto res = check_device_geometry(device_mod); !res) {
            return std::unexpected(res.error());
        }
    }
    if (lvm_config) {
        for (const auto& group : lvm_config->vol_groups()) {
            for (const auto& volume : group.volumes()) {
                if (!seen_ids.insert(volume.obj_id()).second) {
                    return make_error(ErrorKind::InvalidState, "object id is used more than once", volume.obj_id());
                }
            }
        }
    }

    DiskLayoutConfiguration layout{type, std::move(device_modifications), std::nullopt, std::move(mountpoint)};
    if (lvm_config) {
        if (auto res = layout.set_lvm_config(std::move(*lvm_config)); !res) {
            return std::unexpected(res.error());
        }
    }
    return layout;
}

auto DiskLayoutConfiguration::set_lvm_config(lvm::LvmConfiguration lvm_config) noexcept -> Result<void> {
    for (const auto& group : lvm_config.vol_groups()) {
        // only a group made purely of existing volumes may sit on kept partitions
        const bool existing_group = std::ranges::all_of(group.volumes(), [](auto&& volume) { return volume.status() == ModificationStatus::Exist; });
        for (const auto& pv : group.pvs()) {
            const auto* part = find_partition(pv);
            if (part == nullptr) {
                return make_error(ErrorKind::InvalidState,
                    fmt::format(FMT_COMPILE("volume group '{}' references unknown physical volume"), group.name()), pv);
            }
            if (part->status() == ModificationStatus::Delete) {
                return make_error(ErrorKind::InvalidState,
                    fmt::format(FMT_COMPILE("volume group '{}' uses a partition marked for deletion"), group.name()), pv);
            }
            if (!existing_group && part->status() != ModificationStatus::Create) {
                return make_error(ErrorKind::InvalidState,
                    fmt::format(FMT_COMPILE("volume group '{}' creates volumes but would initialize the {} partition as physical volume"),
                        group.name(), modification_status_to_string(part->status())),
                    part->dev_path().value_or(pv));
            }
        }
    }
    m_lvm_config = std::move(lvm_config);
    return {};
}

auto DiskLayoutConfiguration::validate_encryption(const crypto::DiskEncryption& encryption) const noexcept -> Result<void> {
    using crypto::EncryptionType;

    const auto type_name = crypto::encryption_type_to_string(encryption.type());
    switch (encryption.type()) {
    case EncryptionType::NoEncryption:
        return {};
    case EncryptionType::Luks:
    case EncryptionType::LvmOnLuks:
        for (const auto& id : encryption.partitions()) {
            const auto* part = find_partition(id);
            if (part == nullptr) {
                return make_error(ErrorKind::InvalidState, "encryption target names no partition of the layout", id);
            }
            if (!part->is_create_or_modify()) {
                return make_error(ErrorKind::InvalidState, "only partitions that are created or reformatted can be encrypted", part->dev_path().value_or(id));
            }
            const bool is_pv = m_lvm_config && m_lvm_config->is_pv(id);
            if (encryption.type() == EncryptionType::LvmOnLuks && !is_pv) {
                return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("{} target is not an LVM physical volume"), type_name), id);
            }
            if (encryption.type() == EncryptionType::Luks && is_pv) {
                return make_error(ErrorKind::InvalidState, "LVM physical volumes are encrypted with lvm_on_luks", id);
            }
        }
        return {};
    case EncryptionType::LuksOnLvm:
        for (const auto& id : encryption.lvm_volumes()) {
            const auto* volume = find_volume(id);
            if (volume == nullptr) {
                return make_error(ErrorKind::InvalidState, "encryption target names no logical volume of the layout", id);
            }
            if (!volume->is_create_or_modify()) {
                return make_error(ErrorKind::InvalidState, "only volumes that are created or reformatted can be encrypted", id);
            }
        }
        return {};
    }
    return {};
}

auto DiskLayoutConfiguration::find_partition(std::string_view obj_id) noexcept -> PartitionModification* {
    for (auto& device_mod : m_device_modifications) {
        if (auto* part = device_mod.find_partition(obj_id); part != nullptr) {
            return part;
        }
    }
    return nullptr;
}

auto DiskLayoutConfiguration::find_partition(std::string_view obj_id) const noexcept -> const PartitionModification* {
    for (const auto& device_mod : m_device_modifications) {
        if (const auto* part = device_mod.find_partition(obj_id); part != nullptr) {
            return part;
        }
    }
    return nullptr;
}

auto DiskLayoutConfiguration::find_device_of(std::string_view obj_id) const noexcept -> const DeviceModification* {
    auto it = std::ranges::find_if(m_device_modifications, [obj_id](auto&& device_mod) { return device_mod.find_partition(obj_id) != nullptr; });
    return it != m_device_modifications.end() ? &*it : nullptr;
}

auto DiskLayoutConfiguration::find_volume(std::string_view obj_id) const noexcept -> const lvm::LvmVolume* {
    if (!m_lvm_config) {
        return nullptr;
    }
    return m_lvm_config->find_volume(obj_id);
}

auto pre_mounted_modifications(const std::vector<DeviceInfo>& devices, std::string_view base) noexcept -> Result<std::vector<DeviceModification>> {
    std::vector<DeviceModification> result{};

    for (const auto& device : devices) {
        DeviceModification device_mod{device, false};
        for (const auto& partition : device.partitions) {
            // a btrfs filesystem shows up once per mounted subvolume, the top level has fs root "/"
            std::optional<std::string> mountpoint{};
            std::vector<SubvolumeModification> subvols{};
            for (const auto& live_mountpoint : partition.mountpoints) {
                auto relative = relative_to_base(base, live_mountpoint);
                if (!relative) {
                    continue;
                }
                auto subvol_it = std::ranges::find_if(partition.btrfs_subvols, [&live_mountpoint](auto&& subvol) { return subvol.mountpoint == live_mountpoint; });
                if (subvol_it == partition.btrfs_subvols.end()) {
                    mountpoint = std::move(relative);
                    continue;
                }
                std::string_view name{subvol_it->name};
                if (name.starts_with('/')) {
                    name.remove_prefix(1);
                }
                subvols.emplace_back(SubvolumeModification{.name = std::string{name}, .mountpoint = std::move(*relative)});
            }
            if (!mountpoint && subvols.empty()) {
                continue;
            }

            auto part_mod = PartitionModification::from_existing(partition);
            if (auto res = part_mod.set_mountpoint(std::move(mountpoint)); !res) {
                return std::unexpected(res.error());
            }
            if (auto res = part_mod.set_btrfs_subvols(std::move(subvols)); !res) {
                return std::unexpected(res.error());
            }
            spdlog::debug("Pre-mounted partition {} found under {}", partition.path, base);
            device_mod.add_partition(std::move(part_mod));
        }
        if (!device_mod.partitions().empty()) {
            result.emplace_back(std::move(device_mod));
        }
    }
    return result;
}

}  // namespace strata::disk
