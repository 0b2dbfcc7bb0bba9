#include "strata/device_model.hpp"

#include <algorithm>   // for find, find_if, remove
#include <filesystem>  // for path
#include <random>      // for random_device, mt19937_64

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace {

constexpr auto MAPPER_PREFIX = "luks-"sv;

auto option_key(std::string_view option) noexcept -> std::string_view {
    return option.substr(0, option.find('='));
}

auto check_mountpoint(const std::optional<std::string>& mountpoint) noexcept -> strata::Result<void> {
    if (mountpoint && !mountpoint->starts_with('/')) {
        return strata::make_error(strata::ErrorKind::InvalidState, fmt::format(FMT_COMPILE("mountpoint '{}' must be an absolute path"), *mountpoint));
    }
    return {};
}

auto check_status(strata::disk::ModificationStatus status, const strata::disk::PartitionSpec& spec) noexcept -> strata::Result<void> {
    using strata::disk::ModificationStatus;

    const auto id = spec.obj_id.value_or("");
    if (status != ModificationStatus::Create && !spec.dev_path) {
        return strata::make_error(strata::ErrorKind::InvalidState,
            fmt::format(FMT_COMPILE("partition with status '{}' requires a device path"), strata::disk::modification_status_to_string(status)), id);
    }
    if (status == ModificationStatus::Modify && !spec.fs_type) {
        return strata::make_error(strata::ErrorKind::InvalidState, "partition with status 'modify' requires a filesystem type", spec.dev_path.value_or(id));
    }
    return {};
}

}  // namespace

namespace strata::disk {

auto generate_object_id() noexcept -> ObjectId {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist{};

    auto high = dist(engine);
    auto low  = dist(engine);
    // version 4, variant 1
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low  = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format(FMT_COMPILE("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}"),
        high >> 32U, (high >> 16U) & 0xFFFFU, high & 0xFFFFU, low >> 48U, low & 0xFFFFFFFFFFFFULL);
}

auto modification_status_to_string(ModificationStatus status) noexcept -> std::string_view {
    switch (status) {
    case ModificationStatus::Exist:
        return "existing"sv;
    case ModificationStatus::Modify:
        return "modify"sv;
    case ModificationStatus::Delete:
        return "delete"sv;
    case ModificationStatus::Create:
        return "create"sv;
    }
    return "unknown"sv;
}

auto string_to_modification_status(std::string_view status) noexcept -> std::optional<ModificationStatus> {
    if (status == "existing"sv) {
        return ModificationStatus::Exist;
    } else if (status == "modify"sv) {
        return ModificationStatus::Modify;
    } else if (status == "delete"sv) {
        return ModificationStatus::Delete;
    } else if (status == "create"sv) {
        return ModificationStatus::Create;
    }
    return std::nullopt;
}

auto partition_type_to_string(PartitionType type) noexcept -> std::string_view {
    return type == PartitionType::Boot ? "boot"sv : "primary"sv;
}

auto string_to_partition_type(std::string_view type) noexcept -> std::optional<PartitionType> {
    if (type == "primary"sv) {
        return PartitionType::Primary;
    } else if (type == "boot"sv) {
        return PartitionType::Boot;
    }
    return std::nullopt;
}

auto SubvolumeModification::mount_options() const noexcept -> std::vector<std::string> {
    if (compress) {
        return {"compress=zstd"s};
    }
    if (nodatacow) {
        return {"nodatacow"s};
    }
    return {};
}

auto validate_subvolumes(const std::vector<SubvolumeModification>& subvols) noexcept -> Result<void> {
    for (const auto& subvol : subvols) {
        if (subvol.name.empty()) {
            return make_error(ErrorKind::InvalidState, "btrfs subvolume requires a name");
        }
        if (!subvol.mountpoint.empty() && !subvol.mountpoint.starts_with('/')) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("subvolume '{}' mountpoint '{}' must be an absolute path"), subvol.name, subvol.mountpoint));
        }
        if (subvol.compress && subvol.nodatacow) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("subvolume '{}' cannot be both compressed and nodatacow"), subvol.name));
        }
        const auto duplicates = std::ranges::count_if(subvols, [&subvol](auto&& other) { return other.name == subvol.name; });
        if (duplicates > 1) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("subvolume '{}' is listed more than once"), subvol.name));
        }
    }
    return {};
}

auto normalize_mount_options(const std::vector<std::string>& options) noexcept -> std::vector<std::string> {
    std::vector<std::string> result{};
    for (const auto& option : options) {
        if (option.empty()) {
            continue;
        }
        auto it = std::ranges::find_if(result, [&option](auto&& existing) { return option_key(existing) == option_key(option); });
        if (it != result.end()) {
            *it = option;
        } else {
            result.push_back(option);
        }
    }
    return result;
}

auto PartitionModification::create(PartitionSpec spec) noexcept -> Result<PartitionModification> {
    if (auto res = check_status(spec.status, spec); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = check_mountpoint(spec.mountpoint); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = validate_subvolumes(spec.btrfs_subvols); !res) {
        return std::unexpected(res.error());
    }
    if (!spec.obj_id || spec.obj_id->empty()) {
        spec.obj_id = generate_object_id();
    }
    spec.mount_options = normalize_mount_options(spec.mount_options);
    return PartitionModification{std::move(spec)};
}

auto PartitionModification::from_existing(const PartitionInfo& info) noexcept -> PartitionModification {
    PartitionSpec spec{
        .status   = ModificationStatus::Exist,
        .type     = info.has_flag(fs::PartitionFlag::Boot) ? PartitionType::Boot : PartitionType::Primary,
        .start    = info.start,
        .length   = info.length,
        .fs_type  = info.fs_type == fs::FilesystemType::Unknown ? std::nullopt : std::make_optional(info.fs_type),
        .flags    = info.flags,
        .dev_path = info.path,
        .obj_id   = generate_object_id(),
        .partuuid = info.partuuid.empty() ? std::nullopt : std::make_optional(info.partuuid),
        .uuid     = info.uuid.empty() ? std::nullopt : std::make_optional(info.uuid),
        .partn    = info.partn,
    };
    for (const auto& subvol : info.btrfs_subvols) {
        std::string_view name{subvol.name};
        if (name.starts_with('/')) {
            name.remove_prefix(1);
        }
        spec.btrfs_subvols.emplace_back(SubvolumeModification{.name = std::string{name}, .mountpoint = subvol.mountpoint});
    }
    return PartitionModification{std::move(spec)};
}

auto PartitionModification::set_status(ModificationStatus status) noexcept -> Result<void> {
    if (auto res = check_status(status, m_spec); !res) {
        return res;
    }
    m_spec.status = status;
    return {};
}

auto PartitionModification::set_fs_type(std::optional<fs::FilesystemType> fs_type) noexcept -> Result<void> {
    if (!fs_type && m_spec.status == ModificationStatus::Modify) {
        return make_error(ErrorKind::InvalidState, "partition with status 'modify' requires a filesystem type", m_spec.dev_path.value_or(obj_id()));
    }
    m_spec.fs_type = fs_type;
    return {};
}

auto PartitionModification::set_mountpoint(std::optional<std::string> mountpoint) noexcept -> Result<void> {
    if (auto res = check_mountpoint(mountpoint); !res) {
        return res;
    }
    m_spec.mountpoint = std::move(mountpoint);
    return {};
}

auto PartitionModification::set_btrfs_subvols(std::vector<SubvolumeModification> subvols) noexcept -> Result<void> {
    if (auto res = validate_subvolumes(subvols); !res) {
        return res;
    }
    m_spec.btrfs_subvols = std::move(subvols);
    return {};
}

void PartitionModification::set_mount_options(const std::vector<std::string>& options) noexcept {
    m_spec.mount_options = normalize_mount_options(options);
}

void PartitionModification::set_flag(fs::PartitionFlag flag) noexcept {
    if (!has_flag(flag)) {
        m_spec.flags.push_back(flag);
    }
}

void PartitionModification::clear_flag(fs::PartitionFlag flag) noexcept {
    std::erase(m_spec.flags, flag);
}

void PartitionModification::set_geometry(Size start, Size length) noexcept {
    m_spec.start  = start;
    m_spec.length = length;
}

void PartitionModification::resolve(std::string dev_path, std::string partuuid, std::uint32_t partn) noexcept {
    spdlog::debug("Partition {} resolved to {} (PARTUUID={})", obj_id(), dev_path, partuuid);
    m_spec.dev_path = std::move(dev_path);
    m_spec.partuuid = std::move(partuuid);
    m_spec.partn    = partn;
}

void PartitionModification::set_uuid(std::string uuid) noexcept {
    m_spec.uuid = std::move(uuid);
}

auto PartitionModification::has_flag(fs::PartitionFlag flag) const noexcept -> bool {
    return std::ranges::find(m_spec.flags, flag) != m_spec.flags.end();
}

auto PartitionModification::is_boot() const noexcept -> bool {
    return has_flag(fs::PartitionFlag::Boot) || has_flag(fs::PartitionFlag::Xbootldr);
}

auto PartitionModification::is_efi() const noexcept -> bool {
    return m_spec.fs_type == fs::FilesystemType::Fat32
        && (has_flag(fs::PartitionFlag::Boot) || has_flag(fs::PartitionFlag::Esp))
        && !has_flag(fs::PartitionFlag::Xbootldr);
}

auto PartitionModification::is_root() const noexcept -> bool {
    if (m_spec.mountpoint == "/"sv) {
        return true;
    }
    return std::ranges::any_of(m_spec.btrfs_subvols, [](auto&& subvol) { return subvol.mountpoint == "/"sv; });
}

auto PartitionModification::is_home() const noexcept -> bool {
    return m_spec.mountpoint == "/home"sv || has_flag(fs::PartitionFlag::LinuxHome);
}

auto PartitionModification::is_swap() const noexcept -> bool {
    return m_spec.fs_type == fs::FilesystemType::LinuxSwap || has_flag(fs::PartitionFlag::Swap);
}

auto PartitionModification::is_exists_or_modify() const noexcept -> bool {
    return m_spec.status == ModificationStatus::Exist || m_spec.status == ModificationStatus::Modify;
}

auto PartitionModification::is_create_or_modify() const noexcept -> bool {
    return m_spec.status == ModificationStatus::Create || m_spec.status == ModificationStatus::Modify;
}

auto PartitionModification::mapper_name() const noexcept -> std::optional<std::string> {
    if (!m_spec.dev_path) {
        return std::nullopt;
    }
    return fmt::format(FMT_COMPILE("{}{}"), MAPPER_PREFIX, std::filesystem::path{*m_spec.dev_path}.filename().string());
}

DeviceModification::DeviceModification(DeviceInfo device, bool wipe, std::optional<fs::PartitionTable> partition_table) noexcept
  : m_device(std::move(device)), m_wipe(wipe) {
    m_partition_table = partition_table.value_or(m_device.partition_table.value_or(fs::PartitionTable::Gpt));
}

void DeviceModification::add_partition(PartitionModification partition) noexcept {
    m_partitions.emplace_back(std::move(partition));
}

auto DeviceModification::get_efi_partition() const noexcept -> const PartitionModification* {
    auto it = std::ranges::find_if(m_partitions, [](auto&& part) { return part.is_efi() && part.status() != ModificationStatus::Delete; });
    return it != m_partitions.end() ? &*it : nullptr;
}

auto DeviceModification::get_boot_partition() const noexcept -> const PartitionModification* {
    const auto* efi_partition = get_efi_partition();

    auto xbootldr = std::ranges::find_if(m_partitions, [](auto&& part) {
        return part.has_flag(fs::PartitionFlag::Xbootldr) && part.status() != ModificationStatus::Delete;
    });
    if (xbootldr != m_partitions.end() && efi_partition != nullptr && efi_partition != &*xbootldr) {
        return &*xbootldr;
    }

    auto it = std::ranges::find_if(m_partitions, [](auto&& part) {
        return part.has_flag(fs::PartitionFlag::Boot) && !part.has_flag(fs::PartitionFlag::Xbootldr) && part.status() != ModificationStatus::Delete;
    });
    return it != m_partitions.end() ? &*it : nullptr;
}

auto DeviceModification::get_root_partition() const noexcept -> const PartitionModification* {
    auto it = std::ranges::find_if(m_partitions, [](auto&& part) { return part.is_root() && part.status() != ModificationStatus::Delete; });
    return it != m_partitions.end() ? &*it : nullptr;
}

auto DeviceModification::find_partition(std::string_view obj_id) noexcept -> PartitionModification* {
    auto it = std::ranges::find_if(m_partitions, [obj_id](auto&& part) { return part.obj_id() == obj_id; });
    return it != m_partitions.end() ? &*it : nullptr;
}

auto DeviceModification::find_partition(std::string_view obj_id) const noexcept -> const PartitionModification* {
    auto it = std::ranges::find_if(m_partitions, [obj_id](auto&& part) { return part.obj_id() == obj_id; });
    return it != m_partitions.end() ? &*it : nullptr;
}

auto DeviceModification::free_space(Size min_gap) const noexcept -> std::vector<FreeSpaceRegion> {
    return compute_free_space(m_device, m_partitions, m_partition_table, min_gap);
}

auto compute_free_space(const DeviceInfo& device, const std::vector<PartitionModification>& partitions, fs::PartitionTable table, Size min_gap) noexcept -> std::vector<FreeSpaceRegion> {
    std::vector<PartitionExtent> extents{};
    for (const auto& partition : partitions) {
        if (partition.status() == ModificationStatus::Delete) {
            continue;
        }
        extents.push_back(PartitionExtent{.start = partition.start(), .length = partition.length()});
    }
    return compute_free_space(device.geometry(table), std::move(extents), min_gap);
}

}  // namespace strata::disk
