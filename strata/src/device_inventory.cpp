#include "strata/device_inventory.hpp"

#include <algorithm>  // for find, sort
#include <utility>    // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// lsblk START is always counted in 512-byte units
constexpr std::uint64_t KERNEL_SECTOR_BYTES = 512;

auto is_disk_like(const strata::disk::BlockDevice& node) noexcept -> bool {
    if (node.type == "rom"sv || node.type == "part"sv) {
        return false;
    }
    return node.size.value_or(0) > 0;
}

auto build_partition_info(const strata::disk::BlockDevice& node, std::string_view device_path, strata::disk::SectorSize sector_size) noexcept -> strata::disk::PartitionInfo {
    using namespace strata;

    disk::PartitionInfo partition{
        .path        = node.path,
        .device_path = std::string{device_path},
        .partn       = node.partn.value_or(0),
        .part_type   = node.parttype.value_or(""),
        .fs_type     = node.fstype.empty() ? fs::FilesystemType::Unknown : fs::string_to_filesystem_type(node.fstype),
        .start       = disk::Size::bytes(node.start.value_or(0) * KERNEL_SECTOR_BYTES, sector_size),
        .length      = disk::Size::bytes(node.size.value_or(0), sector_size),
        .flags       = fs::flags_from_partition_type(node.parttype.value_or(""), node.partflags.value_or("")),
        .partuuid    = node.partuuid.value_or(""),
        .uuid        = node.uuid,
        .mountpoints = node.mountpoints,
    };

    // each btrfs mount reports the subvolume it exposes as its fs root
    if (partition.fs_type == fs::FilesystemType::Btrfs) {
        const auto count = std::min(node.fsroots.size(), node.mountpoints.size());
        for (std::size_t i = 0; i < count; ++i) {
            if (node.fsroots[i] == "/"sv) {
                continue;
            }
            partition.btrfs_subvols.emplace_back(disk::BtrfsSubvolumeInfo{.name = node.fsroots[i], .mountpoint = node.mountpoints[i]});
        }
    }
    return partition;
}

void collect_nodes(const std::vector<strata::disk::BlockDevice>& nodes, std::vector<const strata::disk::BlockDevice*>& out) noexcept {
    for (const auto& node : nodes) {
        out.push_back(&node);
        collect_nodes(node.children, out);
    }
}

}  // namespace

namespace strata::disk {

auto PartitionInfo::has_flag(fs::PartitionFlag flag) const noexcept -> bool {
    return std::ranges::find(flags, flag) != flags.end();
}

auto PartitionInfo::end_sector() const noexcept -> std::uint64_t {
    const auto sector_bytes = start.sector_size().value;
    const auto start_sector = start.normalize() / sector_bytes;
    const auto sectors      = length.sectors();
    return sectors == 0 ? start_sector : start_sector + sectors - 1;
}

auto DeviceInfo::geometry(fs::PartitionTable fallback_table) const noexcept -> DeviceGeometry {
    return DeviceGeometry{
        .total_size      = total_size,
        .sector_size     = sector_size,
        .partition_table = partition_table.value_or(fallback_table),
    };
}

auto build_device_info(const BlockDevice& node) noexcept -> DeviceInfo {
    const SectorSize sector_size{node.log_sec.value_or(512)};

    DeviceInfo device{
        .model           = node.model.value_or(""),
        .path            = node.path,
        .type            = node.type,
        .total_size      = Size::bytes(node.size.value_or(0), sector_size),
        .sector_size     = sector_size,
        .partition_table = node.pttype ? fs::string_to_partition_table(*node.pttype) : std::nullopt,
        .read_only       = node.read_only,
        .rotational      = node.rota,
    };

    for (const auto& child : node.children) {
        if (child.type != "part"sv) {
            continue;
        }
        device.partitions.emplace_back(build_partition_info(child, node.path, sector_size));
    }
    std::ranges::sort(device.partitions, {}, [](const PartitionInfo& part) { return part.start.normalize(); });

    std::vector<PartitionExtent> extents{};
    extents.reserve(device.partitions.size());
    for (const auto& partition : device.partitions) {
        extents.push_back(PartitionExtent{.start = partition.start, .length = partition.length});
    }
    device.free_space_regions = compute_free_space(device.geometry(), std::move(extents));
    return device;
}

auto DeviceInventory::list_devices() noexcept -> Result<std::vector<DeviceInfo>> {
    m_devices.clear();
    m_nodes.clear();

    auto probed = m_probe.probe();
    if (!probed) {
        spdlog::error("Device probe failed: {}", probed.error().message);
        return std::unexpected(probed.error());
    }

    m_nodes = std::move(*probed);
    for (const auto& node : m_nodes) {
        if (!is_disk_like(node)) {
            continue;
        }
        m_devices.emplace_back(build_device_info(node));
    }
    spdlog::debug("Device inventory: {} devices", m_devices.size());
    return m_devices;
}

auto DeviceInventory::get_device(std::string_view path) const noexcept -> std::optional<DeviceInfo> {
    auto it = std::ranges::find_if(m_devices, [path](auto&& dev) { return dev.path == path; });
    if (it != std::ranges::end(m_devices)) {
        return std::make_optional<DeviceInfo>(*it);
    }
    return std::nullopt;
}

auto DeviceInventory::find_partition(std::string_view path) const noexcept -> std::optional<PartitionInfo> {
    for (const auto& device : m_devices) {
        auto it = std::ranges::find_if(device.partitions, [path](auto&& part) { return part.path == path; });
        if (it != std::ranges::end(device.partitions)) {
            return std::make_optional<PartitionInfo>(*it);
        }
    }
    return std::nullopt;
}

auto DeviceInventory::find_node(std::string_view path) const noexcept -> std::optional<BlockDevice> {
    std::vector<const BlockDevice*> nodes{};
    collect_nodes(m_nodes, nodes);
    auto it = std::ranges::find_if(nodes, [path](auto* node) { return node->path == path || node->name == path; });
    if (it != std::ranges::end(nodes)) {
        // children are irrelevant to callers and can be large
        auto node = **it;
        node.children.clear();
        return std::make_optional<BlockDevice>(std::move(node));
    }
    return std::nullopt;
}

}  // namespace strata::disk
