#include "strata/free_space.hpp"

#include <algorithm>  // for sort, max

namespace strata::disk {

auto first_usable_sector(const DeviceGeometry& geometry) noexcept -> std::uint64_t {
    return Size{1, Unit::MiB, geometry.sector_size}.sectors();
}

auto last_usable_sector(const DeviceGeometry& geometry) noexcept -> std::uint64_t {
    const auto usable_end = (geometry.partition_table == fs::PartitionTable::Gpt)
        ? geometry.total_size.gpt_end()
        : geometry.total_size.align();
    const auto end_sectors = usable_end.normalize() / geometry.sector_size.value;
    return end_sectors == 0 ? 0 : end_sectors - 1;
}

auto compute_free_space(const DeviceGeometry& geometry, std::vector<PartitionExtent> partitions, Size min_gap) noexcept -> std::vector<FreeSpaceRegion> {
    std::vector<FreeSpaceRegion> regions{};
    if (geometry.sector_size.value == 0) {
        return regions;
    }

    const auto first_sector = first_usable_sector(geometry);
    const auto last_sector  = last_usable_sector(geometry);
    if (last_sector < first_sector) {
        return regions;
    }
    const auto min_sectors = min_gap.convert(Unit::sectors, {.sector_size = geometry.sector_size}).value_or(Size{}).value();

    std::ranges::sort(partitions, {}, [](const PartitionExtent& extent) { return extent.start.normalize(); });

    const auto add_region = [&](std::uint64_t start, std::uint64_t end) {
        if (end < start) {
            return;
        }
        const FreeSpaceRegion region{.start_sector = start, .end_sector = end, .sector_size = geometry.sector_size};
        if (region.sector_count() < min_sectors) {
            return;
        }
        regions.push_back(region);
    };

    auto cursor = first_sector;
    for (const auto& extent : partitions) {
        const auto start_sector   = extent.start.normalize() / geometry.sector_size.value;
        const auto length_sectors = extent.length.convert(Unit::sectors, {.sector_size = geometry.sector_size}).value_or(Size{}).value();
        if (length_sectors == 0) {
            continue;
        }
        const auto end_sector = start_sector + length_sectors - 1;

        if (start_sector > cursor) {
            add_region(cursor, std::min(start_sector - 1, last_sector));
        }
        cursor = std::max(cursor, end_sector + 1);
        if (cursor > last_sector) {
            return regions;
        }
    }
    add_region(cursor, last_sector);
    return regions;
}

}  // namespace strata::disk
