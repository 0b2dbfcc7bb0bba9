#ifndef FREE_SPACE_HPP
#define FREE_SPACE_HPP

#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <cstdint>  // for uint64_t
#include <vector>   // for vector

namespace strata::disk {

/// @brief Contiguous run of unallocated sectors, both ends inclusive.
struct FreeSpaceRegion final {
    std::uint64_t start_sector{};
    std::uint64_t end_sector{};
    SectorSize sector_size{};

    [[nodiscard]] constexpr auto sector_count() const noexcept -> std::uint64_t { return end_sector - start_sector + 1; }
    [[nodiscard]] auto start() const noexcept -> Size { return Size{start_sector, Unit::sectors, sector_size}; }
    [[nodiscard]] auto end() const noexcept -> Size { return Size{end_sector, Unit::sectors, sector_size}; }
    [[nodiscard]] auto length() const noexcept -> Size { return Size{sector_count(), Unit::sectors, sector_size}; }

    constexpr bool operator==(const FreeSpaceRegion&) const = default;
};

/// @brief Space occupied by one partition, existing or staged.
struct PartitionExtent final {
    Size start{};
    Size length{};
};

/// @brief Whole-device geometry the free space is computed against.
struct DeviceGeometry final {
    Size total_size{};
    SectorSize sector_size{};
    fs::PartitionTable partition_table{fs::PartitionTable::Gpt};
};

/// @brief First sector a partition may start at (1 MiB).
auto first_usable_sector(const DeviceGeometry& geometry) noexcept -> std::uint64_t;

/// @brief Last sector a partition may end at (inclusive).
///
/// GPT keeps the secondary header in the last MiB, MBR may use the whole
/// disk; both are aligned down to 1 MiB.
auto last_usable_sector(const DeviceGeometry& geometry) noexcept -> std::uint64_t;

/// @brief Gaps between partitions within the usable range of a device.
///
/// Partitions are sorted by start sector and the complement is taken within
/// [first_usable_sector, last_usable_sector]. Gaps narrower than @p min_gap are dropped.
/// Pure function: same inputs, same output.
auto compute_free_space(const DeviceGeometry& geometry, std::vector<PartitionExtent> partitions, Size min_gap = Size{1, Unit::MiB}) noexcept -> std::vector<FreeSpaceRegion>;

}  // namespace strata::disk

#endif  // FREE_SPACE_HPP
