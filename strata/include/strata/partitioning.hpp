#ifndef PARTITIONING_HPP
#define PARTITIONING_HPP

#include "strata/device_model.hpp"
#include "strata/partition_config.hpp"
#include "strata/size.hpp"

#include <cstdint>      // for uint32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::disk {

// Generates the sfdisk script line creating one partition,
// start and size counted in sectors of @p sector_size
auto gen_sfdisk_line(const PartitionModification& partition, fs::PartitionTable table, SectorSize sector_size) noexcept -> std::string;

// Clears every filesystem, RAID and partition-table signature of the device
auto gen_wipe_command(std::string_view device) noexcept -> std::vector<std::string>;

// Writes a fresh, empty partition table
auto gen_mklabel_command(std::string_view device, fs::PartitionTable table) noexcept -> std::vector<std::string>;

// sfdisk reading one partition line from stdin and appending it to the table
auto gen_sfdisk_append_command(std::string_view device) noexcept -> std::vector<std::string>;

auto gen_sfdisk_delete_command(std::string_view device, std::uint32_t partn) noexcept -> std::vector<std::string>;

// Commands making the kernel re-read the table and udev finish creating nodes
auto gen_reread_commands(std::string_view device) noexcept -> std::vector<std::vector<std::string>>;

}  // namespace strata::disk

#endif  // PARTITIONING_HPP
