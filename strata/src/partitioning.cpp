#include "strata/partitioning.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace strata::disk {

auto gen_sfdisk_line(const PartitionModification& partition, fs::PartitionTable table, SectorSize sector_size) noexcept -> std::string {
    const SizeContext ctx{.sector_size = sector_size};
    const auto start_sectors  = partition.start().convert(Unit::sectors, ctx).value_or(Size{}).value();
    const auto length_sectors = partition.length().convert(Unit::sectors, ctx).value_or(Size{}).value();
    const auto part_type      = fs::get_sfdisk_partition_type(table, partition.fs_type().value_or(fs::FilesystemType::Unknown), partition.flags());

    auto line = fmt::format(FMT_COMPILE("start={}, size={}, type={}"), start_sectors, length_sectors, part_type);

    // bootable is specified as [*|-], with as default not-bootable.
    // Only the MBR active flag is meaningful, GPT marks the ESP through its type.
    if (table == fs::PartitionTable::Mbr && partition.has_flag(fs::PartitionFlag::Boot)) {
        line += ", bootable"sv;
    }
    line += '\n';
    return line;
}

auto gen_wipe_command(std::string_view device) noexcept -> std::vector<std::string> {
    return {"wipefs"s, "--all"s, std::string{device}};
}

auto gen_mklabel_command(std::string_view device, fs::PartitionTable table) noexcept -> std::vector<std::string> {
    return {"parted"s, "--script"s, std::string{device}, "mklabel"s, std::string{fs::partition_table_to_string(table)}};
}

auto gen_sfdisk_append_command(std::string_view device) noexcept -> std::vector<std::string> {
    return {"sfdisk"s, "--append"s, "--no-reread"s, std::string{device}};
}

auto gen_sfdisk_delete_command(std::string_view device, std::uint32_t partn) noexcept -> std::vector<std::string> {
    return {"sfdisk"s, "--no-reread"s, "--delete"s, std::string{device}, fmt::format(FMT_COMPILE("{}"), partn)};
}

auto gen_reread_commands(std::string_view device) noexcept -> std::vector<std::vector<std::string>> {
    return {
        {"udevadm"s, "settle"s},
        {"partprobe"s, std::string{device}},
    };
}

}  // namespace strata::disk
