#include "fake_system.hpp"

#include "strata/logger.hpp"

#include <algorithm>  // for find, find_if, erase_if, max
#include <cctype>     // for isdigit
#include <charconv>   // for from_chars
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

auto parse_uint(std::string_view str) noexcept -> std::uint64_t {
    std::uint64_t value{};
    std::from_chars(str.data(), str.data() + str.size(), value);
    return value;
}

// "start=2048, size=4096, type=..., bootable"
auto sfdisk_field(std::string_view line, std::string_view key) noexcept -> std::string_view {
    const auto pos = line.find(fmt::format(FMT_COMPILE("{}="), key));
    if (pos == std::string_view::npos) {
        return {};
    }
    auto value = line.substr(pos + key.size() + 1);
    return value.substr(0, value.find_first_of(",\n"));
}

auto partition_path(std::string_view disk_path, std::uint32_t partn) noexcept -> std::string {
    const bool needs_separator = !disk_path.empty() && std::isdigit(static_cast<unsigned char>(disk_path.back())) != 0;
    return fmt::format(FMT_COMPILE("{}{}{}"), disk_path, needs_separator ? "p"sv : ""sv, partn);
}

auto mkfs_fstype(std::string_view program) noexcept -> std::string {
    if (program == "mkswap"sv) {
        return "swap"s;
    }
    if (program == "mkfs.fat"sv) {
        return "vfat"s;
    }
    if (program.starts_with("mkfs."sv)) {
        return std::string{program.substr(5)};
    }
    return {};
}

}  // namespace

namespace strata::test {

void install_null_logger() noexcept {
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);
    logger::set_logger(logger);
}

auto blank_device(std::string_view path, disk::Size total_size, std::uint64_t sector_size, std::optional<fs::PartitionTable> table) noexcept -> disk::DeviceInfo {
    disk::DeviceInfo device{
        .model           = "Fake Disk"s,
        .path            = std::string{path},
        .type            = "disk"s,
        .total_size      = disk::Size::bytes(total_size.normalize(), disk::SectorSize{sector_size}),
        .sector_size     = disk::SectorSize{sector_size},
        .partition_table = table,
    };
    device.free_space_regions = disk::compute_free_space(device.geometry(), {});
    return device;
}

void FakeSystem::add_disk(FakeDisk disk) noexcept {
    m_disks.emplace_back(std::move(disk));
}

auto FakeSystem::disk(std::string_view path) noexcept -> FakeDisk* {
    auto it = std::ranges::find_if(m_disks, [path](auto&& disk) { return disk.path == path; });
    return it != m_disks.end() ? &*it : nullptr;
}

auto FakeSystem::mapper(std::string_view path) noexcept -> FakeMapper* {
    auto it = std::ranges::find_if(m_mappers, [path](auto&& mapper) { return mapper.path == path; });
    return it != m_mappers.end() ? &*it : nullptr;
}

auto FakeSystem::commands_of(std::string_view program) const noexcept -> std::vector<RecordedCommand> {
    std::vector<RecordedCommand> result{};
    for (const auto& cmd : m_commands) {
        if (!cmd.args.empty() && cmd.args.front() == program) {
            result.push_back(cmd);
        }
    }
    return result;
}

auto FakeSystem::index_of(const std::vector<std::string>& prefix) const noexcept -> std::int64_t {
    for (std::size_t i = 0; i < m_commands.size(); ++i) {
        const auto& args = m_commands[i].args;
        if (args.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), args.begin())) {
            return static_cast<std::int64_t>(i);
        }
    }
    return -1;
}

auto FakeSystem::next_uuid() noexcept -> std::string {
    ++m_uuid_counter;
    return fmt::format(FMT_COMPILE("00000000-0000-4000-8000-{:012x}"), m_uuid_counter);
}

auto FakeSystem::find_fs_holder(std::string_view path, std::string** fstype, std::string** uuid, std::vector<std::string>** mountpoints) noexcept -> bool {
    for (auto& disk : m_disks) {
        for (auto& part : disk.partitions) {
            if (part.path == path) {
                *fstype      = &part.fstype;
                *uuid        = &part.uuid;
                *mountpoints = &part.mountpoints;
                return true;
            }
        }
    }
    if (auto* node = mapper(path); node != nullptr) {
        *fstype      = &node->fstype;
        *uuid        = &node->uuid;
        *mountpoints = &node->mountpoints;
        return true;
    }
    return false;
}

auto FakeSystem::run(const std::vector<std::string>& args, std::string_view input) noexcept -> utils::CommandResult {
    m_commands.emplace_back(RecordedCommand{.args = args, .input = std::string{input}});
    if (args.empty()) {
        return {.exit_code = 127};
    }
    const auto& program = args.front();
    if (auto it = failing_programs.find(program); it != failing_programs.end()) {
        return {.exit_code = it->second};
    }

    std::string* fstype{};
    std::string* uuid{};
    std::vector<std::string>* mountpoints{};

    if (program == "wipefs"sv) {
        if (auto* target = disk(args.back()); target != nullptr) {
            target->pttype.reset();
            target->partitions.clear();
        }
    } else if (program == "parted"sv && args.size() >= 5 && args[3] == "mklabel"sv) {
        if (auto* target = disk(args[2]); target != nullptr) {
            target->pttype = args[4] == "gpt"sv ? "gpt"s : "dos"s;
            target->partitions.clear();
        }
    } else if (program == "sfdisk"sv && std::ranges::find(args, "--append"s) != args.end()) {
        auto* target = disk(args.back());
        if (target == nullptr) {
            return {.exit_code = 1};
        }
        std::uint32_t partn{1};
        for (const auto& part : target->partitions) {
            partn = std::max(partn, part.partn + 1);
        }
        target->partitions.emplace_back(FakePartition{
            .path           = partition_path(target->path, partn),
            .partn          = partn,
            .start_bytes    = parse_uint(sfdisk_field(input, "start"sv)) * target->sector_size,
            .size_bytes     = parse_uint(sfdisk_field(input, "size"sv)) * target->sector_size,
            .partuuid       = fmt::format(FMT_COMPILE("partuuid-{}"), next_uuid()),
            .parttype       = std::string{sfdisk_field(input, "type"sv)},
            .hidden_probes  = partitions_never_appear ? UINT32_MAX : partition_delay,
            .hidden_rescans = partition_rescans,
        });
    } else if (program == "partprobe"sv) {
        if (auto* target = disk(args.back()); target != nullptr) {
            for (auto& part : target->partitions) {
                if (part.hidden_rescans > 0) {
                    --part.hidden_rescans;
                }
            }
        }
    } else if (program == "sfdisk"sv && std::ranges::find(args, "--delete"s) != args.end()) {
        auto* target = disk(args[args.size() - 2]);
        if (target == nullptr) {
            return {.exit_code = 1};
        }
        const auto partn = static_cast<std::uint32_t>(parse_uint(args.back()));
        std::erase_if(target->partitions, [partn](auto&& part) { return part.partn == partn; });
    } else if (program.starts_with("mkfs."sv) || program == "mkswap"sv) {
        if (!find_fs_holder(args.back(), &fstype, &uuid, &mountpoints)) {
            return {.exit_code = 1};
        }
        *fstype = mkfs_fstype(program);
        *uuid   = next_uuid();
    } else if (program == "cryptsetup"sv && std::ranges::find(args, "luksFormat"s) != args.end()) {
        if (!find_fs_holder(args.back(), &fstype, &uuid, &mountpoints)) {
            return {.exit_code = 1};
        }
        *fstype = "crypto_LUKS"s;
        *uuid   = next_uuid();
    } else if (program == "cryptsetup"sv && args.size() >= 4 && args[1] == "open"sv) {
        m_mappers.emplace_back(FakeMapper{.path = fmt::format(FMT_COMPILE("/dev/mapper/{}"), args[3]), .type = "crypt"s, .parent = args[2]});
    } else if (program == "vgcreate"sv) {
        FakeVolumeGroup group{};
        for (std::size_t i = 3; i < args.size(); ++i) {
            group.pvs.push_back(args[i]);
            for (const auto& disk : m_disks) {
                for (const auto& part : disk.partitions) {
                    if (part.path == args[i]) {
                        group.size_bytes += part.size_bytes;
                    }
                }
            }
            // mapper PVs are as large as their backing partition
            if (const auto* node = mapper(args[i]); node != nullptr) {
                for (const auto& disk : m_disks) {
                    for (const auto& part : disk.partitions) {
                        if (part.path == node->parent) {
                            group.size_bytes += part.size_bytes;
                        }
                    }
                }
            }
        }
        group.size_bytes -= std::min(group.size_bytes, vg_metadata_bytes);
        group.free_bytes = group.size_bytes;
        m_vol_groups[args[2]] = std::move(group);
    } else if (program == "vgs"sv) {
        const auto& name = args.back();
        auto it          = m_vol_groups.find(name);
        if (it == m_vol_groups.end()) {
            return {.exit_code = 5};
        }
        return {.exit_code = 0, .output = fmt::format(R"({{"report": [{{"vg": [{{"vg_name":"{}", "vg_size":"{}B", "vg_free":"{}B"}}]}}]}})",
                                    name, it->second.size_bytes, it->second.free_bytes)};
    } else if (program == "lvcreate"sv && args.size() >= 7) {
        // lvcreate --yes -L <bytes>B <vg> -n <name>
        auto it = m_vol_groups.find(args[4]);
        if (it == m_vol_groups.end()) {
            return {.exit_code = 5};
        }
        auto length = std::string_view{args[3]};
        length.remove_suffix(1);
        const auto bytes = parse_uint(length);
        if (bytes > it->second.free_bytes) {
            return {.exit_code = 5};
        }
        it->second.free_bytes -= bytes;
        std::string escaped_vg{};
        std::string escaped_lv{};
        for (const char ch : args[4]) {
            escaped_vg += ch == '-' ? "--"s : std::string(1, ch);
        }
        for (const char ch : args[6]) {
            escaped_lv += ch == '-' ? "--"s : std::string(1, ch);
        }
        m_mappers.emplace_back(FakeMapper{
            .path       = fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), escaped_vg, escaped_lv),
            .type       = "lvm"s,
            .parent     = it->second.pvs.front(),
            .size_bytes = bytes,
        });
    } else if (program == "mount"sv) {
        // mount -t <fs> [-o <opts>] <source> <target>
        const auto& source = args[args.size() - 2];
        if (!find_fs_holder(source, &fstype, &uuid, &mountpoints)) {
            return {.exit_code = 32};
        }
        if (!mounts_never_appear) {
            mountpoints->push_back(args.back());
        }
    } else if (program == "umount"sv) {
        const auto& target = args.back();
        for (auto& disk : m_disks) {
            for (auto& part : disk.partitions) {
                std::erase_if(part.mountpoints, [&target](auto&& mp) { return mp.starts_with(target); });
            }
        }
        for (auto& node : m_mappers) {
            std::erase_if(node.mountpoints, [&target](auto&& mp) { return mp.starts_with(target); });
        }
    }
    return {.exit_code = 0};
}

auto FakeSystem::probe() noexcept -> Result<std::vector<disk::BlockDevice>> {
    // mappers stack on partitions or other mappers
    auto stacked_on = [this](const std::string& parent_path, auto&& self) -> std::vector<disk::BlockDevice> {
        std::vector<disk::BlockDevice> children{};
        for (const auto& node : m_mappers) {
            if (node.parent != parent_path || mappers_never_appear) {
                continue;
            }
            children.emplace_back(disk::BlockDevice{
                .name        = node.path,
                .path        = node.path,
                .type        = node.type,
                .fstype      = node.fstype,
                .uuid        = node.uuid,
                .pkname      = parent_path,
                .size        = node.size_bytes,
                .mountpoints = node.mountpoints,
                .children    = self(node.path, self),
            });
        }
        return children;
    };

    std::vector<disk::BlockDevice> devices{};
    for (auto& disk : m_disks) {
        disk::BlockDevice node{
            .name    = disk.path,
            .path    = disk.path,
            .type    = "disk"s,
            .model   = "Fake Disk"s,
            .pttype  = disk.pttype,
            .size    = disk.size_bytes,
            .log_sec = disk.sector_size,
        };
        for (auto& part : disk.partitions) {
            if (part.hidden_rescans > 0) {
                continue;
            }
            if (part.hidden_probes > 0) {
                if (part.hidden_probes != UINT32_MAX) {
                    --part.hidden_probes;
                }
                continue;
            }
            node.children.emplace_back(disk::BlockDevice{
                .name        = part.path,
                .path        = part.path,
                .type        = "part"s,
                .fstype      = part.fstype,
                .uuid        = part.uuid,
                .pkname      = disk.path,
                .partuuid    = part.partuuid,
                .parttype    = part.parttype,
                .size        = part.size_bytes,
                .start       = part.start_bytes / 512,
                .log_sec     = disk.sector_size,
                .partn       = part.partn,
                .mountpoints = part.mountpoints,
                .children    = stacked_on(part.path, stacked_on),
            });
        }
        devices.emplace_back(std::move(node));
    }
    return devices;
}

}  // namespace strata::test
