#include "strata/mount_partitions.hpp"
#include "strata/string_utils.hpp"

#include <algorithm>  // for count, sort
#include <set>        // for set
#include <tuple>      // for tuple

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace strata::mount {

auto MountEntry::mount_options() const noexcept -> std::vector<std::string> {
    std::vector<std::string> result{};
    if (subvolume) {
        result.emplace_back(fmt::format(FMT_COMPILE("subvol={}"), *subvolume));
    }
    for (const auto& option : options) {
        if (!option.starts_with("subvol="sv)) {
            result.push_back(option);
        }
    }
    return result;
}

auto mountpoint_depth(std::string_view mountpoint) noexcept -> std::size_t {
    std::size_t depth{};
    bool in_component{false};
    for (const char ch : mountpoint) {
        if (ch == '/') {
            in_component = false;
        } else if (!in_component) {
            in_component = true;
            ++depth;
        }
    }
    return depth;
}

auto compute_mount_plan(std::vector<MountEntry> entries) noexcept -> Result<std::vector<MountEntry>> {
    std::set<std::string_view> seen{};
    for (const auto& entry : entries) {
        if (!entry.mountpoint.starts_with('/')) {
            return make_error(ErrorKind::InvalidMountOrder,
                fmt::format(FMT_COMPILE("mountpoint '{}' is not absolute"), entry.mountpoint), entry.source, ProvisionStep::MountPlan);
        }
        if (!seen.insert(entry.mountpoint).second) {
            return make_error(ErrorKind::InvalidMountOrder,
                fmt::format(FMT_COMPILE("mountpoint '{}' is used more than once"), entry.mountpoint), entry.source, ProvisionStep::MountPlan);
        }
    }

    std::ranges::sort(entries, {}, [](const MountEntry& entry) {
        return std::tuple{mountpoint_depth(entry.mountpoint), entry.subvolume.has_value(), std::string_view{entry.mountpoint}};
    });

    if (entries.empty() || entries.front().mountpoint != "/"sv) {
        return make_error(ErrorKind::InvalidMountOrder, "nothing is mounted at /", {}, ProvisionStep::MountPlan);
    }

    for (const auto& entry : entries) {
        spdlog::debug("[mount plan] {} -> {}{}", entry.source, entry.mountpoint,
            entry.subvolume ? fmt::format(FMT_COMPILE(" (subvol {})"), *entry.subvolume) : std::string{});
    }
    return entries;
}

auto target_path(std::string_view target_root, std::string_view mountpoint) noexcept -> std::string {
    while (target_root.size() > 1 && target_root.ends_with('/')) {
        target_root.remove_suffix(1);
    }
    if (mountpoint == "/"sv) {
        return std::string{target_root};
    }
    if (target_root == "/"sv) {
        return std::string{mountpoint};
    }
    return fmt::format(FMT_COMPILE("{}{}"), target_root, mountpoint);
}

auto gen_mount_command(const MountEntry& entry, std::string_view target_root) noexcept -> std::vector<std::string> {
    std::vector<std::string> cmd{"mount"s, "-t"s, std::string{fs::get_mount_fs_name(entry.fs_type)}};
    const auto options = entry.mount_options();
    if (!options.empty()) {
        cmd.emplace_back("-o"s);
        cmd.emplace_back(utils::join(options, ","));
    }
    cmd.push_back(entry.source);
    cmd.emplace_back(target_path(target_root, entry.mountpoint));
    return cmd;
}

auto gen_umount_command(std::string_view path) noexcept -> std::vector<std::string> {
    return {"umount"s, "--recursive"s, std::string{path}};
}

}  // namespace strata::mount
