#include "strata/fstab.hpp"
#include "strata/file_utils.hpp"
#include "strata/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto FSTAB_HEADER = R"(# Static information about the filesystems.
# See fstab(5) for details.

# <file system> <dir> <type> <options> <dump> <pass>
)"sv;

constexpr auto get_check_number(std::string_view mountpoint, strata::fs::FilesystemType fs_type) noexcept -> std::int32_t {
    using strata::fs::FilesystemType;

    // btrfs, xfs and f2fs have no boot-time fsck
    if (fs_type == FilesystemType::Btrfs || fs_type == FilesystemType::Xfs || fs_type == FilesystemType::F2fs || fs_type == FilesystemType::LinuxSwap) {
        return 0;
    }
    if (mountpoint == "/"sv) {
        return 1;
    }
    return 2;
}

}  // namespace

namespace strata::fs {

auto gen_fstab_entry(const mount::MountEntry& entry) noexcept -> std::optional<std::string> {
    // Apparently some FS names named differently in /etc/fstab.
    const auto fstype = get_fstab_fs_name(entry.fs_type);

    std::string device_str{entry.source};
    if (!entry.uuid.empty()) {
        device_str = fmt::format(FMT_COMPILE("UUID={}"), entry.uuid);
    }

    if (entry.fs_type == FilesystemType::LinuxSwap) {
        return std::make_optional<std::string>(fmt::format(FMT_COMPILE("# {}\n{:41} {:<14} {:<7} {:<10} 0 0\n\n"), entry.source, device_str, "none"sv, fstype, "defaults"sv));
    }
    if (entry.mountpoint.empty()) {
        spdlog::warn("fstab: skipping {} without mountpoint", entry.source);
        return std::nullopt;
    }

    auto options = entry.mount_options();
    if (options.empty()) {
        options.emplace_back("defaults");
    }
    const auto check_num = get_check_number(entry.mountpoint, entry.fs_type);
    return std::make_optional<std::string>(fmt::format(FMT_COMPILE("# {}\n{:41} {:<14} {:<7} {:<10} 0 {}\n\n"),
        entry.source, device_str, entry.mountpoint, fstype, utils::join(options, ","), check_num));
}

auto generate_fstab_content(const std::vector<mount::MountEntry>& plan, const std::vector<mount::MountEntry>& swap) noexcept -> std::string {
    std::string fstab_content{FSTAB_HEADER};

    for (const auto& entry : plan) {
        auto fstab_entry = gen_fstab_entry(entry);
        if (!fstab_entry) {
            continue;
        }
        fstab_content += std::move(*fstab_entry);
    }
    for (const auto& entry : swap) {
        auto fstab_entry = gen_fstab_entry(entry);
        if (!fstab_entry) {
            continue;
        }
        fstab_content += std::move(*fstab_entry);
    }

    return fstab_content;
}

auto generate_fstab(const std::vector<mount::MountEntry>& plan, const std::vector<mount::MountEntry>& swap, std::string_view root_mountpoint) noexcept -> bool {
    const auto& fstab_filepath = fmt::format(FMT_COMPILE("{}/etc/fstab"), root_mountpoint);
    const auto& fstab_content  = fs::generate_fstab_content(plan, swap);
    if (!file_utils::create_file_for_overwrite(fstab_filepath, fstab_content)) {
        spdlog::error("Failed to open fstab for writing {}", fstab_filepath);
        return false;
    }
    spdlog::info("Created fstab file:\n{}", fstab_content);
    return true;
}

}  // namespace strata::fs
