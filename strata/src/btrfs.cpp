#include "strata/btrfs.hpp"

#include <filesystem>  // for create_directories

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;

namespace {

// same behaviour as os.path.dirname from python
constexpr auto get_dirname(std::string_view full_path) noexcept -> std::string_view {
    if (full_path == "/") {
        return full_path;
    }
    auto pos = full_path.find_last_of('/');
    if (pos == std::string_view::npos) {
        return {};
    }
    return full_path.substr(0, pos);
}

}  // namespace

namespace strata::fs {

auto gen_subvolume_create_command(std::string_view subvolume_path) noexcept -> std::vector<std::string> {
    return {"btrfs"s, "subvolume"s, "create"s, std::string{subvolume_path}};
}

auto btrfs_create_subvols(utils::CommandRunner& runner, const std::vector<disk::SubvolumeModification>& subvols,
    std::string_view device, std::string_view scratch_dir) noexcept -> Result<void> {
    if (subvols.empty()) {
        return {};
    }

    std::error_code err{};
    std::filesystem::create_directories(scratch_dir, err);
    if (err) {
        spdlog::error("Failed to create btrfs scratch directory {}: {}", scratch_dir, err.message());
        return make_error(ErrorKind::CommandFailed, fmt::format(FMT_COMPILE("cannot create {}: {}"), scratch_dir, err.message()), std::string{device}, ProvisionStep::Format);
    }

    const std::vector<std::string> mount_cmd{"mount"s, "-t"s, "btrfs"s, std::string{device}, std::string{scratch_dir}};
    if (auto res = utils::run_checked(runner, mount_cmd, device, ProvisionStep::Format); !res) {
        return std::unexpected(res.error());
    }

    Result<void> status{};
    for (const auto& subvol : subvols) {
        const auto subvol_path = fmt::format(FMT_COMPILE("{}/{}"), scratch_dir, subvol.name);

        // nested subvolumes need their parent directory in place
        const auto parent = get_dirname(subvol.name);
        if (!parent.empty()) {
            std::filesystem::create_directories(fmt::format(FMT_COMPILE("{}/{}"), scratch_dir, parent), err);
            if (err) {
                spdlog::error("Failed to create directories for btrfs subvolume {}: {}", subvol.name, err.message());
                status = make_error(ErrorKind::CommandFailed, fmt::format(FMT_COMPILE("cannot create parent of subvolume {}"), subvol.name), std::string{device}, ProvisionStep::Format);
                break;
            }
        }
        if (auto res = utils::run_checked(runner, gen_subvolume_create_command(subvol_path), device, ProvisionStep::Format); !res) {
            spdlog::error("Failed to create btrfs subvolume {} on {}", subvol.name, device);
            status = std::unexpected(res.error());
            break;
        }
        spdlog::info("Created btrfs subvolume {} on {}", subvol.name, device);
    }

    auto umount_res = utils::run_checked(runner, {"umount"s, std::string{scratch_dir}}, device, ProvisionStep::Format);
    if (!status) {
        return status;
    }
    if (!umount_res) {
        return std::unexpected(umount_res.error());
    }
    return {};
}

}  // namespace strata::fs
