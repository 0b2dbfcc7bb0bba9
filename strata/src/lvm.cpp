#include "strata/lvm.hpp"

#include <algorithm>  // for any_of, count_if, find, find_if
#include <charconv>   // for from_chars

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace {

// device-mapper escapes dashes inside VG/LV names by doubling them
auto escape_dm_name(std::string_view name) noexcept -> std::string {
    std::string escaped{};
    for (const char ch : name) {
        escaped += ch;
        if (ch == '-') {
            escaped += '-';
        }
    }
    return escaped;
}

// names lvm refuses or uses itself
auto is_reserved_lv_name(std::string_view name) noexcept -> bool {
    return name == "."sv || name == ".."sv || name == "snapshot"sv || name == "pvmove"sv;
}

}  // namespace

namespace strata::lvm {

auto LvmVolume::create(LvmVolumeSpec spec) noexcept -> Result<LvmVolume> {
    if (spec.name.empty() || is_reserved_lv_name(spec.name)) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("invalid logical volume name '{}'"), spec.name));
    }
    if (spec.mountpoint && !spec.mountpoint->starts_with('/')) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("logical volume '{}' mountpoint must be an absolute path"), spec.name));
    }
    if (auto res = disk::validate_subvolumes(spec.btrfs_subvols); !res) {
        return std::unexpected(res.error());
    }
    if (!spec.obj_id || spec.obj_id->empty()) {
        spec.obj_id = disk::generate_object_id();
    }
    spec.mount_options = disk::normalize_mount_options(spec.mount_options);
    return LvmVolume{std::move(spec)};
}

auto LvmVolume::is_root() const noexcept -> bool {
    if (m_spec.mountpoint == "/"sv) {
        return true;
    }
    return std::ranges::any_of(m_spec.btrfs_subvols, [](auto&& subvol) { return subvol.mountpoint == "/"sv; });
}

auto LvmVolume::is_create_or_modify() const noexcept -> bool {
    return m_spec.status == disk::ModificationStatus::Create || m_spec.status == disk::ModificationStatus::Modify;
}

auto LvmVolume::mapper_name(std::string_view vg_name) const noexcept -> std::string {
    return fmt::format(FMT_COMPILE("luks-{}-{}"), escape_dm_name(vg_name), escape_dm_name(m_spec.name));
}

auto LvmVolumeGroup::create(std::string name, std::vector<disk::ObjectId> pvs, std::vector<LvmVolume> volumes) noexcept -> Result<LvmVolumeGroup> {
    if (name.empty()) {
        return make_error(ErrorKind::InvalidState, "volume group requires a name");
    }
    if (pvs.empty()) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("volume group '{}' has no physical volumes"), name));
    }
    for (const auto& pv : pvs) {
        if (std::ranges::count(pvs, pv) > 1) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("volume group '{}' lists physical volume {} twice"), name, pv));
        }
    }
    for (const auto& volume : volumes) {
        const auto same_name = std::ranges::count_if(volumes, [&volume](auto&& other) { return other.name() == volume.name(); });
        if (same_name > 1) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("volume group '{}' has two volumes named '{}'"), name, volume.name()));
        }
    }
    return LvmVolumeGroup{std::move(name), std::move(pvs), std::move(volumes)};
}

auto LvmConfiguration::create(std::vector<LvmVolumeGroup> vol_groups) noexcept -> Result<LvmConfiguration> {
    for (std::size_t i = 0; i < vol_groups.size(); ++i) {
        for (std::size_t j = i + 1; j < vol_groups.size(); ++j) {
            const auto& lhs = vol_groups[i];
            const auto& rhs = vol_groups[j];
            if (lhs.name() == rhs.name()) {
                return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("volume group name '{}' is used twice"), lhs.name()));
            }
            for (const auto& pv : lhs.pvs()) {
                if (std::ranges::find(rhs.pvs(), pv) != rhs.pvs().end()) {
                    return make_error(ErrorKind::InvalidState,
                        fmt::format(FMT_COMPILE("physical volume {} is shared by volume groups '{}' and '{}'"), pv, lhs.name(), rhs.name()), pv);
                }
            }
        }
    }
    return LvmConfiguration{std::move(vol_groups)};
}

auto LvmConfiguration::find_volume(std::string_view obj_id) noexcept -> LvmVolume* {
    for (auto& group : m_vol_groups) {
        auto it = std::ranges::find_if(group.volumes(), [obj_id](auto&& vol) { return vol.obj_id() == obj_id; });
        if (it != group.volumes().end()) {
            return &*it;
        }
    }
    return nullptr;
}

auto LvmConfiguration::find_volume(std::string_view obj_id) const noexcept -> const LvmVolume* {
    for (const auto& group : m_vol_groups) {
        auto it = std::ranges::find_if(group.volumes(), [obj_id](auto&& vol) { return vol.obj_id() == obj_id; });
        if (it != group.volumes().end()) {
            return &*it;
        }
    }
    return nullptr;
}

auto LvmConfiguration::find_group_of(std::string_view obj_id) const noexcept -> const LvmVolumeGroup* {
    for (const auto& group : m_vol_groups) {
        if (std::ranges::any_of(group.volumes(), [obj_id](auto&& vol) { return vol.obj_id() == obj_id; })) {
            return &group;
        }
    }
    return nullptr;
}

auto LvmConfiguration::is_pv(std::string_view obj_id) const noexcept -> bool {
    return std::ranges::any_of(m_vol_groups, [obj_id](auto&& group) {
        return std::ranges::find(group.pvs(), obj_id) != group.pvs().end();
    });
}

auto lvm_mapper_path(std::string_view vg_name, std::string_view lv_name) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), escape_dm_name(vg_name), escape_dm_name(lv_name));
}

auto gen_pvcreate_command(const std::vector<std::string>& pv_paths) noexcept -> std::vector<std::string> {
    std::vector<std::string> cmd{"pvcreate"s, "--yes"s};
    cmd.insert(cmd.end(), pv_paths.begin(), pv_paths.end());
    return cmd;
}

auto gen_vgcreate_command(std::string_view vg_name, const std::vector<std::string>& pv_paths) noexcept -> std::vector<std::string> {
    std::vector<std::string> cmd{"vgcreate"s, "--yes"s, std::string{vg_name}};
    cmd.insert(cmd.end(), pv_paths.begin(), pv_paths.end());
    return cmd;
}

auto gen_lvcreate_command(std::string_view vg_name, std::string_view lv_name, const disk::Size& length) noexcept -> std::vector<std::string> {
    return {"lvcreate"s, "--yes"s, "-L"s, fmt::format(FMT_COMPILE("{}B"), length.normalize()), std::string{vg_name}, "-n"s, std::string{lv_name}};
}

auto gen_vg_report_command(std::string_view vg_name) noexcept -> std::vector<std::string> {
    return {"vgs"s, "--reportformat"s, "json"s, "--units"s, "b"s, "--nosuffix"s, "-o"s, "vg_name,vg_size,vg_free"s, std::string{vg_name}};
}

auto parse_vg_free_bytes(std::string_view report_json, std::string_view vg_name) noexcept -> std::optional<std::uint64_t> {
    rapidjson::Document doc;
    doc.Parse(report_json.data(), report_json.size());
    if (doc.HasParseError() || !doc.IsObject() || !doc.HasMember("report") || !doc["report"].IsArray()) {
        spdlog::error("Failed to parse vgs report for {}", vg_name);
        return std::nullopt;
    }

    for (const auto& report : doc["report"].GetArray()) {
        if (!report.IsObject() || !report.HasMember("vg") || !report["vg"].IsArray()) {
            continue;
        }
        for (const auto& vg : report["vg"].GetArray()) {
            if (!vg.HasMember("vg_name") || !vg["vg_name"].IsString() || vg["vg_name"].GetString() != vg_name) {
                continue;
            }
            if (!vg.HasMember("vg_free") || !vg["vg_free"].IsString()) {
                return std::nullopt;
            }
            std::string_view free_str{vg["vg_free"].GetString(), vg["vg_free"].GetStringLength()};
            // older lvm2 keeps the unit suffix even with --nosuffix in json mode
            if (free_str.ends_with('B')) {
                free_str.remove_suffix(1);
            }
            std::uint64_t free_bytes{};
            const auto [ptr, ec] = std::from_chars(free_str.data(), free_str.data() + free_str.size(), free_bytes);
            if (ec != std::errc{}) {
                return std::nullopt;
            }
            return free_bytes;
        }
    }
    return std::nullopt;
}

}  // namespace strata::lvm
