#include "strata/leaf_target.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace strata::provision {

auto leaf_device_path(const LeafTarget& leaf) noexcept -> std::optional<std::string> {
    return std::visit([](auto&& target) -> std::optional<std::string> {
        using T = std::remove_cvref_t<decltype(target)>;
        if constexpr (std::is_same_v<T, RawPartition>) {
            return target.partition->dev_path();
        } else if constexpr (std::is_same_v<T, LvmVolumeTarget>) {
            return target.volume->dev_path();
        } else {
            return target.mapper_path;
        }
    },
        leaf);
}

auto leaf_object_id(const LeafTarget& leaf) noexcept -> std::string {
    return visit_model(leaf, [](auto&& model) { return std::string{model.obj_id()}; });
}

auto leaf_fs_type(const LeafTarget& leaf) noexcept -> std::optional<fs::FilesystemType> {
    return visit_model(leaf, [](auto&& model) { return model.fs_type(); });
}

auto leaf_is_formattable(const LeafTarget& leaf) noexcept -> bool {
    return visit_model(leaf, [](auto&& model) { return model.is_create_or_modify() && model.fs_type().has_value(); });
}

auto leaf_subvolumes(const LeafTarget& leaf) noexcept -> std::vector<disk::SubvolumeModification> {
    return visit_model(leaf, [](auto&& model) { return model.btrfs_subvols(); });
}

auto leaf_uuid(const LeafTarget& leaf) noexcept -> std::optional<std::string> {
    return visit_model(leaf, [](auto&& model) { return model.uuid(); });
}

void leaf_set_uuid(LeafTarget& leaf, std::string uuid) noexcept {
    visit_model(leaf, [&uuid](auto&& model) { model.set_uuid(std::move(uuid)); });
}

auto leaf_mount_entries(const LeafTarget& leaf) noexcept -> std::vector<mount::MountEntry> {
    std::vector<mount::MountEntry> entries{};
    const auto source  = leaf_device_path(leaf);
    const auto fs_type = leaf_fs_type(leaf);
    if (!source || !fs_type || *fs_type == fs::FilesystemType::LinuxSwap) {
        return entries;
    }

    const auto object_id = leaf_object_id(leaf);
    const auto uuid      = leaf_uuid(leaf).value_or("");
    const auto options   = visit_model(leaf, [](auto&& model) { return model.mount_options(); });
    const auto subvols   = leaf_subvolumes(leaf);

    bool mounts_subvolume{false};
    for (const auto& subvol : subvols) {
        if (subvol.mountpoint.empty()) {
            continue;
        }
        auto subvol_options = options;
        for (auto&& option : subvol.mount_options()) {
            subvol_options.push_back(std::move(option));
        }
        entries.emplace_back(mount::MountEntry{
            .source     = *source,
            .mountpoint = subvol.mountpoint,
            .fs_type    = *fs_type,
            .options    = disk::normalize_mount_options(subvol_options),
            .subvolume  = subvol.name,
            .uuid       = uuid,
            .object_id  = object_id,
        });
        mounts_subvolume = true;
    }

    const auto mountpoint = visit_model(leaf, [](auto&& model) { return model.mountpoint(); });
    if (mountpoint && !mounts_subvolume) {
        entries.emplace_back(mount::MountEntry{
            .source     = *source,
            .mountpoint = *mountpoint,
            .fs_type    = *fs_type,
            .options    = options,
            .uuid       = uuid,
            .object_id  = object_id,
        });
    }
    return entries;
}

auto leaf_swap_entry(const LeafTarget& leaf) noexcept -> std::optional<mount::MountEntry> {
    const auto source  = leaf_device_path(leaf);
    const auto fs_type = leaf_fs_type(leaf);
    if (!source || fs_type != fs::FilesystemType::LinuxSwap) {
        return std::nullopt;
    }
    return mount::MountEntry{
        .source    = *source,
        .fs_type   = fs::FilesystemType::LinuxSwap,
        .uuid      = leaf_uuid(leaf).value_or(""),
        .object_id = leaf_object_id(leaf),
    };
}

}  // namespace strata::provision
