#include "strata/layout_json.hpp"

#include <utility>  // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

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

using namespace strata::disk;
using strata::ErrorKind;
using strata::Result;
using strata::make_error;
using Allocator = rapidjson::Document::AllocatorType;

constexpr auto LVM_CONFIG_TYPE = "default"sv;

auto make_string(std::string_view str, Allocator& alloc) noexcept -> rapidjson::Value {
    return rapidjson::Value(str.data(), static_cast<rapidjson::SizeType>(str.size()), alloc);
}

auto make_optional_string(const std::optional<std::string>& str, Allocator& alloc) noexcept -> rapidjson::Value {
    if (!str) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return make_string(*str, alloc);
}

auto make_string_array(const std::vector<std::string>& strings, Allocator& alloc) noexcept -> rapidjson::Value {
    rapidjson::Value array(rapidjson::kArrayType);
    for (const auto& str : strings) {
        array.PushBack(make_string(str, alloc), alloc);
    }
    return array;
}

auto make_fs_type(const std::optional<strata::fs::FilesystemType>& fs_type, Allocator& alloc) noexcept -> rapidjson::Value {
    if (!fs_type) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return make_string(strata::fs::filesystem_type_to_string(*fs_type), alloc);
}

auto make_size(const Size& size, Allocator& alloc) noexcept -> rapidjson::Value {
    // percentages only make sense against the device they were taken from
    const auto stored = size.unit() == Unit::percent ? Size::bytes(size.normalize(), size.sector_size()) : size;

    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("value", rapidjson::Value(stored.value()), alloc);
    value.AddMember("unit", make_string(unit_to_string(stored.unit()), alloc), alloc);
    value.AddMember("sector_size", rapidjson::Value(stored.sector_size().value), alloc);
    return value;
}

auto make_subvolumes(const std::vector<SubvolumeModification>& subvols, Allocator& alloc) noexcept -> rapidjson::Value {
    rapidjson::Value array(rapidjson::kArrayType);
    for (const auto& subvol : subvols) {
        rapidjson::Value value(rapidjson::kObjectType);
        value.AddMember("name", make_string(subvol.name, alloc), alloc);
        value.AddMember("mountpoint", make_string(subvol.mountpoint, alloc), alloc);
        value.AddMember("compress", subvol.compress, alloc);
        value.AddMember("nodatacow", subvol.nodatacow, alloc);
        array.PushBack(value, alloc);
    }
    return array;
}

auto make_partition(const PartitionModification& part, Allocator& alloc) noexcept -> rapidjson::Value {
    rapidjson::Value flags(rapidjson::kArrayType);
    for (const auto flag : part.flags()) {
        flags.PushBack(make_string(strata::fs::partition_flag_to_string(flag), alloc), alloc);
    }

    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("obj_id", make_string(part.obj_id(), alloc), alloc);
    value.AddMember("status", make_string(modification_status_to_string(part.status()), alloc), alloc);
    value.AddMember("type", make_string(partition_type_to_string(part.type()), alloc), alloc);
    value.AddMember("start", make_size(part.start(), alloc), alloc);
    value.AddMember("size", make_size(part.length(), alloc), alloc);
    value.AddMember("fs_type", make_fs_type(part.fs_type(), alloc), alloc);
    value.AddMember("mountpoint", make_optional_string(part.mountpoint(), alloc), alloc);
    value.AddMember("mount_options", make_string_array(part.mount_options(), alloc), alloc);
    value.AddMember("flags", flags, alloc);
    value.AddMember("dev_path", make_optional_string(part.dev_path(), alloc), alloc);
    value.AddMember("btrfs", make_subvolumes(part.btrfs_subvols(), alloc), alloc);
    return value;
}

auto make_lvm_config(const strata::lvm::LvmConfiguration& lvm_config, Allocator& alloc) noexcept -> rapidjson::Value {
    rapidjson::Value vol_groups(rapidjson::kArrayType);
    for (const auto& vol_group : lvm_config.vol_groups()) {
        rapidjson::Value volumes(rapidjson::kArrayType);
        for (const auto& volume : vol_group.volumes()) {
            rapidjson::Value vol(rapidjson::kObjectType);
            vol.AddMember("obj_id", make_string(volume.obj_id(), alloc), alloc);
            vol.AddMember("status", make_string(modification_status_to_string(volume.status()), alloc), alloc);
            vol.AddMember("name", make_string(volume.name(), alloc), alloc);
            vol.AddMember("fs_type", make_fs_type(volume.fs_type(), alloc), alloc);
            vol.AddMember("length", make_size(volume.length(), alloc), alloc);
            vol.AddMember("mountpoint", make_optional_string(volume.mountpoint(), alloc), alloc);
            vol.AddMember("mount_options", make_string_array(volume.mount_options(), alloc), alloc);
            vol.AddMember("btrfs", make_subvolumes(volume.btrfs_subvols(), alloc), alloc);
            volumes.PushBack(vol, alloc);
        }

        rapidjson::Value group(rapidjson::kObjectType);
        group.AddMember("name", make_string(vol_group.name(), alloc), alloc);
        group.AddMember("lvm_pvs", make_string_array(vol_group.pvs(), alloc), alloc);
        group.AddMember("volumes", volumes, alloc);
        vol_groups.PushBack(group, alloc);
    }

    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("config_type", make_string(LVM_CONFIG_TYPE, alloc), alloc);
    value.AddMember("vol_groups", vol_groups, alloc);
    return value;
}

auto make_encryption(const strata::crypto::DiskEncryption& encryption, Allocator& alloc) noexcept -> rapidjson::Value {
    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("encryption_type", make_string(strata::crypto::encryption_type_to_string(encryption.type()), alloc), alloc);
    value.AddMember("partitions", make_string_array(encryption.partitions(), alloc), alloc);
    value.AddMember("lvm_volumes", make_string_array(encryption.lvm_volumes(), alloc), alloc);
    if (const auto& hsm = encryption.hsm_device(); hsm) {
        rapidjson::Value hsm_value(rapidjson::kObjectType);
        hsm_value.AddMember("path", make_string(hsm->path, alloc), alloc);
        hsm_value.AddMember("manufacturer", make_string(hsm->manufacturer, alloc), alloc);
        hsm_value.AddMember("product", make_string(hsm->product, alloc), alloc);
        value.AddMember("hsm_device", hsm_value, alloc);
    } else {
        value.AddMember("hsm_device", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    value.AddMember("iter_time", encryption.iter_time(), alloc);
    return value;
}

// --- reading ---

auto malformed(std::string_view field, std::string_view expected) noexcept -> std::unexpected<strata::Error> {
    return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("'{}' field must be {}"), field, expected));
}

auto read_string(const rapidjson::Value& obj, const char* key) noexcept -> Result<std::string> {
    if (!obj.HasMember(key) || !obj[key].IsString()) {
        return malformed(key, "a string"sv);
    }
    return std::string{obj[key].GetString(), obj[key].GetStringLength()};
}

// absent and null both mean "not set"
auto read_optional_string(const rapidjson::Value& obj, const char* key) noexcept -> Result<std::optional<std::string>> {
    if (!obj.HasMember(key) || obj[key].IsNull()) {
        return std::nullopt;
    }
    if (!obj[key].IsString()) {
        return malformed(key, "a string or null"sv);
    }
    return std::make_optional<std::string>(obj[key].GetString(), obj[key].GetStringLength());
}

auto read_bool(const rapidjson::Value& obj, const char* key, bool fallback) noexcept -> Result<bool> {
    if (!obj.HasMember(key)) {
        return fallback;
    }
    if (!obj[key].IsBool()) {
        return malformed(key, "a boolean"sv);
    }
    return obj[key].GetBool();
}

auto read_string_array(const rapidjson::Value& obj, const char* key) noexcept -> Result<std::vector<std::string>> {
    std::vector<std::string> strings{};
    if (!obj.HasMember(key)) {
        return strings;
    }
    if (!obj[key].IsArray()) {
        return malformed(key, "an array of strings"sv);
    }
    for (const auto& item : obj[key].GetArray()) {
        if (!item.IsString()) {
            return malformed(key, "an array of strings"sv);
        }
        strings.emplace_back(item.GetString(), item.GetStringLength());
    }
    return strings;
}

auto read_array(const rapidjson::Value& obj, const char* key) noexcept -> Result<const rapidjson::Value*> {
    if (!obj.HasMember(key)) {
        return nullptr;
    }
    if (!obj[key].IsArray()) {
        return malformed(key, "an array"sv);
    }
    return &obj[key];
}

auto read_fs_type(const rapidjson::Value& obj) noexcept -> Result<std::optional<strata::fs::FilesystemType>> {
    auto name = read_optional_string(obj, "fs_type");
    if (!name) {
        return std::unexpected(name.error());
    }
    if (!*name) {
        return std::nullopt;
    }
    const auto fs_type = strata::fs::string_to_filesystem_type(**name);
    if (fs_type == strata::fs::FilesystemType::Unknown) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown filesystem type '{}'"), **name));
    }
    return fs_type;
}

auto read_status(const rapidjson::Value& obj) noexcept -> Result<ModificationStatus> {
    auto name = read_string(obj, "status");
    if (!name) {
        return std::unexpected(name.error());
    }
    const auto status = string_to_modification_status(*name);
    if (!status) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown modification status '{}'"), *name));
    }
    return *status;
}

auto read_size(const rapidjson::Value& obj, const char* key) noexcept -> Result<Size> {
    if (!obj.HasMember(key) || !obj[key].IsObject()) {
        return malformed(key, "a size object"sv);
    }
    const auto& size = obj[key];
    if (!size.HasMember("value") || !size["value"].IsUint64()) {
        return malformed(key, "a size with an unsigned 'value'"sv);
    }
    auto unit_name = read_string(size, "unit");
    if (!unit_name) {
        return std::unexpected(unit_name.error());
    }
    const auto unit = string_to_unit(*unit_name);
    if (!unit || *unit == Unit::percent) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unsupported size unit '{}'"), *unit_name));
    }
    SectorSize sector_size{};
    if (size.HasMember("sector_size")) {
        if (!size["sector_size"].IsUint64() || size["sector_size"].GetUint64() == 0) {
            return malformed("sector_size"sv, "a positive integer"sv);
        }
        sector_size.value = size["sector_size"].GetUint64();
    }
    return Size{size["value"].GetUint64(), *unit, sector_size};
}

auto read_subvolumes(const rapidjson::Value& obj) noexcept -> Result<std::vector<SubvolumeModification>> {
    std::vector<SubvolumeModification> subvols{};
    auto array = read_array(obj, "btrfs");
    if (!array) {
        return std::unexpected(array.error());
    }
    if (*array == nullptr) {
        return subvols;
    }
    for (const auto& item : (*array)->GetArray()) {
        if (!item.IsObject()) {
            return malformed("btrfs"sv, "an array of subvolume objects"sv);
        }
        auto name       = read_string(item, "name");
        auto mountpoint = read_optional_string(item, "mountpoint");
        auto compress   = read_bool(item, "compress", false);
        auto nodatacow  = read_bool(item, "nodatacow", false);
        if (!name) {
            return std::unexpected(name.error());
        }
        if (!mountpoint) {
            return std::unexpected(mountpoint.error());
        }
        if (!compress) {
            return std::unexpected(compress.error());
        }
        if (!nodatacow) {
            return std::unexpected(nodatacow.error());
        }
        subvols.emplace_back(SubvolumeModification{
            .name       = std::move(*name),
            .mountpoint = mountpoint->value_or(""s),
            .compress   = *compress,
            .nodatacow  = *nodatacow,
        });
    }
    return subvols;
}

auto read_partition(const rapidjson::Value& obj) noexcept -> Result<PartitionModification> {
    if (!obj.IsObject()) {
        return malformed("partitions"sv, "an array of partition objects"sv);
    }

    PartitionSpec spec{};
    auto status = read_status(obj);
    if (!status) {
        return std::unexpected(status.error());
    }
    spec.status = *status;

    auto type_name = read_string(obj, "type");
    if (!type_name) {
        return std::unexpected(type_name.error());
    }
    const auto type = string_to_partition_type(*type_name);
    if (!type) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown partition type '{}'"), *type_name));
    }
    spec.type = *type;

    auto start  = read_size(obj, "start");
    auto length = read_size(obj, "size");
    if (!start) {
        return std::unexpected(start.error());
    }
    if (!length) {
        return std::unexpected(length.error());
    }
    spec.start  = *start;
    spec.length = *length;

    auto fs_type = read_fs_type(obj);
    if (!fs_type) {
        return std::unexpected(fs_type.error());
    }
    spec.fs_type = *fs_type;

    auto mountpoint    = read_optional_string(obj, "mountpoint");
    auto dev_path      = read_optional_string(obj, "dev_path");
    auto obj_id        = read_optional_string(obj, "obj_id");
    auto mount_options = read_string_array(obj, "mount_options");
    auto flag_names    = read_string_array(obj, "flags");
    auto subvols       = read_subvolumes(obj);
    if (!mountpoint) {
        return std::unexpected(mountpoint.error());
    }
    if (!dev_path) {
        return std::unexpected(dev_path.error());
    }
    if (!obj_id) {
        return std::unexpected(obj_id.error());
    }
    if (!mount_options) {
        return std::unexpected(mount_options.error());
    }
    if (!flag_names) {
        return std::unexpected(flag_names.error());
    }
    if (!subvols) {
        return std::unexpected(subvols.error());
    }

    for (const auto& flag_name : *flag_names) {
        const auto flag = strata::fs::string_to_partition_flag(flag_name);
        if (!flag) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown partition flag '{}'"), flag_name));
        }
        spec.flags.push_back(*flag);
    }
    spec.mountpoint    = std::move(*mountpoint);
    spec.dev_path      = std::move(*dev_path);
    spec.obj_id        = std::move(*obj_id);
    spec.mount_options = std::move(*mount_options);
    spec.btrfs_subvols = std::move(*subvols);
    return PartitionModification::create(std::move(spec));
}

auto read_device(const rapidjson::Value& obj, const DeviceInventory& inventory) noexcept -> Result<DeviceModification> {
    if (!obj.IsObject()) {
        return malformed("device_modifications"sv, "an array of device objects"sv);
    }
    auto path = read_string(obj, "device");
    if (!path) {
        return std::unexpected(path.error());
    }
    auto device = inventory.get_device(*path);
    if (!device) {
        return make_error(ErrorKind::InvalidState, "device of the saved layout is not present"s, *path);
    }

    auto wipe = read_bool(obj, "wipe", false);
    if (!wipe) {
        return std::unexpected(wipe.error());
    }
    std::optional<strata::fs::PartitionTable> table{};
    if (obj.HasMember("partition_table")) {
        auto table_name = read_string(obj, "partition_table");
        if (!table_name) {
            return std::unexpected(table_name.error());
        }
        table = strata::fs::string_to_partition_table(*table_name);
        if (!table) {
            return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown partition table '{}'"), *table_name), *path);
        }
    }

    DeviceModification device_mod{std::move(*device), *wipe, table};
    auto partitions = read_array(obj, "partitions");
    if (!partitions) {
        return std::unexpected(partitions.error());
    }
    if (*partitions != nullptr) {
        for (const auto& part_json : (*partitions)->GetArray()) {
            auto part = read_partition(part_json);
            if (!part) {
                return std::unexpected(part.error());
            }
            device_mod.add_partition(std::move(*part));
        }
    }
    return device_mod;
}

auto read_volume(const rapidjson::Value& obj) noexcept -> Result<strata::lvm::LvmVolume> {
    if (!obj.IsObject()) {
        return malformed("volumes"sv, "an array of volume objects"sv);
    }
    auto status        = read_status(obj);
    auto name          = read_string(obj, "name");
    auto fs_type       = read_fs_type(obj);
    auto length        = read_size(obj, "length");
    auto mountpoint    = read_optional_string(obj, "mountpoint");
    auto obj_id        = read_optional_string(obj, "obj_id");
    auto mount_options = read_string_array(obj, "mount_options");
    auto subvols       = read_subvolumes(obj);
    if (!status) {
        return std::unexpected(status.error());
    }
    if (!name) {
        return std::unexpected(name.error());
    }
    if (!fs_type) {
        return std::unexpected(fs_type.error());
    }
    if (!length) {
        return std::unexpected(length.error());
    }
    if (!mountpoint) {
        return std::unexpected(mountpoint.error());
    }
    if (!obj_id) {
        return std::unexpected(obj_id.error());
    }
    if (!mount_options) {
        return std::unexpected(mount_options.error());
    }
    if (!subvols) {
        return std::unexpected(subvols.error());
    }
    return strata::lvm::LvmVolume::create(strata::lvm::LvmVolumeSpec{
        .status        = *status,
        .name          = std::move(*name),
        .fs_type       = *fs_type,
        .length        = *length,
        .mountpoint    = std::move(*mountpoint),
        .mount_options = std::move(*mount_options),
        .btrfs_subvols = std::move(*subvols),
        .obj_id        = std::move(*obj_id),
    });
}

auto read_lvm_config(const rapidjson::Value& obj) noexcept -> Result<strata::lvm::LvmConfiguration> {
    if (!obj.IsObject()) {
        return malformed("lvm_config"sv, "an object"sv);
    }
    auto groups_json = read_array(obj, "vol_groups");
    if (!groups_json) {
        return std::unexpected(groups_json.error());
    }

    std::vector<strata::lvm::LvmVolumeGroup> vol_groups{};
    if (*groups_json != nullptr) {
        for (const auto& group_json : (*groups_json)->GetArray()) {
            if (!group_json.IsObject()) {
                return malformed("vol_groups"sv, "an array of group objects"sv);
            }
            auto name = read_string(group_json, "name");
            auto pvs  = read_string_array(group_json, "lvm_pvs");
            if (!name) {
                return std::unexpected(name.error());
            }
            if (!pvs) {
                return std::unexpected(pvs.error());
            }

            std::vector<strata::lvm::LvmVolume> volumes{};
            auto volumes_json = read_array(group_json, "volumes");
            if (!volumes_json) {
                return std::unexpected(volumes_json.error());
            }
            if (*volumes_json != nullptr) {
                for (const auto& volume_json : (*volumes_json)->GetArray()) {
                    auto volume = read_volume(volume_json);
                    if (!volume) {
                        return std::unexpected(volume.error());
                    }
                    volumes.emplace_back(std::move(*volume));
                }
            }

            auto group = strata::lvm::LvmVolumeGroup::create(std::move(*name), std::move(*pvs), std::move(volumes));
            if (!group) {
                return std::unexpected(group.error());
            }
            vol_groups.emplace_back(std::move(*group));
        }
    }
    return strata::lvm::LvmConfiguration::create(std::move(vol_groups));
}

auto read_encryption(const rapidjson::Value& obj, std::string_view password) noexcept -> Result<strata::crypto::DiskEncryption> {
    if (!obj.IsObject()) {
        return malformed("disk_encryption"sv, "an object"sv);
    }
    auto type_name = read_string(obj, "encryption_type");
    if (!type_name) {
        return std::unexpected(type_name.error());
    }
    const auto type = strata::crypto::string_to_encryption_type(*type_name);
    if (!type) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown encryption type '{}'"), *type_name));
    }

    auto partitions  = read_string_array(obj, "partitions");
    auto lvm_volumes = read_string_array(obj, "lvm_volumes");
    if (!partitions) {
        return std::unexpected(partitions.error());
    }
    if (!lvm_volumes) {
        return std::unexpected(lvm_volumes.error());
    }

    std::optional<strata::crypto::Fido2Device> hsm_device{};
    if (obj.HasMember("hsm_device") && !obj["hsm_device"].IsNull()) {
        const auto& hsm_json = obj["hsm_device"];
        if (!hsm_json.IsObject()) {
            return malformed("hsm_device"sv, "an object or null"sv);
        }
        auto path = read_string(hsm_json, "path");
        if (!path) {
            return std::unexpected(path.error());
        }
        auto manufacturer = read_optional_string(hsm_json, "manufacturer");
        auto product      = read_optional_string(hsm_json, "product");
        if (!manufacturer) {
            return std::unexpected(manufacturer.error());
        }
        if (!product) {
            return std::unexpected(product.error());
        }
        hsm_device = strata::crypto::Fido2Device{
            .path         = std::move(*path),
            .manufacturer = manufacturer->value_or(""s),
            .product      = product->value_or(""s),
        };
    }

    std::uint32_t iter_time{strata::crypto::DEFAULT_ITER_TIME};
    if (obj.HasMember("iter_time")) {
        if (!obj["iter_time"].IsUint() || obj["iter_time"].GetUint() == 0) {
            return malformed("iter_time"sv, "a positive integer"sv);
        }
        iter_time = obj["iter_time"].GetUint();
    }

    return strata::crypto::DiskEncryption::create(*type, std::string{password}, std::move(*partitions),
        std::move(*lvm_volumes), std::move(hsm_device), iter_time);
}

}  // namespace

namespace strata::disk {

auto serialize_layout(const DiskLayoutConfiguration& layout, const std::optional<crypto::DiskEncryption>& encryption) noexcept -> std::string {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("config_type", make_string(layout_type_to_string(layout.type()), alloc), alloc);
    if (layout.mountpoint()) {
        doc.AddMember("mountpoint", make_string(*layout.mountpoint(), alloc), alloc);
    }

    rapidjson::Value devices(rapidjson::kArrayType);
    for (const auto& device_mod : layout.device_modifications()) {
        rapidjson::Value partitions(rapidjson::kArrayType);
        for (const auto& part : device_mod.partitions()) {
            partitions.PushBack(make_partition(part, alloc), alloc);
        }

        rapidjson::Value device(rapidjson::kObjectType);
        device.AddMember("device", make_string(device_mod.device_path(), alloc), alloc);
        device.AddMember("wipe", device_mod.wipe(), alloc);
        device.AddMember("partition_table", make_string(fs::partition_table_to_string(device_mod.partition_table()), alloc), alloc);
        device.AddMember("partitions", partitions, alloc);
        devices.PushBack(device, alloc);
    }
    doc.AddMember("device_modifications", devices, alloc);

    if (layout.lvm_config()) {
        doc.AddMember("lvm_config", make_lvm_config(*layout.lvm_config(), alloc), alloc);
    }
    if (encryption) {
        doc.AddMember("disk_encryption", make_encryption(*encryption, alloc), alloc);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string{buffer.GetString(), buffer.GetSize()};
}

auto parse_layout(std::string_view json, const DeviceInventory& inventory, std::string_view password) noexcept -> Result<ParsedLayout> {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("layout is not valid JSON: {}"), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return make_error(ErrorKind::InvalidState, "layout must be a JSON object"s);
    }

    auto type_name = read_string(doc, "config_type");
    if (!type_name) {
        return std::unexpected(type_name.error());
    }
    const auto type = string_to_layout_type(*type_name);
    if (!type) {
        return make_error(ErrorKind::InvalidState, fmt::format(FMT_COMPILE("unknown layout type '{}'"), *type_name));
    }
    auto mountpoint = read_optional_string(doc, "mountpoint");
    if (!mountpoint) {
        return std::unexpected(mountpoint.error());
    }

    std::vector<DeviceModification> device_mods{};
    auto devices_json = read_array(doc, "device_modifications");
    if (!devices_json) {
        return std::unexpected(devices_json.error());
    }
    if (*devices_json != nullptr) {
        for (const auto& device_json : (*devices_json)->GetArray()) {
            auto device_mod = read_device(device_json, inventory);
            if (!device_mod) {
                return std::unexpected(device_mod.error());
            }
            device_mods.emplace_back(std::move(*device_mod));
        }
    }

    std::optional<lvm::LvmConfiguration> lvm_config{};
    if (doc.HasMember("lvm_config") && !doc["lvm_config"].IsNull()) {
        auto config = read_lvm_config(doc["lvm_config"]);
        if (!config) {
            return std::unexpected(config.error());
        }
        lvm_config = std::move(*config);
    }

    auto layout = DiskLayoutConfiguration::create(*type, std::move(device_mods), std::move(lvm_config), std::move(*mountpoint));
    if (!layout) {
        return std::unexpected(layout.error());
    }

    std::optional<crypto::DiskEncryption> encryption{};
    if (doc.HasMember("disk_encryption") && !doc["disk_encryption"].IsNull()) {
        auto parsed = read_encryption(doc["disk_encryption"], password);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        if (auto res = layout->validate_encryption(*parsed); !res) {
            return std::unexpected(res.error());
        }
        encryption = std::move(*parsed);
    }

    spdlog::info("Loaded {} layout over {} devices", *type_name, layout->device_modifications().size());
    return ParsedLayout{.layout = std::move(*layout), .encryption = std::move(encryption)};
}

}  // namespace strata::disk
