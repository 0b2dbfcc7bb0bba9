#include "strata/block_devices.hpp"
#include "strata/io_utils.hpp"

#include <algorithm>  // for find_if
#include <charconv>   // for from_chars
#include <utility>    // for move

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

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using BlockDevice = strata::disk::BlockDevice;

auto get_optional_string(const rapidjson::Value& doc, const char* key) -> std::optional<std::string> {
    if (doc.HasMember(key) && doc[key].IsString()) {
        return std::make_optional<std::string>(doc[key].GetString());
    }
    return std::nullopt;
}

// lsblk prints numbers either as JSON numbers or as strings depending on version
auto get_optional_uint(const rapidjson::Value& doc, const char* key) -> std::optional<std::uint64_t> {
    if (!doc.HasMember(key)) {
        return std::nullopt;
    }
    const auto& value = doc[key];
    if (value.IsUint64()) {
        return value.GetUint64();
    }
    if (value.IsString()) {
        std::string_view str{value.GetString(), value.GetStringLength()};
        std::uint64_t result{};
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
        if (ec == std::errc{} && ptr == str.data() + str.size()) {
            return result;
        }
    }
    return std::nullopt;
}

auto get_bool(const rapidjson::Value& doc, const char* key) -> bool {
    if (!doc.HasMember(key)) {
        return false;
    }
    const auto& value = doc[key];
    if (value.IsBool()) {
        return value.GetBool();
    }
    if (value.IsString()) {
        return value.GetString() == "1"sv;
    }
    return false;
}

auto get_string_list(const rapidjson::Value& doc, const char* key) -> std::vector<std::string> {
    std::vector<std::string> list{};
    if (!doc.HasMember(key)) {
        return list;
    }
    const auto& value = doc[key];
    if (value.IsArray()) {
        for (const auto& entry : value.GetArray()) {
            // unmounted devices report [null]
            if (entry.IsString()) {
                list.emplace_back(entry.GetString());
            }
        }
    } else if (value.IsString()) {
        list.emplace_back(value.GetString());
    }
    return list;
}

/// Constructs a BlockDevice from a RapidJSON object.
auto get_blockdevice_from_json(const rapidjson::Value& doc) -> BlockDevice {
    auto device = BlockDevice{};
    if (doc.HasMember("name") && doc["name"].IsString()) {
        device.name = doc["name"].GetString();
    }
    device.path = get_optional_string(doc, "path").value_or(device.name);
    if (doc.HasMember("type") && doc["type"].IsString()) {
        device.type = doc["type"].GetString();
    }
    if (doc.HasMember("fstype") && doc["fstype"].IsString()) {
        device.fstype = doc["fstype"].GetString();
    }
    if (doc.HasMember("uuid") && doc["uuid"].IsString()) {
        device.uuid = doc["uuid"].GetString();
    }

    device.model     = get_optional_string(doc, "model");
    device.pkname    = get_optional_string(doc, "pkname");
    device.label     = get_optional_string(doc, "label");
    device.partuuid  = get_optional_string(doc, "partuuid");
    device.parttype  = get_optional_string(doc, "parttype");
    device.partflags = get_optional_string(doc, "partflags");
    device.pttype    = get_optional_string(doc, "pttype");

    device.size    = get_optional_uint(doc, "size");
    device.start   = get_optional_uint(doc, "start");
    device.log_sec = get_optional_uint(doc, "log-sec");
    if (const auto partn = get_optional_uint(doc, "partn"); partn) {
        device.partn = static_cast<std::uint32_t>(*partn);
    }

    device.rota      = get_bool(doc, "rota");
    device.read_only = get_bool(doc, "ro");

    device.mountpoints = get_string_list(doc, "mountpoints");
    if (device.mountpoints.empty()) {
        device.mountpoints = get_string_list(doc, "mountpoint");
    }
    device.fsroots = get_string_list(doc, "fsroots");

    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child_json : doc["children"].GetArray()) {
            device.children.emplace_back(get_blockdevice_from_json(child_json));
        }
    }
    return device;
}

auto find_device_recursive(const std::vector<BlockDevice>& devices, std::string_view device_name) -> const BlockDevice* {
    for (const auto& dev : devices) {
        if (dev.name == device_name || dev.path == device_name) {
            return &dev;
        }
        if (const auto* child = find_device_recursive(dev.children, device_name); child != nullptr) {
            return child;
        }
    }
    return nullptr;
}

}  // namespace

namespace strata::disk {

auto parse_lsblk_json(std::string_view json_output) noexcept -> std::optional<std::vector<BlockDevice>> {
    rapidjson::Document document;

    document.Parse(json_output.data(), json_output.size());
    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return std::nullopt;
    }
    if (!document.IsObject() || !document.HasMember("blockdevices") || !document["blockdevices"].IsArray()) {
        spdlog::error("lsblk output has no 'blockdevices' array");
        return std::nullopt;
    }

    // Extract data from JSON
    std::vector<BlockDevice> block_devices{};
    for (const auto& device_json : document["blockdevices"].GetArray()) {
        block_devices.emplace_back(get_blockdevice_from_json(device_json));
    }
    return std::make_optional<std::vector<BlockDevice>>(std::move(block_devices));
}

auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> std::optional<BlockDevice> {
    if (const auto* device = find_device_recursive(devices, device_name); device != nullptr) {
        return std::make_optional<BlockDevice>(*device);
    }
    return std::nullopt;
}

auto LsblkProbe::probe() noexcept -> Result<std::vector<BlockDevice>> {
    static const std::vector<std::string> lsblk_cmd{
        "lsblk", "--json", "--bytes", "--paths", "--tree",
        "--output", "NAME,PATH,PKNAME,TYPE,SIZE,LOG-SEC,PTTYPE,ROTA,RO,MODEL,PARTN,PARTUUID,PARTTYPE,PARTFLAGS,START,UUID,FSTYPE,LABEL,FSROOTS,MOUNTPOINTS"};

    const auto& lsblk_result = m_runner.run(lsblk_cmd);
    if (!lsblk_result.success()) {
        return make_error(ErrorKind::ProbeError, fmt::format(FMT_COMPILE("lsblk exited with {}"), lsblk_result.exit_code));
    }
    auto devices = parse_lsblk_json(lsblk_result.output);
    if (!devices) {
        return make_error(ErrorKind::ProbeError, "lsblk returned unparsable output");
    }
    return std::move(*devices);
}

}  // namespace strata::disk
