#include "provision_config.hpp"

// import strata
#include "strata/file_utils.hpp"

#include <chrono>   // for milliseconds
#include <utility>  // for pair

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

using namespace std::string_view_literals;

namespace {

auto parse_positive(const rapidjson::Document& doc, const char* key, std::uint64_t& out) noexcept -> bool {
    if (!doc.HasMember(key)) {
        return true;
    }
    if (!doc[key].IsUint64() || doc[key].GetUint64() == 0) {
        return false;
    }
    out = doc[key].GetUint64();
    return true;
}

}  // namespace

namespace driver {

auto parse_provision_settings(std::string_view json_content) noexcept
    -> std::expected<ProvisionSettings, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    ProvisionSettings settings{};

    // Parse layout_file (required)
    if (!doc.HasMember("layout_file") || !doc["layout_file"].IsString()) {
        return std::unexpected("'layout_file' field is required and must be a string");
    }
    settings.layout_file = doc["layout_file"].GetString();

    for (const auto& [key, field] : {std::pair{"target_root", &settings.target_root}, std::pair{"keyfile_dir", &settings.keyfile_dir}}) {
        if (!doc.HasMember(key)) {
            continue;
        }
        if (!doc[key].IsString() || !std::string_view{doc[key].GetString()}.starts_with('/')) {
            return std::unexpected(fmt::format(FMT_COMPILE("'{}' field must be an absolute path"), key));
        }
        *field = doc[key].GetString();
    }

    std::uint64_t retry_attempts{settings.retry_attempts};
    if (!parse_positive(doc, "retry_attempts", retry_attempts) || retry_attempts > UINT32_MAX) {
        return std::unexpected("'retry_attempts' field must be a positive integer");
    }
    settings.retry_attempts = static_cast<std::uint32_t>(retry_attempts);

    std::uint64_t poll_interval{settings.poll_interval_ms};
    if (!parse_positive(doc, "poll_interval_ms", poll_interval) || poll_interval > UINT32_MAX) {
        return std::unexpected("'poll_interval_ms' field must be a positive integer");
    }
    settings.poll_interval_ms = static_cast<std::uint32_t>(poll_interval);

    if (!parse_positive(doc, "alignment_buffer_mib", settings.alignment_buffer_mib)) {
        return std::unexpected("'alignment_buffer_mib' field must be a positive integer");
    }

    // Parse password_file (optional)
    if (doc.HasMember("password_file")) {
        if (!doc["password_file"].IsString()) {
            return std::unexpected("'password_file' field must be a string");
        }
        settings.password_file = doc["password_file"].GetString();
    }

    return settings;
}

auto to_provisioning_config(const ProvisionSettings& settings) noexcept
    -> strata::provision::ProvisioningConfig {
    return strata::provision::ProvisioningConfig{
        .poll = strata::utils::PollPolicy{
            .attempts = settings.retry_attempts,
            .interval = std::chrono::milliseconds{settings.poll_interval_ms},
        },
        .alignment_buffer = strata::disk::Size{settings.alignment_buffer_mib, strata::disk::Unit::MiB},
        .target_root      = settings.target_root,
        .keyfile_dir      = settings.keyfile_dir,
    };
}

auto load_password(const ProvisionSettings& settings) noexcept
    -> std::expected<std::string, std::string> {
    if (!settings.password_file) {
        return std::unexpected("'password_file' is required for an encrypted layout");
    }
    auto password = strata::file_utils::read_whole_file(*settings.password_file);
    while (!password.empty() && (password.back() == '\n' || password.back() == '\r')) {
        password.pop_back();
    }
    if (password.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("password file '{}' is empty or unreadable"), *settings.password_file));
    }
    return password;
}

}  // namespace driver
