#ifndef PROVISION_CONFIG_HPP
#define PROVISION_CONFIG_HPP

#include "strata/provisioner.hpp"

#include <cstdint>      // for uint32_t, uint64_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace driver {

/// Settings of a headless provisioning run.
struct ProvisionSettings {
    /// Layout document written by serialize_layout.
    std::string layout_file;
    std::string target_root{"/mnt"};
    std::string keyfile_dir{"/run/strata/keys"};
    std::uint32_t retry_attempts{10};
    std::uint32_t poll_interval_ms{1000};
    std::uint64_t alignment_buffer_mib{1};
    /// File holding the encryption password, needed for encrypted layouts.
    std::optional<std::string> password_file{};
};

/// Parses provisioning settings from JSON string content.
/// @param json_content The JSON settings content.
/// @return ProvisionSettings on success, or error string on failure.
[[nodiscard]] auto parse_provision_settings(std::string_view json_content) noexcept
    -> std::expected<ProvisionSettings, std::string>;

/// Maps the settings onto the executor configuration.
[[nodiscard]] auto to_provisioning_config(const ProvisionSettings& settings) noexcept
    -> strata::provision::ProvisioningConfig;

/// Reads the password file, dropping the trailing newline.
[[nodiscard]] auto load_password(const ProvisionSettings& settings) noexcept
    -> std::expected<std::string, std::string>;

}  // namespace driver

#endif  // PROVISION_CONFIG_HPP
