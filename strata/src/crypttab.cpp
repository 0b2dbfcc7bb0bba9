#include "strata/crypttab.hpp"
#include "strata/file_utils.hpp"

#include <filesystem>  // for copy_file, permissions

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto CRYPTTAB_HEADER = R"(# Configuration for encrypted block devices
# See crypttab(5) for details.

# NOTE: Do not list your root (/) partition here, it must be set up
#       beforehand by the initramfs.

# <name>       <device>                                     <password>              <options>
)"sv;

}  // namespace

namespace strata::fs {

auto gen_crypttab_entry(const crypto::CryptTarget& target) noexcept -> std::optional<std::string> {
    // skip invalid usage
    if (target.is_root || target.mapper_name.empty() || target.luks_uuid.empty()) {
        return std::nullopt;
    }

    auto crypt_password = "none"s;
    auto crypt_options  = "luks"s;
    if (!target.keyfile.empty()) {
        crypt_password = fmt::format(FMT_COMPILE("{}/{}.key"), CRYPT_KEYS_DIR, target.mapper_name);
    }
    if (target.hsm_enrolled) {
        crypt_options += ",fido2-device=auto"sv;
    }

    const auto& device_str = fmt::format(FMT_COMPILE("UUID={}"), target.luks_uuid);
    return std::make_optional<std::string>(fmt::format(FMT_COMPILE("{:21} {:<45} {:<23} {}\n"), target.mapper_name, device_str, crypt_password, crypt_options));
}

auto generate_crypttab_content(const std::vector<crypto::CryptTarget>& targets) noexcept -> std::string {
    std::string crypttab_content{CRYPTTAB_HEADER};

    for (const auto& target : targets) {
        auto crypttab_entry = gen_crypttab_entry(target);
        if (!crypttab_entry) {
            continue;
        }
        crypttab_content += *crypttab_entry;
    }

    return crypttab_content;
}

auto install_keyfiles(const std::vector<crypto::CryptTarget>& targets, std::string_view root_mountpoint) noexcept -> bool {
    const auto& keys_dir = fmt::format(FMT_COMPILE("{}{}"), root_mountpoint, CRYPT_KEYS_DIR);

    std::error_code err{};
    ::fs::create_directories(keys_dir, err);
    if (err) {
        spdlog::error("Failed to create {}: {}", keys_dir, err.message());
        return false;
    }
    ::fs::permissions(keys_dir, ::fs::perms::owner_all, ::fs::perm_options::replace, err);
    if (err) {
        spdlog::error("Failed to restrict permissions of {}: {}", keys_dir, err.message());
        return false;
    }

    for (const auto& target : targets) {
        if (target.keyfile.empty()) {
            continue;
        }
        const auto& dest = fmt::format(FMT_COMPILE("{}/{}.key"), keys_dir, target.mapper_name);
        ::fs::copy_file(target.keyfile, dest, ::fs::copy_options::overwrite_existing, err);
        if (err) {
            spdlog::error("Failed to install keyfile {} to {}: {}", target.keyfile, dest, err.message());
            return false;
        }
        // 0400, so regular users are not able to read the keyfile
        ::fs::permissions(dest, ::fs::perms::owner_read, ::fs::perm_options::replace, err);
        if (err) {
            spdlog::error("Failed to set permissions of {}: {}", dest, err.message());
            return false;
        }
        spdlog::info("Installed keyfile for {}", target.mapper_name);
    }

    const auto& crypttab_filepath = fmt::format(FMT_COMPILE("{}/etc/crypttab"), root_mountpoint);
    const auto& crypttab_content  = fs::generate_crypttab_content(targets);
    if (!file_utils::create_file_for_overwrite(crypttab_filepath, crypttab_content)) {
        spdlog::error("Failed to open crypttab for writing {}", crypttab_filepath);
        return false;
    }
    return true;
}

}  // namespace strata::fs
