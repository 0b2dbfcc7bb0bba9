#include "strata/luks.hpp"

#include <algorithm>  // for find

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace strata::crypto {

auto encryption_type_to_string(EncryptionType type) noexcept -> std::string_view {
    switch (type) {
    case EncryptionType::NoEncryption:
        return "no_encryption"sv;
    case EncryptionType::Luks:
        return "luks"sv;
    case EncryptionType::LvmOnLuks:
        return "lvm_on_luks"sv;
    case EncryptionType::LuksOnLvm:
        return "luks_on_lvm"sv;
    }
    return "no_encryption"sv;
}

auto string_to_encryption_type(std::string_view type) noexcept -> std::optional<EncryptionType> {
    if (type == "no_encryption"sv) {
        return EncryptionType::NoEncryption;
    } else if (type == "luks"sv) {
        return EncryptionType::Luks;
    } else if (type == "lvm_on_luks"sv) {
        return EncryptionType::LvmOnLuks;
    } else if (type == "luks_on_lvm"sv) {
        return EncryptionType::LuksOnLvm;
    }
    return std::nullopt;
}

auto DiskEncryption::create(EncryptionType type, std::string password, std::vector<disk::ObjectId> partitions,
    std::vector<disk::ObjectId> lvm_volumes, std::optional<Fido2Device> hsm_device, std::uint32_t iter_time) noexcept -> Result<DiskEncryption> {
    if (!partitions.empty() && !lvm_volumes.empty()) {
        return make_error(ErrorKind::InvalidState, "encryption cannot target partitions and logical volumes at the same time");
    }

    switch (type) {
    case EncryptionType::NoEncryption:
        if (!partitions.empty() || !lvm_volumes.empty()) {
            return make_error(ErrorKind::InvalidState, "no_encryption cannot list encryption targets");
        }
        break;
    case EncryptionType::Luks:
    case EncryptionType::LvmOnLuks:
        if (partitions.empty()) {
            return make_error(ErrorKind::InvalidState,
                fmt::format(FMT_COMPILE("{} requires at least one partition"), encryption_type_to_string(type)));
        }
        break;
    case EncryptionType::LuksOnLvm:
        if (lvm_volumes.empty()) {
            return make_error(ErrorKind::InvalidState, "luks_on_lvm requires at least one logical volume");
        }
        break;
    }

    if (type != EncryptionType::NoEncryption && password.empty()) {
        return make_error(ErrorKind::InvalidState, "encryption password must not be empty");
    }
    if (iter_time == 0) {
        return make_error(ErrorKind::InvalidState, "iter_time must be positive");
    }
    if (hsm_device && hsm_device->path.empty()) {
        return make_error(ErrorKind::InvalidState, "FIDO2 device requires a path");
    }

    return DiskEncryption{type, std::move(password), std::move(partitions), std::move(lvm_volumes), std::move(hsm_device), iter_time};
}

auto DiskEncryption::should_encrypt_partition(std::string_view obj_id) const noexcept -> bool {
    return std::ranges::find(m_partitions, obj_id) != m_partitions.end();
}

auto DiskEncryption::should_encrypt_volume(std::string_view obj_id) const noexcept -> bool {
    return std::ranges::find(m_lvm_volumes, obj_id) != m_lvm_volumes.end();
}

auto DiskEncryption::set_password(std::string password) noexcept -> Result<void> {
    if (m_type != EncryptionType::NoEncryption && password.empty()) {
        return make_error(ErrorKind::InvalidState, "encryption password must not be empty");
    }
    m_password = std::move(password);
    return {};
}

auto gen_luks_format_command(std::string_view device, std::uint32_t iter_time) noexcept -> std::vector<std::string> {
    return {
        "cryptsetup"s,
        "--batch-mode"s,
        "--type"s,
        "luks2"s,
        "--pbkdf"s,
        "argon2id"s,
        "--hash"s,
        "sha512"s,
        "--key-size"s,
        "512"s,
        "--iter-time"s,
        fmt::format(FMT_COMPILE("{}"), iter_time),
        "--key-file"s,
        "-"s,
        "--use-urandom"s,
        "luksFormat"s,
        std::string{device},
    };
}

auto gen_luks_open_command(std::string_view device, std::string_view mapper_name) noexcept -> std::vector<std::string> {
    return {"cryptsetup"s, "open"s, std::string{device}, std::string{mapper_name}, "--key-file"s, "-"s, "--type"s, "luks2"s};
}

auto gen_luks_add_key_command(std::string_view device, std::string_view keyfile) noexcept -> std::vector<std::string> {
    return {"cryptsetup"s, "--batch-mode"s, "luksAddKey"s, std::string{device}, std::string{keyfile}, "--key-file"s, "-"s};
}

// see https://wiki.archlinux.org/title/Dm-crypt/Device_encryption#Creating_a_keyfile_with_random_characters
auto gen_keyfile_command(std::string_view keyfile) noexcept -> std::vector<std::string> {
    return {"dd"s, "bs=512"s, "count=4"s, "if=/dev/urandom"s, fmt::format(FMT_COMPILE("of={}"), keyfile), "iflag=fullblock"s};
}

auto gen_fido2_enroll_command(std::string_view device, const Fido2Device& hsm) noexcept -> std::vector<std::string> {
    return {"systemd-cryptenroll"s, fmt::format(FMT_COMPILE("--fido2-device={}"), hsm.path), "--unlock-key-file=/dev/stdin"s, std::string{device}};
}

auto keyfile_path(std::string_view keyfile_dir, std::string_view mapper_name) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}.key"), keyfile_dir, mapper_name);
}

}  // namespace strata::crypto
