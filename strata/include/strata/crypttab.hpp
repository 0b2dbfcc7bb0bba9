#ifndef CRYPTTAB_HPP
#define CRYPTTAB_HPP

#include "strata/luks.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::fs {

// Directory below the target root systemd-cryptsetup looks for keyfiles in
inline constexpr std::string_view CRYPT_KEYS_DIR = "/etc/cryptsetup-keys.d";

// Generate crypttab entry, std::nullopt for the root volume (unlocked by the initramfs)
auto gen_crypttab_entry(const crypto::CryptTarget& target) noexcept -> std::optional<std::string>;

// Generate crypttab into string
auto generate_crypttab_content(const std::vector<crypto::CryptTarget>& targets) noexcept -> std::string;

// Copies staged keyfiles into <root_mountpoint>/etc/cryptsetup-keys.d with mode 0400
// and writes <root_mountpoint>/etc/crypttab
auto install_keyfiles(const std::vector<crypto::CryptTarget>& targets, std::string_view root_mountpoint) noexcept -> bool;

}  // namespace strata::fs

#endif  // CRYPTTAB_HPP
