#ifndef LUKS_HPP
#define LUKS_HPP

#include "strata/device_model.hpp"
#include "strata/error.hpp"

#include <cstdint>      // for uint8_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace strata::crypto {

enum class EncryptionType : std::uint8_t {
    NoEncryption,
    /// Plain LUKS on partitions.
    Luks,
    /// Partitions encrypted first, LVM PVs created on the mappers.
    LvmOnLuks,
    /// Logical volumes encrypted after creation.
    LuksOnLvm,
};

auto encryption_type_to_string(EncryptionType type) noexcept -> std::string_view;
auto string_to_encryption_type(std::string_view type) noexcept -> std::optional<EncryptionType>;

/// FIDO2 token used to unlock volumes instead of the password prompt.
struct Fido2Device final {
    std::string path{};
    std::string manufacturer{};
    std::string product{};

    bool operator==(const Fido2Device&) const = default;
};

inline constexpr std::uint32_t DEFAULT_ITER_TIME = 10000;

/// An unlocked LUKS volume, as reported back to the installation stages.
struct CryptTarget final {
    /// Name below /dev/mapper, e.g. "luks-sda2".
    std::string mapper_name{};
    /// Encrypted (backing) device.
    std::string device{};
    /// UUID of the LUKS header.
    std::string luks_uuid{};
    /// Staged keyfile on the host, empty when none was generated.
    std::string keyfile{};
    bool is_root{false};
    /// A FIDO2 token was enrolled.
    bool hsm_enrolled{false};

    bool operator==(const CryptTarget&) const = default;
};

/// @brief Which partitions or logical volumes get encrypted, and how.
///
/// The password is kept in memory only and never serialized.
class DiskEncryption final {
 public:
    /// Fails with InvalidState when:
    /// - both partitions and logical volumes are targeted
    /// - the type needs targets of one kind and has none (Luks/LvmOnLuks need
    ///   partitions, LuksOnLvm needs volumes)
    /// - NoEncryption lists targets
    /// - a target type is set and the password is empty
    static auto create(EncryptionType type, std::string password, std::vector<disk::ObjectId> partitions,
        std::vector<disk::ObjectId> lvm_volumes, std::optional<Fido2Device> hsm_device = std::nullopt,
        std::uint32_t iter_time = DEFAULT_ITER_TIME) noexcept -> Result<DiskEncryption>;

    [[nodiscard]] auto type() const noexcept -> EncryptionType { return m_type; }
    [[nodiscard]] auto password() const noexcept -> const std::string& { return m_password; }
    [[nodiscard]] auto partitions() const noexcept -> const std::vector<disk::ObjectId>& { return m_partitions; }
    [[nodiscard]] auto lvm_volumes() const noexcept -> const std::vector<disk::ObjectId>& { return m_lvm_volumes; }
    [[nodiscard]] auto hsm_device() const noexcept -> const std::optional<Fido2Device>& { return m_hsm_device; }
    [[nodiscard]] auto iter_time() const noexcept -> std::uint32_t { return m_iter_time; }

    [[nodiscard]] auto should_encrypt_partition(std::string_view obj_id) const noexcept -> bool;
    [[nodiscard]] auto should_encrypt_volume(std::string_view obj_id) const noexcept -> bool;

    /// @brief Replaces the password, e.g. after loading a layout that does not carry one.
    auto set_password(std::string password) noexcept -> Result<void>;

 private:
    DiskEncryption(EncryptionType type, std::string password, std::vector<disk::ObjectId> partitions,
        std::vector<disk::ObjectId> lvm_volumes, std::optional<Fido2Device> hsm_device, std::uint32_t iter_time) noexcept
      : m_type(type), m_password(std::move(password)), m_partitions(std::move(partitions)),
        m_lvm_volumes(std::move(lvm_volumes)), m_hsm_device(std::move(hsm_device)), m_iter_time(iter_time) { }

    EncryptionType m_type{EncryptionType::NoEncryption};
    std::string m_password{};
    std::vector<disk::ObjectId> m_partitions{};
    std::vector<disk::ObjectId> m_lvm_volumes{};
    std::optional<Fido2Device> m_hsm_device{};
    std::uint32_t m_iter_time{DEFAULT_ITER_TIME};
};

// The passphrase is always fed on stdin, so none of the commands below carry it.

/// @brief `cryptsetup luksFormat` for a LUKS2 volume.
auto gen_luks_format_command(std::string_view device, std::uint32_t iter_time) noexcept -> std::vector<std::string>;
/// @brief `cryptsetup open` of @p device to /dev/mapper/@p mapper_name.
auto gen_luks_open_command(std::string_view device, std::string_view mapper_name) noexcept -> std::vector<std::string>;
/// @brief `cryptsetup luksAddKey`, authorized by the passphrase on stdin.
auto gen_luks_add_key_command(std::string_view device, std::string_view keyfile) noexcept -> std::vector<std::string>;
/// @brief Fills @p keyfile with 2048 random bytes.
auto gen_keyfile_command(std::string_view keyfile) noexcept -> std::vector<std::string>;
/// @brief Enrolls a FIDO2 token, authorized by the passphrase on stdin.
auto gen_fido2_enroll_command(std::string_view device, const Fido2Device& hsm) noexcept -> std::vector<std::string>;

/// @brief Path of the staged keyfile for @p mapper_name under @p keyfile_dir.
auto keyfile_path(std::string_view keyfile_dir, std::string_view mapper_name) noexcept -> std::string;

}  // namespace strata::crypto

#endif  // LUKS_HPP
