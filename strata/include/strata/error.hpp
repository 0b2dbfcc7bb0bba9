#ifndef ERROR_HPP
#define ERROR_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected, unexpected
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

namespace strata {

/// @brief Classification of every failure the provisioning core reports.
enum class ErrorKind : std::uint8_t {
    /// Size conversion without the context the target unit needs.
    InvalidConversion,
    /// Model invariant violated at construction time.
    InvalidState,
    /// Device probe failed or produced unparsable data.
    ProbeError,
    /// A created partition/volume/mapper never showed up in the device tree.
    PartitionNeverAppeared,
    /// A mount was issued but the device tree never reported it.
    MountVerificationFailed,
    UnknownFilesystemFormat,
    PartitionTableMismatch,
    InvalidMountOrder,
    /// External tool exited with non-zero status.
    CommandFailed,
};

/// @brief Provisioning step an error originated from.
enum class ProvisionStep : std::uint8_t {
    None,
    PartitionTable,
    PartitionCreation,
    Lvm,
    Encryption,
    Format,
    MountPlan,
    Mount,
};

struct Error final {
    ErrorKind kind{ErrorKind::InvalidState};
    std::string message{};
    /// Device path or object id the failure relates to, if any.
    std::string device{};
    ProvisionStep step{ProvisionStep::None};

    /// @brief Renders the error for operators, e.g. "[format] /dev/sda2: UnknownFilesystemFormat: ...".
    [[nodiscard]] auto describe() const noexcept -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;
auto provision_step_to_string(ProvisionStep step) noexcept -> std::string_view;

/// @brief Shorthand for returning a failure out of a Result-returning function.
inline auto make_error(ErrorKind kind, std::string message, std::string device = {}, ProvisionStep step = ProvisionStep::None) noexcept -> std::unexpected<Error> {
    return std::unexpected<Error>(Error{.kind = kind, .message = std::move(message), .device = std::move(device), .step = step});
}

}  // namespace strata

#endif  // ERROR_HPP
