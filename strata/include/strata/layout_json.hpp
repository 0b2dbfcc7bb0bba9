#ifndef LAYOUT_JSON_HPP
#define LAYOUT_JSON_HPP

#include "strata/device_inventory.hpp"
#include "strata/disk_layout.hpp"
#include "strata/error.hpp"
#include "strata/luks.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace strata::disk {

struct ParsedLayout final {
    DiskLayoutConfiguration layout;
    std::optional<crypto::DiskEncryption> encryption{};
};

/// @brief Saves a layout (and its encryption settings) as pretty-printed JSON.
///
/// The encryption password is never written.
auto serialize_layout(const DiskLayoutConfiguration& layout, const std::optional<crypto::DiskEncryption>& encryption = std::nullopt) noexcept -> std::string;

/// @brief Loads a layout saved by serialize_layout.
///
/// Devices are matched against the live @p inventory by path, all model
/// invariants are checked again.
/// @param password Encryption password, required when the document carries encryption settings.
/// @return The layout, or InvalidState for malformed documents and unknown devices.
auto parse_layout(std::string_view json, const DeviceInventory& inventory, std::string_view password = {}) noexcept -> Result<ParsedLayout>;

}  // namespace strata::disk

#endif  // LAYOUT_JSON_HPP
