#ifndef SIZE_HPP
#define SIZE_HPP

#include "strata/error.hpp"

#include <compare>      // for strong_ordering
#include <cstdint>      // for uint64_t, uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace strata::disk {

enum class Unit : std::uint8_t {
    B,
    kB,
    MB,
    GB,
    TB,
    PB,
    EB,
    ZB,
    YB,
    KiB,
    MiB,
    GiB,
    TiB,
    PiB,
    EiB,
    ZiB,
    YiB,
    sectors,
    percent,
};

/// Logical sector size of a device, in bytes.
struct SectorSize final {
    std::uint64_t value{512};

    constexpr bool operator==(const SectorSize&) const = default;
};

/// Extra information a conversion may need.
struct SizeContext final {
    /// Overrides the sector size carried by the value.
    std::optional<SectorSize> sector_size{};
    /// Reference total for percentages.
    std::optional<std::uint64_t> total_bytes{};
};

inline constexpr std::uint64_t KIB_BYTES = 1024;
inline constexpr std::uint64_t MIB_BYTES = 1024 * KIB_BYTES;
inline constexpr std::uint64_t GIB_BYTES = 1024 * MIB_BYTES;

/// @brief Integer size in an arbitrary unit.
///
/// All arithmetic and comparisons go through normalize(), the byte count.
/// Byte counts saturate at UINT64_MAX instead of wrapping.
class Size final {
 public:
    constexpr Size() noexcept = default;
    constexpr Size(std::uint64_t value, Unit unit, SectorSize sector_size = {}) noexcept
      : m_value(value), m_unit(unit), m_sector_size(sector_size) { }

    static constexpr auto bytes(std::uint64_t value, SectorSize sector_size = {}) noexcept -> Size {
        return Size{value, Unit::B, sector_size};
    }

    /// @brief Percentage of @p total_bytes, fails for pct > 100.
    static auto percent(std::uint64_t pct, std::uint64_t total_bytes, SectorSize sector_size = {}) noexcept -> Result<Size>;

    [[nodiscard]] constexpr auto value() const noexcept -> std::uint64_t { return m_value; }
    [[nodiscard]] constexpr auto unit() const noexcept -> Unit { return m_unit; }
    [[nodiscard]] constexpr auto sector_size() const noexcept -> SectorSize { return m_sector_size; }
    [[nodiscard]] constexpr auto total_bytes() const noexcept -> std::optional<std::uint64_t> { return m_total_bytes; }

    /// @brief Byte count. A percentage without reference total normalizes to 0.
    [[nodiscard]] auto normalize() const noexcept -> std::uint64_t;

    /// @brief Converts into @p target.
    ///
    /// Conversion into sectors rounds up so a requested size never under-allocates,
    /// every other target floors.
    /// Fails with InvalidConversion when the target (or source) is a percentage
    /// without reference total, or the sector size is zero.
    [[nodiscard]] auto convert(Unit target, const SizeContext& ctx = {}) const noexcept -> Result<Size>;

    /// @brief Number of sectors covering this size (rounded up).
    [[nodiscard]] auto sectors() const noexcept -> std::uint64_t;

    /// @brief Integer value in @p target followed by the unit name.
    [[nodiscard]] auto format_size(Unit target, bool include_unit = true) const noexcept -> std::string;

    /// @brief Renders with the largest unit whose value is >= 1, e.g. "1.5 GiB".
    [[nodiscard]] auto format_highest(bool binary = true) const noexcept -> std::string;

    /// @brief Rounds down to a 1 MiB boundary.
    [[nodiscard]] auto align() const noexcept -> Size;
    /// @brief Size minus the 1 MiB reserved for the secondary GPT header, aligned down.
    [[nodiscard]] auto gpt_end() const noexcept -> Size;
    /// @brief A partition may only start at or after the first 1 MiB.
    [[nodiscard]] auto is_valid_start() const noexcept -> bool;

    friend auto operator+(const Size& lhs, const Size& rhs) noexcept -> Size;
    /// Absolute difference.
    friend auto operator-(const Size& lhs, const Size& rhs) noexcept -> Size;

    friend auto operator==(const Size& lhs, const Size& rhs) noexcept -> bool {
        return lhs.normalize() == rhs.normalize();
    }
    friend auto operator<=>(const Size& lhs, const Size& rhs) noexcept -> std::strong_ordering {
        return lhs.normalize() <=> rhs.normalize();
    }

 private:
    std::uint64_t m_value{};
    Unit m_unit{Unit::B};
    SectorSize m_sector_size{};
    std::optional<std::uint64_t> m_total_bytes{};
};

auto unit_to_string(Unit unit) noexcept -> std::string_view;
auto string_to_unit(std::string_view unit_name) noexcept -> std::optional<Unit>;

/// @brief Byte multiplier of a unit, 0 for sectors/percent.
auto unit_factor(Unit unit) noexcept -> unsigned __int128;

}  // namespace strata::disk

#endif  // SIZE_HPP
