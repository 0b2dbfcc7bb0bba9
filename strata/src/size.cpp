#include "strata/size.hpp"

#include <array>    // for array
#include <limits>   // for numeric_limits
#include <utility>  // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using strata::disk::Unit;
using u128 = unsigned __int128;

constexpr auto saturate(u128 value) noexcept -> std::uint64_t {
    constexpr auto max_value = std::numeric_limits<std::uint64_t>::max();
    return value > max_value ? max_value : static_cast<std::uint64_t>(value);
}

constexpr auto pow_u128(std::uint64_t base, std::uint32_t exp) noexcept -> u128 {
    u128 res{1};
    for (std::uint32_t i = 0; i < exp; ++i) {
        res *= base;
    }
    return res;
}

constexpr std::array<std::pair<Unit, std::string_view>, 19> UNIT_NAMES{{
    {Unit::B, "B"sv},
    {Unit::kB, "kB"sv},
    {Unit::MB, "MB"sv},
    {Unit::GB, "GB"sv},
    {Unit::TB, "TB"sv},
    {Unit::PB, "PB"sv},
    {Unit::EB, "EB"sv},
    {Unit::ZB, "ZB"sv},
    {Unit::YB, "YB"sv},
    {Unit::KiB, "KiB"sv},
    {Unit::MiB, "MiB"sv},
    {Unit::GiB, "GiB"sv},
    {Unit::TiB, "TiB"sv},
    {Unit::PiB, "PiB"sv},
    {Unit::EiB, "EiB"sv},
    {Unit::ZiB, "ZiB"sv},
    {Unit::YiB, "YiB"sv},
    {Unit::sectors, "sectors"sv},
    {Unit::percent, "percent"sv},
}};

constexpr std::array BINARY_UNITS{Unit::YiB, Unit::ZiB, Unit::EiB, Unit::PiB, Unit::TiB, Unit::GiB, Unit::MiB, Unit::KiB};
constexpr std::array DECIMAL_UNITS{Unit::YB, Unit::ZB, Unit::EB, Unit::PB, Unit::TB, Unit::GB, Unit::MB, Unit::kB};

}  // namespace

namespace strata::disk {

auto unit_factor(Unit unit) noexcept -> unsigned __int128 {
    const auto index = static_cast<std::uint8_t>(unit);
    if (unit == Unit::sectors || unit == Unit::percent) {
        return 0;
    }
    if (unit >= Unit::KiB) {
        return pow_u128(1024, static_cast<std::uint32_t>(index - static_cast<std::uint8_t>(Unit::KiB) + 1));
    }
    return pow_u128(1000, index);
}

auto unit_to_string(Unit unit) noexcept -> std::string_view {
    for (const auto& [known_unit, name] : UNIT_NAMES) {
        if (known_unit == unit) {
            return name;
        }
    }
    return "B"sv;
}

auto string_to_unit(std::string_view unit_name) noexcept -> std::optional<Unit> {
    for (const auto& [known_unit, name] : UNIT_NAMES) {
        if (name == unit_name) {
            return known_unit;
        }
    }
    return std::nullopt;
}

auto Size::percent(std::uint64_t pct, std::uint64_t total_bytes, SectorSize sector_size) noexcept -> Result<Size> {
    if (pct > 100) {
        return make_error(ErrorKind::InvalidConversion, fmt::format(FMT_COMPILE("percentage {} exceeds 100"), pct));
    }
    Size size{pct, Unit::percent, sector_size};
    size.m_total_bytes = total_bytes;
    return size;
}

auto Size::normalize() const noexcept -> std::uint64_t {
    switch (m_unit) {
    case Unit::sectors:
        return saturate(static_cast<u128>(m_value) * m_sector_size.value);
    case Unit::percent:
        if (!m_total_bytes) {
            return 0;
        }
        return static_cast<std::uint64_t>(static_cast<u128>(*m_total_bytes) * m_value / 100);
    default:
        return saturate(static_cast<u128>(m_value) * unit_factor(m_unit));
    }
}

auto Size::convert(Unit target, const SizeContext& ctx) const noexcept -> Result<Size> {
    if (m_unit == Unit::percent && !m_total_bytes) {
        return make_error(ErrorKind::InvalidConversion, "percentage without reference total");
    }
    const auto sector_size = ctx.sector_size.value_or(m_sector_size);
    if ((target == Unit::sectors || m_unit == Unit::sectors) && sector_size.value == 0) {
        return make_error(ErrorKind::InvalidConversion, "sector conversion without a sector size");
    }

    const u128 norm = normalize();
    switch (target) {
    case Unit::sectors: {
        const auto sectors_count = (norm + sector_size.value - 1) / sector_size.value;
        return Size{saturate(sectors_count), Unit::sectors, sector_size};
    }
    case Unit::percent: {
        const auto total = ctx.total_bytes ? ctx.total_bytes : m_total_bytes;
        if (!total || *total == 0) {
            return make_error(ErrorKind::InvalidConversion, "percentage conversion without reference total");
        }
        auto res = Size::percent(saturate(norm * 100 / *total), *total, sector_size);
        if (!res) {
            return make_error(ErrorKind::InvalidConversion, fmt::format(FMT_COMPILE("{} bytes exceed the reference total {}"), normalize(), *total));
        }
        return res;
    }
    default:
        return Size{static_cast<std::uint64_t>(norm / unit_factor(target)), target, sector_size};
    }
}

auto Size::sectors() const noexcept -> std::uint64_t {
    if (m_unit == Unit::sectors) {
        return m_value;
    }
    const auto res = convert(Unit::sectors);
    return res ? res->value() : 0;
}

auto Size::format_size(Unit target, bool include_unit) const noexcept -> std::string {
    const auto res = convert(target);
    if (!res) {
        return fmt::format(FMT_COMPILE("{} B"), normalize());
    }
    if (!include_unit) {
        return fmt::format(FMT_COMPILE("{}"), res->value());
    }
    return fmt::format(FMT_COMPILE("{} {}"), res->value(), unit_to_string(target));
}

auto Size::format_highest(bool binary) const noexcept -> std::string {
    const u128 norm = normalize();
    const auto& units = binary ? BINARY_UNITS : DECIMAL_UNITS;
    for (const auto unit : units) {
        const auto factor = unit_factor(unit);
        if (norm < factor) {
            continue;
        }
        const auto whole = static_cast<std::uint64_t>(norm / factor);
        const auto tenth = static_cast<std::uint64_t>((norm % factor) * 10 / factor);
        if (tenth == 0) {
            return fmt::format(FMT_COMPILE("{} {}"), whole, unit_to_string(unit));
        }
        return fmt::format(FMT_COMPILE("{}.{} {}"), whole, tenth, unit_to_string(unit));
    }
    return fmt::format(FMT_COMPILE("{} B"), static_cast<std::uint64_t>(norm));
}

auto Size::align() const noexcept -> Size {
    const auto norm = normalize();
    return Size::bytes(norm - (norm % MIB_BYTES), m_sector_size);
}

auto Size::gpt_end() const noexcept -> Size {
    const auto norm = normalize();
    if (norm < MIB_BYTES) {
        return Size::bytes(0, m_sector_size);
    }
    return Size::bytes(norm - MIB_BYTES, m_sector_size).align();
}

auto Size::is_valid_start() const noexcept -> bool {
    return normalize() >= MIB_BYTES;
}

auto operator+(const Size& lhs, const Size& rhs) noexcept -> Size {
    return Size::bytes(saturate(static_cast<u128>(lhs.normalize()) + rhs.normalize()), lhs.sector_size());
}

auto operator-(const Size& lhs, const Size& rhs) noexcept -> Size {
    const auto lhs_bytes = lhs.normalize();
    const auto rhs_bytes = rhs.normalize();
    return Size::bytes(lhs_bytes >= rhs_bytes ? lhs_bytes - rhs_bytes : rhs_bytes - lhs_bytes, lhs.sector_size());
}

}  // namespace strata::disk
