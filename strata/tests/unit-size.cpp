#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/size.hpp"

#include <array>    // for array
#include <cstdint>  // for UINT64_MAX, uint64_t
#include <string>   // for string

using namespace strata::disk;

TEST_CASE("size test")
{
    strata::test::install_null_logger();

    SECTION("normalize units")
    {
        REQUIRE_EQ(Size(1, Unit::KiB).normalize(), 1024);
        REQUIRE_EQ(Size(1, Unit::kB).normalize(), 1000);
        REQUIRE_EQ(Size(3, Unit::GiB).normalize(), 3ULL * GIB_BYTES);
        REQUIRE_EQ(Size(2048, Unit::sectors).normalize(), MIB_BYTES);
        REQUIRE_EQ(Size(8, Unit::sectors, SectorSize{4096}).normalize(), 32768);
    }
    SECTION("normalization saturates")
    {
        REQUIRE_EQ(Size(1, Unit::YiB).normalize(), UINT64_MAX);
        REQUIRE_EQ((Size(UINT64_MAX, Unit::B) + Size(1, Unit::B)).normalize(), UINT64_MAX);
    }
    SECTION("converting into sectors rounds up")
    {
        const auto res = Size::bytes(513).convert(Unit::sectors);
        REQUIRE(res.has_value());
        REQUIRE_EQ(res->value(), 2);
        REQUIRE_EQ(Size::bytes(1000, SectorSize{4096}).sectors(), 1);
    }
    SECTION("converting into bytes based units floors")
    {
        const auto res = Size(1536, Unit::KiB).convert(Unit::MiB);
        REQUIRE(res.has_value());
        REQUIRE_EQ(res->value(), 1);
        REQUIRE_EQ(res->unit(), Unit::MiB);
    }
    SECTION("sector size override")
    {
        const auto res = Size(1, Unit::MiB).convert(Unit::sectors, SizeContext{.sector_size = SectorSize{4096}});
        REQUIRE(res.has_value());
        REQUIRE_EQ(res->value(), 256);
    }
    SECTION("percentages need a reference total")
    {
        const auto pct = Size::percent(50, 10 * MIB_BYTES);
        REQUIRE(pct.has_value());
        REQUIRE_EQ(pct->normalize(), 5 * MIB_BYTES);

        const auto to_pct = Size(1, Unit::MiB).convert(Unit::percent);
        REQUIRE_FALSE(to_pct.has_value());
        REQUIRE_EQ(to_pct.error().kind, strata::ErrorKind::InvalidConversion);

        const auto with_total = Size(1, Unit::MiB).convert(Unit::percent, SizeContext{.total_bytes = 4 * MIB_BYTES});
        REQUIRE(with_total.has_value());
        REQUIRE_EQ(with_total->value(), 25);

        REQUIRE_FALSE(Size::percent(101, MIB_BYTES).has_value());
    }
    SECTION("zero sector size is refused")
    {
        const auto res = Size(1, Unit::MiB).convert(Unit::sectors, SizeContext{.sector_size = SectorSize{0}});
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().kind, strata::ErrorKind::InvalidConversion);
    }
    SECTION("arithmetic and ordering")
    {
        REQUIRE_EQ(Size(1, Unit::GiB) + Size(1, Unit::GiB), Size(2, Unit::GiB));
        REQUIRE_EQ(Size(1, Unit::GiB) - Size(3, Unit::GiB), Size(2, Unit::GiB));
        REQUIRE(Size(1, Unit::GiB) > Size(1000, Unit::MiB));
        REQUIRE_EQ(Size(1024, Unit::MiB), Size(1, Unit::GiB));
    }
    SECTION("alignment")
    {
        REQUIRE_EQ(Size::bytes(MIB_BYTES + 4096).align(), Size(1, Unit::MiB));
        REQUIRE_EQ(Size(10, Unit::GiB).gpt_end(), Size(10 * 1024 - 1, Unit::MiB));
        REQUIRE(Size(1, Unit::MiB).is_valid_start());
        REQUIRE_FALSE(Size(2047, Unit::sectors).is_valid_start());
    }
    SECTION("formatting")
    {
        REQUIRE_EQ(Size(3, Unit::GiB).format_size(Unit::MiB), "3072 MiB");
        REQUIRE_EQ(Size(3, Unit::GiB).format_size(Unit::MiB, false), "3072");
        REQUIRE_EQ(Size(1536, Unit::MiB).format_highest(), "1.5 GiB");
        REQUIRE_EQ(Size(512, Unit::B).format_highest(), "512 B");
        REQUIRE_EQ(Size(2, Unit::GB).format_highest(false), "2 GB");
    }
    SECTION("unit names")
    {
        REQUIRE_EQ(unit_to_string(Unit::MiB), "MiB");
        REQUIRE_EQ(string_to_unit("sectors"), Unit::sectors);
        REQUIRE_FALSE(string_to_unit("mib").has_value());
    }
}

TEST_CASE("unit conversion round trip test")
{
    strata::test::install_null_logger();

    constexpr std::array units{Unit::B, Unit::kB, Unit::MB, Unit::GB, Unit::TB, Unit::KiB, Unit::MiB, Unit::GiB, Unit::TiB};
    constexpr std::array values{std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{7}, std::uint64_t{1000}, std::uint64_t{65535}};

    SECTION("whole values survive the trip")
    {
        for (const auto unit : units) {
            for (const auto value : values) {
                const std::string unit_name{unit_to_string(unit)};
                CAPTURE(unit_name);
                CAPTURE(value);
                const auto same = Size(value, unit).convert(unit);
                REQUIRE(same.has_value());
                REQUIRE_EQ(same->value(), value);

                const auto in_bytes = Size(value, unit).convert(Unit::B);
                REQUIRE(in_bytes.has_value());
                const auto back = in_bytes->convert(unit);
                REQUIRE(back.has_value());
                REQUIRE_EQ(back->value(), value);
            }
        }
    }
    SECTION("sector counts survive the trip")
    {
        for (const auto sector_size : {std::uint64_t{512}, std::uint64_t{4096}}) {
            for (const auto value : values) {
                CAPTURE(sector_size);
                CAPTURE(value);
                const auto res = Size(value, Unit::sectors, SectorSize{sector_size}).convert(Unit::sectors);
                REQUIRE(res.has_value());
                REQUIRE_EQ(res->value(), value);
            }
        }
    }
    SECTION("sector conversion rounds up")
    {
        for (const auto sector_size : {std::uint64_t{512}, std::uint64_t{4096}}) {
            CAPTURE(sector_size);
            const std::array<std::array<std::uint64_t, 2>, 5> cases{{
                {0, 0},
                {1, 1},
                {sector_size - 1, 1},
                {sector_size, 1},
                {sector_size + 1, 2},
            }};
            for (const auto& [bytes, sectors] : cases) {
                CAPTURE(bytes);
                const auto res = Size::bytes(bytes, SectorSize{sector_size}).convert(Unit::sectors);
                REQUIRE(res.has_value());
                REQUIRE_EQ(res->value(), sectors);
                REQUIRE_EQ(Size::bytes(bytes, SectorSize{sector_size}).sectors(), sectors);
            }
        }
    }
    SECTION("saturated values floor instead of wrapping")
    {
        const Size huge(16, Unit::EiB);
        REQUIRE_EQ(huge.normalize(), UINT64_MAX);
        const auto res = huge.convert(Unit::EiB);
        REQUIRE(res.has_value());
        REQUIRE_EQ(res->value(), 15);

        const auto sectors = Size(UINT64_MAX, Unit::B).convert(Unit::sectors);
        REQUIRE(sectors.has_value());
        REQUIRE_EQ(sectors->value(), UINT64_MAX / 512 + 1);
    }
}

TEST_CASE("percent of device test")
{
    strata::test::install_null_logger();

    constexpr std::array totals{std::uint64_t{0}, MIB_BYTES, 64 * GIB_BYTES, 1024 * GIB_BYTES + 7, UINT64_MAX};

    for (const auto total : totals) {
        CAPTURE(total);

        const auto none = Size::percent(0, total);
        REQUIRE(none.has_value());
        REQUIRE_EQ(none->normalize(), 0);

        const auto all = Size::percent(100, total);
        REQUIRE(all.has_value());
        REQUIRE_EQ(all->normalize(), total);

        std::uint64_t previous{};
        for (std::uint64_t pct = 0; pct <= 100; ++pct) {
            CAPTURE(pct);
            const auto size = Size::percent(pct, total);
            REQUIRE(size.has_value());
            REQUIRE(size->normalize() >= previous);
            REQUIRE(size->normalize() <= total);
            previous = size->normalize();
        }

        REQUIRE_FALSE(Size::percent(101, total).has_value());
    }
}
