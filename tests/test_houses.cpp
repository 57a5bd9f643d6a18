/// @file test_houses.cpp
/// @brief House systems: angles, cusp geometry, polar failures, house membership.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/houses.hpp"
#include "core/error.hpp"
#include "fake_ephemeris.hpp"

#include <array>
#include <cmath>

using namespace astrolabe;
using namespace astrolabe::astro;

namespace
{
    const Moment kMoment(2451545.0);
    constexpr GeoLocation kNewYork{.latitude_deg = 40.7, .longitude_deg = -74.0};

    constexpr std::array<HouseSystemKind, 4> kQuadrantSystems = {
        HouseSystemKind::Placidus, HouseSystemKind::Koch,
        HouseSystemKind::Regiomontanus, HouseSystemKind::Porphyry,
    };
}

TEST_CASE("Angles at sidereal time zero on the equator")
{
    CHECK(ascendant_from(0.0, 23.44, 0.0) == doctest::Approx(90.0));
    CHECK(midheaven_from(0.0, 23.44) == doctest::Approx(0.0));
    CHECK(midheaven_from(90.0, 23.44) == doctest::Approx(90.0));
    CHECK(midheaven_from(180.0, 23.44) == doctest::Approx(180.0));
}

TEST_CASE("Quadrant systems pin the angles and oppose their cusps")
{
    for (const auto kind : kQuadrantSystems)
    {
        CAPTURE(house_system_name(kind));
        const auto houses = calculate_houses(kMoment, kNewYork, {.system = kind});

        CHECK(houses.cusp(1) == doctest::Approx(houses.ascendant));
        CHECK(houses.cusp(10) == doctest::Approx(houses.midheaven));
        CHECK(houses.cusp(7) == doctest::Approx(normalize_degrees(houses.ascendant + 180.0)));
        CHECK(houses.cusp(4) == doctest::Approx(normalize_degrees(houses.midheaven + 180.0)));

        for (i32 h = 1; h <= 6; ++h)
        {
            CHECK(houses.cusp(h + 6) == doctest::Approx(normalize_degrees(houses.cusp(h) + 180.0)));
        }

        // Cusps advance around the zodiac and cover it exactly once
        f64 total = 0.0;
        for (i32 h = 1; h <= 12; ++h)
        {
            const f64 width = normalize_degrees(houses.cusp(h % 12 + 1) - houses.cusp(h));
            CHECK(width > 0.0);
            CHECK(width < 90.0);
            total += width;
        }
        CHECK(total == doctest::Approx(360.0));
    }
}

TEST_CASE("Intermediate cusps for New York at J2000")
{
    struct Expected
    {
        HouseSystemKind kind;
        std::array<f64, 4> cusps;   // houses 11, 12, 2, 3
    };
    const std::array<Expected, 3> table = {{
        {HouseSystemKind::Placidus,      {233.249, 253.928, 314.088, 355.597}},
        {HouseSystemKind::Koch,          {229.459, 250.824, 303.326, 342.954}},
        {HouseSystemKind::Regiomontanus, {230.874, 250.525, 310.292, 355.261}},
    }};
    constexpr std::array<i32, 4> kHouses = {11, 12, 2, 3};

    for (const auto& row : table)
    {
        CAPTURE(house_system_name(row.kind));
        const auto houses = calculate_houses(kMoment, kNewYork, {.system = row.kind});
        CHECK(houses.ascendant == doctest::Approx(274.259).epsilon(1e-5));
        CHECK(houses.midheaven == doctest::Approx(208.479).epsilon(1e-5));
        for (std::size_t i = 0; i < kHouses.size(); ++i)
        {
            CAPTURE(kHouses[i]);
            CHECK(std::abs(houses.cusp(kHouses[i]) - row.cusps[i]) < 0.01);
        }
    }
}

TEST_CASE("ARMC and obliquity are reported")
{
    const auto houses = calculate_houses(kMoment, kNewYork);
    CHECK(houses.armc == doctest::Approx(normalize_degrees(280.46061837 - 74.0)).epsilon(1e-6));
    CHECK(houses.obliquity == doctest::Approx(23.439291));
    CHECK(houses.kind == HouseSystemKind::Placidus);
}

TEST_CASE("Porphyry trisects the upper quadrant")
{
    const auto houses = calculate_houses(kMoment, kNewYork, {.system = HouseSystemKind::Porphyry});
    const f64 quadrant = normalize_degrees(houses.ascendant - houses.midheaven);
    CHECK(houses.cusp(11) == doctest::Approx(normalize_degrees(houses.midheaven + quadrant / 3.0)));
    CHECK(houses.cusp(12) == doctest::Approx(normalize_degrees(houses.midheaven + 2.0 * quadrant / 3.0)));
}

TEST_CASE("Equal and whole-sign cusps are thirty degrees apart")
{
    const auto equal = calculate_houses(kMoment, kNewYork, {.system = HouseSystemKind::Equal});
    const auto whole = calculate_houses(kMoment, kNewYork, {.system = HouseSystemKind::WholeSign});

    const f64 sign_start = static_cast<f64>(sign_of(whole.ascendant)) * 30.0;
    for (i32 h = 1; h <= 12; ++h)
    {
        CHECK(equal.cusp(h) == doctest::Approx(normalize_degrees(equal.ascendant + 30.0 * (h - 1))));
        CHECK(whole.cusp(h) == doctest::Approx(normalize_degrees(sign_start + 30.0 * (h - 1))));
    }
}

TEST_CASE("Time-based systems fail beyond the polar limit")
{
    const GeoLocation tromso{.latitude_deg = 69.65, .longitude_deg = 18.96};

    CHECK_THROWS_AS((void)calculate_houses(kMoment, tromso, {.system = HouseSystemKind::Placidus}), HouseSystemUndefined);
    CHECK_THROWS_AS((void)calculate_houses(kMoment, tromso, {.system = HouseSystemKind::Koch}), HouseSystemUndefined);

    CHECK_NOTHROW((void)calculate_houses(kMoment, tromso, {.system = HouseSystemKind::Regiomontanus}));
    CHECK_NOTHROW((void)calculate_houses(kMoment, tromso, {.system = HouseSystemKind::WholeSign}));
}

TEST_CASE("Out-of-range coordinates are rejected")
{
    CHECK_THROWS_AS((void)calculate_houses(kMoment, {.latitude_deg = 95.0, .longitude_deg = 0.0}), InvalidInput);
    CHECK_THROWS_AS((void)calculate_houses(kMoment, {.latitude_deg = 0.0, .longitude_deg = -200.0}), InvalidInput);
}

TEST_CASE("Sidereal cusps shift by the provider's ayanamsa")
{
    astrolabe::testing::FakeEphemeris eph;
    eph.set_ayanamsa(24.0);

    const auto tropical = calculate_houses(kMoment, kNewYork, {.system = HouseSystemKind::Equal});
    const auto sidereal = calculate_houses(
        kMoment, kNewYork, {.system = HouseSystemKind::Equal, .zodiac = ZodiacMode::Sidereal}, &eph);

    CHECK(sidereal.zodiac == ZodiacMode::Sidereal);
    CHECK(sidereal.ascendant == doctest::Approx(normalize_degrees(tropical.ascendant - 24.0)));
    CHECK(sidereal.cusp(5) == doctest::Approx(normalize_degrees(tropical.cusp(5) - 24.0)));

    const auto whole = calculate_houses(
        kMoment, kNewYork, {.system = HouseSystemKind::WholeSign, .zodiac = ZodiacMode::Sidereal}, &eph);
    CHECK(whole.cusp(1) == doctest::Approx(static_cast<f64>(sign_of(whole.ascendant)) * 30.0));
}

TEST_CASE("house_of uses half-open cusp intervals and wraps past Pisces")
{
    HouseSystem houses;
    for (std::size_t i = 0; i < 12; ++i)
    {
        houses.cusps[i] = normalize_degrees(345.0 + 30.0 * static_cast<f64>(i));
    }

    CHECK(houses.house_of(345.0) == 1);
    CHECK(houses.house_of(359.9) == 1);
    CHECK(houses.house_of(0.0) == 1);
    CHECK(houses.house_of(14.999) == 1);
    CHECK(houses.house_of(15.0) == 2);
    CHECK(houses.house_of(344.9) == 12);

    const std::array<BodyPosition, 2> bodies = {
        make_position(Body::Sun, 20.0), make_position(Body::Moon, 200.0),
    };
    const auto assigned = houses.assign_houses(bodies);
    CHECK(assigned[0].house == 2);
    CHECK(assigned[1].house == 8);
}

TEST_CASE("Angles become aspectable chart points")
{
    const auto houses = calculate_houses(kMoment, kNewYork);
    const auto angles = houses.angle_points();
    REQUIRE(angles.size() == 2);
    CHECK(angles[0].body == Body::Ascendant);
    CHECK(angles[0].longitude == doctest::Approx(houses.ascendant));
    CHECK(angles[1].body == Body::Midheaven);
}

TEST_CASE("House system names parse")
{
    CHECK(parse_house_system("placidus") == HouseSystemKind::Placidus);
    CHECK(parse_house_system("Whole-Sign") == HouseSystemKind::WholeSign);
    CHECK_FALSE(parse_house_system("campanus").has_value());
    CHECK_THROWS_AS((void)HouseSystem{}.cusp(13), InvalidInput);
}
