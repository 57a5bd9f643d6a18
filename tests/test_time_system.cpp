/// @file test_time_system.cpp
/// @brief Unit tests for astrolabe::astro::TimeSystem and Moment.
///
/// Julian Day conversion (Meeus), sidereal time, obliquity, the Moment
/// value type and location validation.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace astrolabe;
using namespace astrolabe::astro;

static constexpr f64 kJdTolerance     = 1e-6;
static constexpr f64 kSecondTolerance = 1.0;

// =================================================================
// Julian Day conversion
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {.year = 2000, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0};
    CHECK(TimeSystem::to_julian_date(j2000) == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Midnight dates land on half days")
{
    const DateTime dt = {.year = 1999, .month = 1, .day = 1, .hour = 0, .minute = 0, .second = 0.0};
    CHECK(TimeSystem::to_julian_date(dt) == doctest::Approx(2451179.5).epsilon(kJdTolerance));

    const DateTime evening = {.year = 2024, .month = 6, .day = 15, .hour = 22, .minute = 30, .second = 0.0};
    CHECK(TimeSystem::to_julian_date(evening) == doctest::Approx(2460477.4375).epsilon(kJdTolerance));
}

TEST_CASE("Round-trip DateTime -> JD -> DateTime, February branch")
{
    const DateTime original = {.year = 1987, .month = 2, .day = 28, .hour = 23, .minute = 59, .second = 30.0};

    const DateTime result = TimeSystem::from_julian_date(TimeSystem::to_julian_date(original));

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

// =================================================================
// Sidereal time and obliquity
// =================================================================

TEST_CASE("GMST at J2000.0 is about 280.46 degrees")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(gmst_deg == doctest::Approx(280.46061837).epsilon(1e-6));
}

TEST_CASE("LMST adds east longitude to GMST")
{
    const f64 jd = 2460000.0;
    const f64 lon = -104.02 * astro_constants::kDegToRad;

    const f64 lmst = TimeSystem::lmst(jd, lon);
    CHECK(lmst >= 0.0);
    CHECK(lmst < astro_constants::kTwoPi);

    f64 expected = std::fmod(TimeSystem::gmst(jd) + lon, astro_constants::kTwoPi);
    if (expected < 0.0)
    {
        expected += astro_constants::kTwoPi;
    }
    CHECK(lmst == doctest::Approx(expected).epsilon(1e-10));
}

TEST_CASE("Mean obliquity decreases slowly from 23.4393 at J2000")
{
    CHECK(TimeSystem::mean_obliquity_deg(astro_constants::kJ2000) == doctest::Approx(23.439291));
    CHECK(TimeSystem::mean_obliquity_deg(astro_constants::kJ2000 + 36525.0) == doctest::Approx(23.4262868));
}

// =================================================================
// Moment
// =================================================================

TEST_CASE("Moment from local time subtracts the UTC offset")
{
    const DateTime local = {.year = 2000, .month = 1, .day = 1, .hour = 18, .minute = 0, .second = 0.0};
    const Moment m = Moment::from_local(local, 360);

    CHECK(m.jd_ut() == doctest::Approx(2451545.0).epsilon(kJdTolerance));
    CHECK(m.utc_offset_minutes() == 360);
    CHECK(m.centuries() == doctest::Approx(0.0));

    const DateTime utc = m.utc();
    CHECK(utc.hour == 12);
    CHECK(utc.minute == 0);

    const DateTime back = m.local();
    CHECK(back.hour == 18);
    CHECK(back.minute == 0);
}

TEST_CASE("Moment from UTC has zero offset")
{
    const Moment m = Moment::from_utc({.year = 2000, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0});
    CHECK(m.jd_ut() == doctest::Approx(astro_constants::kJ2000));
    CHECK(m.utc_offset_minutes() == 0);
}

TEST_CASE("plus_days returns a new Moment and keeps the offset")
{
    const Moment birth(2451545.0, -300);
    const Moment earlier = birth.plus_days(-88.5);

    CHECK(birth.jd_ut() == doctest::Approx(2451545.0));
    CHECK(earlier.jd_ut() == doctest::Approx(2451456.5));
    CHECK(earlier.utc_offset_minutes() == -300);
}

// =================================================================
// Locations
// =================================================================

TEST_CASE("validate_location accepts the full valid range")
{
    CHECK_NOTHROW(validate_location({.latitude_deg = 90.0, .longitude_deg = -180.0}, "test"));
    CHECK_NOTHROW(validate_location({.latitude_deg = -33.87, .longitude_deg = 151.21}, "test"));
}

TEST_CASE("validate_location rejects out-of-range coordinates")
{
    CHECK_THROWS_AS(validate_location({.latitude_deg = 91.0, .longitude_deg = 0.0}, "test"), InvalidInput);
    CHECK_THROWS_AS(validate_location({.latitude_deg = 0.0, .longitude_deg = 180.5}, "test"), InvalidInput);
    CHECK_THROWS_AS(validate_location({.latitude_deg = std::nan(""), .longitude_deg = 0.0}, "test"), InvalidInput);

    try
    {
        validate_location({.latitude_deg = -95.0, .longitude_deg = 0.0}, "houses");
        FAIL("expected InvalidInput");
    }
    catch (const ChartError& e)
    {
        CHECK(e.code() == ErrorCode::InvalidInput);
        CHECK(e.step() == "houses");
    }
}

TEST_CASE("now_as_jd returns a plausible Julian Day")
{
    const f64 jd = TimeSystem::now_as_jd();
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
