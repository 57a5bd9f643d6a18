/// @file test_positions.cpp
/// @brief Position resolver: zodiac modes, derived bodies, failures.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/ayanamsa.hpp"
#include "astro/positions.hpp"
#include "core/error.hpp"
#include "fake_ephemeris.hpp"

#include <array>

using namespace astrolabe;
using namespace astrolabe::astro;
using astrolabe::testing::FakeEphemeris;

namespace
{
    const Moment kEpoch(astro_constants::kJ2000);
}

TEST_CASE("Tropical positions come straight from the provider")
{
    FakeEphemeris eph;
    eph.set(Body::Sun, 280.5, 1.0).set(Body::Mars, 45.25, -0.3);

    const std::array<Body, 2> bodies = {Body::Sun, Body::Mars};
    const auto positions = calculate_positions(kEpoch, bodies, eph);

    REQUIRE(positions.size() == 2);
    CHECK(positions[0].body == Body::Sun);
    CHECK(positions[0].longitude == doctest::Approx(280.5));
    CHECK(positions[0].sign() == 9);
    CHECK(positions[0].sign_label() == "Capricorn");
    CHECK(positions[0].degree_in_sign() == doctest::Approx(10.5));
    CHECK_FALSE(positions[0].retrograde());

    CHECK(positions[1].body == Body::Mars);
    CHECK(positions[1].retrograde());
    CHECK(positions[1].zodiac == ZodiacMode::Tropical);
}

TEST_CASE("Sidereal positions subtract the ayanamsa and wrap")
{
    FakeEphemeris eph;
    eph.set(Body::Moon, 10.0).set_ayanamsa(24.0);

    const auto moon = calculate_position(kEpoch, Body::Moon, eph, {.zodiac = ZodiacMode::Sidereal});

    CHECK(moon.longitude == doctest::Approx(346.0));
    CHECK(moon.sign() == 11);
    CHECK(moon.zodiac == ZodiacMode::Sidereal);
}

TEST_CASE("Default sidereal offset is the linear Lahiri value")
{
    FakeEphemeris eph;
    eph.set(Body::Sun, 100.0);

    const auto sun = calculate_position(kEpoch, Body::Sun, eph, {.zodiac = ZodiacMode::Sidereal});
    CHECK(sun.longitude == doctest::Approx(100.0 - 23.8531));
    CHECK(linear_ayanamsa(AyanamsaId::Lahiri, astro_constants::kJ2000 + 365.25 * 100.0)
          == doctest::Approx(23.8531 + 100.0 * kPrecessionDegPerYear));
}

TEST_CASE("South Node and Earth are derived by opposition")
{
    FakeEphemeris eph;
    eph.set(Body::NorthNode, 300.0, -0.053).set(Body::Sun, 200.0, 0.98);

    const std::array<Body, 2> bodies = {Body::SouthNode, Body::Earth};
    const auto positions = calculate_positions(kEpoch, bodies, eph);

    CHECK(positions[0].longitude == doctest::Approx(120.0));
    CHECK(positions[0].speed == doctest::Approx(-0.053));
    CHECK(positions[0].retrograde());
    CHECK(positions[1].longitude == doctest::Approx(20.0));
}

TEST_CASE("Repeated bodies are resolved once in request order")
{
    FakeEphemeris eph;
    eph.set(Body::Sun, 1.0).set(Body::Moon, 2.0);

    const std::array<Body, 4> bodies = {Body::Moon, Body::Sun, Body::Moon, Body::Sun};
    const auto positions = calculate_positions(kEpoch, bodies, eph);

    REQUIRE(positions.size() == 2);
    CHECK(positions[0].body == Body::Moon);
    CHECK(positions[1].body == Body::Sun);
    CHECK(find_position(positions, Body::Sun)->longitude == doctest::Approx(1.0));
    CHECK_FALSE(find_position(positions, Body::Mars).has_value());
}

TEST_CASE("Any provider failure aborts the whole call")
{
    FakeEphemeris eph;
    eph.set(Body::Sun, 1.0);

    const std::array<Body, 2> bodies = {Body::Sun, Body::Pluto};
    CHECK_THROWS_AS((void)calculate_positions(kEpoch, bodies, eph), EphemerisUnavailable);

    eph.set(Body::Pluto, 250.0).set_range(2451000.0, 2451500.0);
    CHECK_THROWS_AS((void)calculate_positions(kEpoch, bodies, eph), EphemerisUnavailable);
}

TEST_CASE("Chart points cannot be requested from the ephemeris")
{
    FakeEphemeris eph;
    CHECK_THROWS_AS((void)calculate_position(kEpoch, Body::Ascendant, eph), InvalidInput);
}

TEST_CASE("Longitudes are normalized and carry a nakshatra index")
{
    const auto pos = make_position(Body::Moon, -0.5);
    CHECK(pos.longitude == doctest::Approx(359.5));
    CHECK(pos.nakshatra_index() == 26);
    CHECK(make_position(Body::Moon, 13.4).nakshatra_index() == 1);
    CHECK(make_position(Body::Moon, 720.0).longitude == doctest::Approx(0.0));
}

TEST_CASE("Ayanamsa names parse case-insensitively")
{
    CHECK(parse_ayanamsa("Lahiri") == AyanamsaId::Lahiri);
    CHECK(parse_ayanamsa("fagan-bradley") == AyanamsaId::FaganBradley);
    CHECK_FALSE(parse_ayanamsa("galactic").has_value());
    CHECK(ayanamsa_name(AyanamsaId::JnBhasin) == "J.N. Bhasin");
}
