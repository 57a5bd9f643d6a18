/// @file test_natal_chart.cpp
/// @brief Natal chart assembly over a fake and the built-in ephemeris.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/mean_element_ephemeris.hpp"
#include "chart/natal_chart.hpp"
#include "core/error.hpp"
#include "fake_ephemeris.hpp"

#include <algorithm>

using namespace astrolabe;
using namespace astrolabe::chart;
using astrolabe::testing::FakeEphemeris;

namespace
{
    const astro::Moment kMoment(2451545.0);
    constexpr astro::GeoLocation kLondon{.latitude_deg = 51.5, .longitude_deg = -0.13};

    FakeEphemeris full_sky()
    {
        FakeEphemeris eph;
        eph.set(Body::Sun, 280.0, 1.0)
           .set(Body::Moon, 100.0, 13.0)
           .set(Body::Mercury, 270.0, 1.5)
           .set(Body::Venus, 240.0, 1.2)
           .set(Body::Mars, 330.0, 0.7)
           .set(Body::Jupiter, 25.0, 0.1)
           .set(Body::Saturn, 40.0, -0.02)
           .set(Body::Uranus, 315.0, 0.04)
           .set(Body::Neptune, 303.0, 0.02)
           .set(Body::Pluto, 251.0, 0.03)
           .set(Body::NorthNode, 124.0, -0.05);
        return eph;
    }
}

TEST_CASE("Chart holds one house per position and angles join the aspects")
{
    const FakeEphemeris eph = full_sky();
    const NatalChart chart = calculate_natal_chart(kMoment, kLondon, ChartRequest{}, eph);

    REQUIRE(chart.positions.size() == astro::kDefaultChartBodies.size());
    REQUIRE(chart.house_assignments.size() == chart.positions.size());
    for (std::size_t i = 0; i < chart.positions.size(); ++i)
    {
        CHECK(chart.house_assignments[i].body == chart.positions[i].body);
        CHECK(chart.house_assignments[i].house == chart.houses.house_of(chart.positions[i].longitude));
    }

    const bool angle_aspected = std::any_of(chart.aspects.begin(), chart.aspects.end(), [](const Aspect& a) {
        return a.involves(Body::Ascendant) || a.involves(Body::Midheaven);
    });
    CHECK(angle_aspected);

    // Sun and Moon oppose each other (280 vs 100)
    const auto opposition = find_aspect(chart.aspects, Body::Sun, Body::Moon);
    REQUIRE(opposition.has_value());
    CHECK(opposition->type == AspectType::Opposition);
}

TEST_CASE("Angles can be left out of the aspect set")
{
    const FakeEphemeris eph = full_sky();
    ChartRequest request;
    request.include_angles = false;

    const NatalChart chart = calculate_natal_chart(kMoment, kLondon, request, eph);
    CHECK(std::none_of(chart.aspects.begin(), chart.aspects.end(), [](const Aspect& a) {
        return a.involves(Body::Ascendant) || a.involves(Body::Midheaven);
    }));
}

TEST_CASE("Sidereal request applies to positions and houses alike")
{
    FakeEphemeris eph = full_sky();
    eph.set_ayanamsa(24.0);

    ChartRequest request;
    request.positions.zodiac = astro::ZodiacMode::Sidereal;
    request.houses.system = astro::HouseSystemKind::WholeSign;

    const NatalChart chart = calculate_natal_chart(kMoment, kLondon, request, eph);
    CHECK(chart.houses.zodiac == astro::ZodiacMode::Sidereal);
    CHECK(astro::find_position(chart.positions, Body::Sun)->longitude == doctest::Approx(256.0));
}

TEST_CASE("Failures from any step propagate")
{
    const FakeEphemeris eph = full_sky();

    ChartRequest polar;
    CHECK_THROWS_AS((void)calculate_natal_chart(kMoment, {.latitude_deg = 75.0, .longitude_deg = 0.0}, polar, eph),
                    HouseSystemUndefined);

    FakeEphemeris sparse;
    sparse.set(Body::Sun, 10.0);
    CHECK_THROWS_AS((void)calculate_natal_chart(kMoment, kLondon, ChartRequest{}, sparse), EphemerisUnavailable);
}

TEST_CASE("Built-in ephemeris drives a full chart")
{
    const astro::MeanElementEphemeris eph;
    const NatalChart chart = calculate_natal_chart(kMoment, kLondon, ChartRequest{}, eph);

    const auto sun = astro::find_position(chart.positions, Body::Sun);
    REQUIRE(sun.has_value());
    CHECK(sun->sign_label() == "Capricorn");
    CHECK(chart.houses.kind == astro::HouseSystemKind::Placidus);
}
