/// @file test_dasha.cpp
/// @brief Nakshatra lookup and the Vimshottari dasha tree.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "vedic/dasha.hpp"
#include "vedic/nakshatra.hpp"

#include <numeric>

using namespace astrolabe;
using namespace astrolabe::vedic;

namespace
{
    const astro::Moment kBirth(2447892.5, 330);

    astro::BodyPosition sidereal_moon(f64 longitude)
    {
        return astro::make_position(Body::Moon, longitude, 13.0, astro::ZodiacMode::Sidereal);
    }
}

// =================================================================
// Nakshatras
// =================================================================

TEST_CASE("Nakshatra boundaries and lords")
{
    const auto ashwini = nakshatra_of(0.0);
    CHECK(ashwini.index == 0);
    CHECK(ashwini.name == "Ashwini");
    CHECK(ashwini.lord == Body::SouthNode);
    CHECK(ashwini.pada == 1);

    const auto bharani = nakshatra_of(13.5);
    CHECK(bharani.index == 1);
    CHECK(bharani.lord == Body::Venus);

    const auto rohini = nakshatra_of(45.0);
    CHECK(rohini.name == "Rohini");
    CHECK(rohini.lord == Body::Moon);
    CHECK(rohini.pada == 2);

    const auto revati = nakshatra_of(359.9);
    CHECK(revati.index == 26);
    CHECK(revati.lord == Body::Mercury);
    CHECK(revati.pada == 4);
    CHECK(revati.fraction_elapsed < 1.0);

    CHECK(nakshatra_of(-0.5).index == 26);
}

TEST_CASE("Lord names use Rahu and Ketu for the nodes")
{
    CHECK(lord_name(Body::NorthNode) == "Rahu");
    CHECK(lord_name(Body::SouthNode) == "Ketu");
    CHECK(lord_name(Body::Jupiter) == "Jupiter");
    CHECK(lord_sequence_of(Body::Mercury) == 8);
    CHECK(lord_sequence_of(Body::Uranus) == -1);
}

// =================================================================
// Mahadashas
// =================================================================

TEST_CASE("Moon at the start of Ashwini begins a full Ketu period")
{
    const auto tree = calculate_dasha(sidereal_moon(0.0), kBirth, {.depth = 0});

    CHECK(tree.info.starting_lord == Body::SouthNode);
    CHECK(tree.info.elapsed_years == doctest::Approx(0.0));
    CHECK(tree.info.remaining_years == doctest::Approx(7.0));

    const auto mahas = tree.mahadashas();
    REQUIRE(mahas.size() == 9);
    CHECK(tree.periods.size() == 9);
    CHECK(tree.periods[0].start.jd_ut() == doctest::Approx(kBirth.jd_ut()));
    CHECK(tree.periods[0].years() == doctest::Approx(7.0));
    CHECK(tree.periods[1].lord == Body::Venus);
    CHECK(tree.periods[8].lord == Body::Mercury);
}

TEST_CASE("Partial first period plus nine years sums to the cycle")
{
    const auto tree = calculate_dasha(sidereal_moon(11.0), kBirth, {.depth = 0});

    CHECK(tree.info.nakshatra.pada == 4);
    CHECK(tree.info.elapsed_years == doctest::Approx(5.775));
    CHECK(tree.info.remaining_years == doctest::Approx(1.225));

    const auto mahas = tree.mahadashas();
    REQUIRE(mahas.size() == 10);

    f64 first_nine = 0.0;
    for (std::size_t i = 0; i < 9; ++i)
    {
        first_nine += tree.periods[static_cast<std::size_t>(mahas[i])].years();
    }
    CHECK(first_nine + tree.info.elapsed_years == doctest::Approx(120.0));

    // Contiguous: each period starts where the previous ended
    for (std::size_t i = 1; i < mahas.size(); ++i)
    {
        CHECK(tree.periods[static_cast<std::size_t>(mahas[i])].start.jd_ut()
              == doctest::Approx(tree.periods[static_cast<std::size_t>(mahas[i - 1])].end.jd_ut()));
    }
    CHECK(tree.periods[static_cast<std::size_t>(mahas[9])].lord == Body::SouthNode);
}

TEST_CASE("Ten degrees into Ashwini leaves 1.75 years of Ketu")
{
    const auto tree = calculate_dasha(sidereal_moon(10.0), kBirth, {.depth = 0});
    CHECK(tree.info.starting_lord == Body::SouthNode);
    CHECK(tree.info.remaining_years == doctest::Approx(1.75));
    CHECK(tree.periods.front().years() == doctest::Approx(1.75));
}

TEST_CASE("Periods keep the birth offset for display")
{
    const auto tree = calculate_dasha(sidereal_moon(100.0), kBirth);
    CHECK(tree.periods.front().start.utc_offset_minutes() == 330);
}

// =================================================================
// Sub-periods
// =================================================================

TEST_CASE("Antardashas start with their parent's lord and fill it exactly")
{
    const auto tree = calculate_dasha(sidereal_moon(0.0), kBirth, {.depth = 1});
    const auto mahas = tree.mahadashas();
    REQUIRE(mahas.size() == 9);
    CHECK(tree.periods.size() == 9 + 81);

    const i32 venus = mahas[1];
    const auto& parent = tree.periods[static_cast<std::size_t>(venus)];
    const auto children = tree.children_of(venus);
    REQUIRE(children.size() == 9);

    const auto& first = tree.periods[static_cast<std::size_t>(children.front())];
    CHECK(first.lord == Body::Venus);
    CHECK(first.level == DashaLevel::Antardasha);
    CHECK(first.parent_index == venus);
    CHECK(first.years() == doctest::Approx(20.0 * 20.0 / 120.0));
    CHECK(tree.periods[static_cast<std::size_t>(children[1])].lord == Body::Sun);

    const auto& last = tree.periods[static_cast<std::size_t>(children.back())];
    CHECK(last.lord == Body::SouthNode);
    CHECK(last.end.jd_ut() == parent.end.jd_ut());

    const f64 total = std::accumulate(children.begin(), children.end(), 0.0, [&tree](f64 sum, i32 i) {
        return sum + tree.periods[static_cast<std::size_t>(i)].years();
    });
    CHECK(total == doctest::Approx(parent.years()));
}

TEST_CASE("Active chain descends to the requested depth")
{
    const auto tree = calculate_dasha(sidereal_moon(0.0), kBirth, {.depth = 2});
    CHECK(tree.periods.size() == 9 + 81 + 729);

    const auto chain = active_periods(tree, kBirth.jd_ut() + 0.1);
    REQUIRE(chain.size() == 3);
    CHECK(chain[0].level == DashaLevel::Mahadasha);
    CHECK(chain[2].level == DashaLevel::Pratyantardasha);
    CHECK(format_chain(chain) == "Ketu-Ketu-Ketu");

    // Eight years in: Venus mahadasha, Venus antardasha
    const auto later = active_periods(tree, kBirth.jd_ut() + 8.0 * 365.25);
    REQUIRE(later.size() == 3);
    CHECK(format_chain(std::span(later).first(2)) == "Venus-Venus");

    CHECK(active_periods(tree, kBirth.jd_ut() - 1.0).empty());
    CHECK(dasha_level_name(DashaLevel::Antardasha) == "Antardasha");
}

// =================================================================
// Input errors
// =================================================================

TEST_CASE("Invalid dasha inputs are rejected")
{
    CHECK_THROWS_AS((void)calculate_dasha(astro::make_position(Body::Sun, 10.0), kBirth), InvalidInput);
    CHECK_THROWS_AS((void)calculate_dasha(sidereal_moon(10.0), kBirth, {.depth = 3}), InvalidInput);
    CHECK_THROWS_AS((void)calculate_dasha(sidereal_moon(10.0), kBirth, {.depth = -1}), InvalidInput);
    CHECK_THROWS_AS((void)calculate_dasha(sidereal_moon(10.0), kBirth, {.horizon_years = 0.0}), InvalidInput);
    CHECK_THROWS_AS((void)calculate_dasha(sidereal_moon(10.0), kBirth, {.horizon_years = 1e7}), InvalidInput);
}

TEST_CASE("The longest horizon covers three cycles")
{
    const auto tree = calculate_dasha(sidereal_moon(0.0), kBirth, {.depth = 0, .horizon_years = kMaxHorizonYears});
    CHECK(tree.periods.size() == 27);
    CHECK(tree.periods.back().end.jd_ut() - kBirth.jd_ut() == doctest::Approx(360.0 * 365.25).epsilon(1e-6));
}

TEST_CASE("A tropical Moon is accepted with a warning")
{
    const auto tropical = astro::make_position(Body::Moon, 10.0);
    CHECK_NOTHROW((void)calculate_dasha(tropical, kBirth, {.depth = 0}));
}
