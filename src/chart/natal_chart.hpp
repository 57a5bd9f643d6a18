#pragma once

/// @file natal_chart.hpp
/// @brief One-call natal chart: positions, houses, aspects and patterns.

#include "astro/ephemeris.hpp"
#include "astro/houses.hpp"
#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "chart/aspects.hpp"
#include "chart/patterns.hpp"

#include <vector>

namespace astrolabe::chart
{
    struct ChartRequest
    {
        std::vector<Body> bodies{astro::kDefaultChartBodies.begin(), astro::kDefaultChartBodies.end()};
        astro::PositionConfig positions;
        astro::HouseConfig houses;
        OrbConfig orbs;
        PatternConfig patterns;
        bool include_angles = true;    ///< Aspect Ascendant/MC against the bodies
    };

    struct NatalChart
    {
        astro::Moment moment{0.0};
        astro::GeoLocation location;
        std::vector<BodyPosition> positions;
        astro::HouseSystem houses;
        std::vector<astro::HouseAssignment> house_assignments;
        std::vector<Aspect> aspects;
        std::vector<Pattern> patterns;
    };

    /// @brief Resolve positions and houses, then aspects and patterns over them.
    ///
    /// House and position zodiacs follow request.positions; a mismatching
    /// request.houses.zodiac is overridden.
    [[nodiscard]] NatalChart calculate_natal_chart(const astro::Moment& moment,
                                                   const astro::GeoLocation& location,
                                                   const ChartRequest& request,
                                                   const astro::EphemerisProvider& provider);

} // namespace astrolabe::chart
