/// @file natal_chart.cpp
/// @brief Natal chart assembly.

#include "chart/natal_chart.hpp"

#include "core/logger.hpp"

#include <utility>

namespace astrolabe::chart
{

NatalChart calculate_natal_chart(const astro::Moment& moment,
                                 const astro::GeoLocation& location,
                                 const ChartRequest& request,
                                 const astro::EphemerisProvider& provider)
{
    astro::validate_location(location, "chart");

    NatalChart chart;
    chart.moment = moment;
    chart.location = location;

    astro::HouseConfig house_config = request.houses;
    house_config.zodiac = request.positions.zodiac;
    house_config.ayanamsa = request.positions.ayanamsa;

    chart.positions = astro::calculate_positions(moment, request.bodies, provider, request.positions);
    chart.houses = astro::calculate_houses(moment, location, house_config, &provider);
    chart.house_assignments = chart.houses.assign_houses(chart.positions);

    std::vector<BodyPosition> aspectable = chart.positions;
    if (request.include_angles)
    {
        const auto angles = chart.houses.angle_points();
        aspectable.insert(aspectable.end(), angles.begin(), angles.end());
    }

    auto report = calculate_aspects(aspectable, request.orbs, request.patterns, &chart.houses);
    chart.aspects = std::move(report.aspects);
    chart.patterns = std::move(report.patterns);

    ASL_CORE_DEBUG("Chart: {} bodies, {} houses, {} aspects, {} patterns",
                   chart.positions.size(), astro::house_system_name(chart.houses.kind),
                   chart.aspects.size(), chart.patterns.size());
    return chart;
}

} // namespace astrolabe::chart
