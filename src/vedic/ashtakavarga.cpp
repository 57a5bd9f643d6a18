/// @file ashtakavarga.cpp
/// @brief Benefic-place rule tables and bindu counting.

#include "vedic/ashtakavarga.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numeric>
#include <string>

namespace astrolabe::vedic
{

namespace
{
    constexpr const char* kStep = "ashtakavarga";

    constexpr std::size_t kPlanets = 7;
    constexpr std::size_t kContributors = 8;   // 7 planets + ascendant

    constexpr i32 kFavorableTransitMin = 28;

    /// Bit (house − 1) set for every benefic house.
    using HouseMask = u16;

    constexpr HouseMask houses(std::initializer_list<i32> list)
    {
        HouseMask mask = 0;
        for (const i32 h : list)
        {
            mask = static_cast<HouseMask>(mask | (1u << (h - 1)));
        }
        return mask;
    }

    // Rows: target planet in classical order. Columns: houses counted from
    // Sun, Moon, Mars, Mercury, Jupiter, Venus, Saturn, Ascendant.
    constexpr std::array<std::array<HouseMask, kContributors>, kPlanets> kBeneficPlaces = {{
        // Sun
        {houses({1, 2, 4, 7, 8, 9, 10, 11}), houses({3, 6, 10, 11}), houses({1, 2, 4, 7, 8, 9, 10, 11}),
         houses({3, 5, 6, 9, 10, 11, 12}), houses({5, 6, 9, 11}), houses({6, 7, 12}),
         houses({1, 2, 4, 7, 8, 9, 10, 11}), houses({3, 4, 6, 10, 11, 12})},
        // Moon
        {houses({3, 6, 7, 8, 10, 11}), houses({1, 3, 6, 7, 10, 11}), houses({2, 3, 5, 6, 9, 10, 11}),
         houses({1, 3, 4, 5, 7, 8, 10, 11}), houses({1, 4, 7, 8, 10, 11, 12}), houses({3, 4, 5, 7, 9, 10, 11}),
         houses({3, 5, 6, 11}), houses({3, 6, 10, 11})},
        // Mars
        {houses({3, 5, 6, 10, 11}), houses({3, 6, 11}), houses({1, 2, 4, 7, 8, 10, 11}),
         houses({3, 5, 6, 11}), houses({6, 10, 11, 12}), houses({6, 8, 11, 12}),
         houses({1, 4, 7, 8, 9, 10, 11}), houses({1, 3, 6, 10, 11})},
        // Mercury
        {houses({5, 6, 9, 11, 12}), houses({2, 4, 6, 8, 10, 11}), houses({1, 2, 4, 7, 8, 9, 10, 11}),
         houses({1, 3, 5, 6, 9, 10, 11, 12}), houses({6, 8, 11, 12}), houses({1, 2, 3, 4, 5, 8, 9, 11}),
         houses({1, 2, 4, 7, 8, 9, 10, 11}), houses({1, 2, 4, 6, 8, 10, 11})},
        // Jupiter
        {houses({1, 2, 3, 4, 7, 8, 9, 10, 11}), houses({2, 5, 7, 9, 11}), houses({1, 2, 4, 7, 8, 10, 11}),
         houses({1, 2, 4, 5, 6, 9, 10, 11}), houses({1, 2, 3, 4, 7, 8, 10, 11}), houses({2, 5, 6, 9, 10, 11}),
         houses({3, 5, 6, 12}), houses({1, 2, 4, 5, 6, 7, 9, 10, 11})},
        // Venus
        {houses({8, 11, 12}), houses({1, 2, 3, 4, 5, 8, 9, 11, 12}), houses({3, 5, 6, 9, 11, 12}),
         houses({3, 5, 6, 9, 11}), houses({5, 8, 9, 10, 11}), houses({1, 2, 3, 4, 5, 8, 9, 10, 11}),
         houses({3, 4, 5, 8, 9, 10, 11}), houses({1, 2, 3, 4, 5, 8, 9, 11})},
        // Saturn
        {houses({1, 2, 4, 7, 8, 10, 11}), houses({3, 6, 11}), houses({3, 5, 6, 10, 11, 12}),
         houses({6, 8, 9, 10, 11, 12}), houses({5, 6, 11, 12}), houses({6, 11, 12}),
         houses({3, 5, 6, 11}), houses({1, 3, 4, 6, 10, 11})},
    }};

    std::string_view house_label(i32 bindus)
    {
        if (bindus >= 30) return "excellent";
        if (bindus >= 28) return "good";
        if (bindus >= 25) return "average";
        return "challenging";
    }

    PlanetBindus planet_table(std::size_t row, const std::array<i32, kContributors>& contributor_signs)
    {
        PlanetBindus table;
        table.planet = astro::kClassicalPlanets[row];

        for (std::size_t c = 0; c < kContributors; ++c)
        {
            const HouseMask mask = kBeneficPlaces[row][c];
            for (i32 house = 1; house <= 12; ++house)
            {
                if (mask & (1u << (house - 1)))
                {
                    const i32 target = (contributor_signs[c] + house - 1) % 12;
                    ++table.bindus[static_cast<std::size_t>(target)];
                }
            }
        }

        table.total = std::accumulate(table.bindus.begin(), table.bindus.end(), 0);
        const f64 average = static_cast<f64>(table.total) / 12.0;
        for (i32 sign = 0; sign < 12; ++sign)
        {
            const auto value = static_cast<f64>(table.bindus[static_cast<std::size_t>(sign)]);
            if (value > average)
            {
                table.strong_signs.push_back(sign);
            }
            else if (value < average)
            {
                table.weak_signs.push_back(sign);
            }
        }
        return table;
    }

    AshtakavargaSummary summarize(const AshtakavargaResult& result)
    {
        AshtakavargaSummary summary;

        const auto [weakest, strongest] = std::minmax_element(
            result.planets.begin(), result.planets.end(),
            [](const PlanetBindus& a, const PlanetBindus& b) { return a.total < b.total; });
        summary.strongest_planet = strongest->planet;
        summary.weakest_planet = weakest->planet;

        const auto [lo, hi] = std::minmax_element(result.sarva.begin(), result.sarva.end());
        summary.strongest_sign = static_cast<i32>(hi - result.sarva.begin());
        summary.weakest_sign = static_cast<i32>(lo - result.sarva.begin());

        for (i32 sign = 0; sign < 12; ++sign)
        {
            if (result.sarva[static_cast<std::size_t>(sign)] >= kFavorableTransitMin)
            {
                summary.favorable_transit_signs.push_back(sign);
            }
        }

        for (i32 house = 1; house <= 12; ++house)
        {
            const i32 sign = (result.ascendant_sign + house - 1) % 12;
            const i32 bindus = result.sarva[static_cast<std::size_t>(sign)];
            summary.houses[static_cast<std::size_t>(house - 1)] = HouseStrength{
                .house = house,
                .sign = sign,
                .bindus = bindus,
                .label = house_label(bindus),
            };
        }
        return summary;
    }
} // namespace

std::string_view transit_quality_name(TransitQuality quality)
{
    switch (quality)
    {
    case TransitQuality::Strong:   return "strong";
    case TransitQuality::Moderate: return "moderate";
    case TransitQuality::Weak:     return "weak";
    }
    return "unknown";
}

const PlanetBindus& AshtakavargaResult::for_planet(Body planet) const
{
    const auto it = std::find_if(planets.begin(), planets.end(),
                                 [planet](const PlanetBindus& t) { return t.planet == planet; });
    if (it == planets.end())
    {
        throw InvalidInput(kStep, std::string(astro::body_name(planet)) + " has no ashtakavarga table");
    }
    return *it;
}

TransitScore AshtakavargaResult::transit_score(i32 sign, const TransitBands& bands) const
{
    if (sign < 0 || sign >= 12)
    {
        throw InvalidInput(kStep, "transit sign must be 0..11");
    }

    TransitScore score;
    score.sign = sign;
    score.bindus = sarva[static_cast<std::size_t>(sign)];
    if (score.bindus >= bands.strong_min)
    {
        score.quality = TransitQuality::Strong;
    }
    else if (score.bindus >= bands.moderate_min)
    {
        score.quality = TransitQuality::Moderate;
    }
    else
    {
        score.quality = TransitQuality::Weak;
    }
    return score;
}

AshtakavargaResult calculate_ashtakavarga(std::span<const BodyPosition> positions, f64 ascendant_longitude)
{
    if (!std::isfinite(ascendant_longitude))
    {
        ASL_CORE_ERROR("Ashtakavarga: ascendant longitude is not finite");
        throw IncompleteChartData(kStep, "ascendant is required");
    }

    std::array<i32, kContributors> contributor_signs{};
    for (std::size_t i = 0; i < kPlanets; ++i)
    {
        const Body planet = astro::kClassicalPlanets[i];
        const auto pos = astro::find_position(positions, planet);
        if (!pos)
        {
            ASL_CORE_ERROR("Ashtakavarga: missing {}", astro::body_name(planet));
            throw IncompleteChartData(kStep, std::string(astro::body_name(planet)) + " position is required");
        }
        contributor_signs[i] = pos->sign();
    }
    contributor_signs[kPlanets] = sign_of(ascendant_longitude);

    AshtakavargaResult result;
    result.ascendant_sign = contributor_signs[kPlanets];
    result.planets.reserve(kPlanets);
    for (std::size_t row = 0; row < kPlanets; ++row)
    {
        result.planets.push_back(planet_table(row, contributor_signs));
        const auto& bindus = result.planets.back().bindus;
        for (std::size_t sign = 0; sign < 12; ++sign)
        {
            result.sarva[sign] += bindus[sign];
        }
    }
    result.summary = summarize(result);

    ASL_CORE_DEBUG("Ashtakavarga: sarva total {} (strongest sign {}, weakest {})",
                   std::accumulate(result.sarva.begin(), result.sarva.end(), 0),
                   result.summary.strongest_sign, result.summary.weakest_sign);
    return result;
}

} // namespace astrolabe::vedic
