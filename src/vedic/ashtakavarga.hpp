#pragma once

/// @file ashtakavarga.hpp
/// @brief Bhinnashtakavarga and Sarvashtakavarga bindu tables.

#include "astro/positions.hpp"
#include "core/types.hpp"

#include <array>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::vedic
{
    using astro::Body;
    using astro::BodyPosition;

    using SignTable = std::array<i32, 12>;

    enum class TransitQuality : u8
    {
        Strong,
        Moderate,
        Weak,
    };

    [[nodiscard]] std::string_view transit_quality_name(TransitQuality quality);

    struct TransitBands
    {
        i32 strong_min = 30;
        i32 moderate_min = 20;
    };

    struct TransitScore
    {
        i32 sign = 0;
        i32 bindus = 0;
        TransitQuality quality = TransitQuality::Weak;
    };

    /// @brief One planet's bindus per sign.
    struct PlanetBindus
    {
        Body planet = Body::Sun;
        SignTable bindus{};             ///< Each entry 0..8
        i32 total = 0;
        std::vector<i32> strong_signs;  ///< Above the planet's average
        std::vector<i32> weak_signs;    ///< Below the planet's average
    };

    struct HouseStrength
    {
        i32 house = 1;
        i32 sign = 0;
        i32 bindus = 0;
        std::string_view label;         ///< excellent / good / average / challenging
    };

    struct AshtakavargaSummary
    {
        Body strongest_planet = Body::Sun;
        Body weakest_planet = Body::Sun;
        i32 strongest_sign = 0;
        i32 weakest_sign = 0;
        std::vector<i32> favorable_transit_signs;   ///< Sarva >= 28
        std::array<HouseStrength, 12> houses{};
    };

    struct AshtakavargaResult
    {
        std::vector<PlanetBindus> planets;   ///< Sun, Moon, Mars, Mercury, Jupiter, Venus, Saturn
        SignTable sarva{};                   ///< Each entry 0..56
        i32 ascendant_sign = 0;
        AshtakavargaSummary summary;

        [[nodiscard]] const PlanetBindus& for_planet(Body planet) const;

        [[nodiscard]] TransitScore transit_score(i32 sign, const TransitBands& bands = {}) const;
    };

    /// @brief Compute all seven tables and the combined table.
    ///
    /// Throws IncompleteChartData when a classical planet is missing from
    /// @p positions or the ascendant is not a finite longitude.
    [[nodiscard]] AshtakavargaResult calculate_ashtakavarga(std::span<const BodyPosition> positions,
                                                            f64 ascendant_longitude);

} // namespace astrolabe::vedic
