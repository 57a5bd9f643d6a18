#pragma once

/// @file nakshatra.hpp
/// @brief Lunar mansions and the Vimshottari lord sequence.

#include "astro/bodies.hpp"
#include "core/types.hpp"

#include <array>
#include <string_view>

namespace astrolabe::vedic
{
    using astro::Body;

    inline constexpr i32 kNakshatraCount = 27;
    inline constexpr f64 kNakshatraSpan = zodiac::kFullCircle / kNakshatraCount;   ///< 13°20′
    inline constexpr f64 kPadaSpan = kNakshatraSpan / 4.0;
    inline constexpr f64 kVimshottariYears = 120.0;

    /// @brief One Vimshottari lord and its mahadasha length.
    struct DashaLord
    {
        Body body;
        f64 years;
    };

    /// @brief Fixed cyclic lord order: Ketu, Venus, Sun, Moon, Mars, Rahu, Jupiter, Saturn, Mercury.
    inline constexpr std::array<DashaLord, 9> kDashaLords = {{
        {Body::SouthNode, 7.0},
        {Body::Venus, 20.0},
        {Body::Sun, 6.0},
        {Body::Moon, 10.0},
        {Body::Mars, 7.0},
        {Body::NorthNode, 18.0},
        {Body::Jupiter, 16.0},
        {Body::Saturn, 19.0},
        {Body::Mercury, 17.0},
    }};

    struct NakshatraInfo
    {
        i32 index = 0;                 ///< 0 = Ashwini .. 26 = Revati
        std::string_view name;
        Body lord = Body::SouthNode;
        i32 lord_sequence = 0;         ///< Position of the lord in kDashaLords
        i32 pada = 1;                  ///< 1..4
        f64 degrees_elapsed = 0.0;     ///< Within the nakshatra
        f64 fraction_elapsed = 0.0;    ///< [0, 1)
    };

    /// @brief Nakshatra of a sidereal longitude (normalized first).
    [[nodiscard]] NakshatraInfo nakshatra_of(f64 sidereal_longitude);

    [[nodiscard]] std::string_view nakshatra_name(i32 index);

    /// @brief Traditional name of a dasha lord ("Rahu", "Ketu", "Venus", ...).
    [[nodiscard]] std::string_view lord_name(Body body);

    /// @brief Position of a body in the lord order, or -1.
    [[nodiscard]] i32 lord_sequence_of(Body body);

} // namespace astrolabe::vedic
