#pragma once

/// @file bodies.hpp
/// @brief Celestial body identifiers and their fixed name tables.

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace astrolabe::astro
{
    /// @brief Bodies and chart points tracked by the engine.
    ///
    /// The enum order is the canonical ordering used for aspect pairs.
    enum class Body : u8
    {
        Sun,
        Moon,
        Mercury,
        Venus,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
        NorthNode,   ///< Mean lunar node (Rahu)
        SouthNode,   ///< NorthNode + 180° (Ketu)
        Earth,       ///< Sun + 180°
        Ascendant,   ///< Chart point, resolved by the house calculator
        Midheaven,   ///< Chart point, resolved by the house calculator
    };

    inline constexpr std::size_t kBodyCount = 15;

    /// @brief The seven classical planets in traditional order.
    inline constexpr std::array<Body, 7> kClassicalPlanets = {
        Body::Sun, Body::Moon, Body::Mars, Body::Mercury,
        Body::Jupiter, Body::Venus, Body::Saturn,
    };

    /// @brief Bodies resolved by default in a natal chart.
    inline constexpr std::array<Body, 12> kDefaultChartBodies = {
        Body::Sun, Body::Moon, Body::Mercury, Body::Venus, Body::Mars,
        Body::Jupiter, Body::Saturn, Body::Uranus, Body::Neptune, Body::Pluto,
        Body::NorthNode, Body::SouthNode,
    };

    [[nodiscard]] std::string_view body_name(Body body);

    /// @brief Two-letter code used in compact listings ("Su", "Mo", ...).
    [[nodiscard]] std::string_view body_code(Body body);

    /// @brief Zodiac sign name for a sign index 0..11.
    [[nodiscard]] std::string_view sign_name(i32 sign);

    /// @brief True for Ascendant and Midheaven.
    [[nodiscard]] constexpr bool is_chart_point(Body body)
    {
        return body == Body::Ascendant || body == Body::Midheaven;
    }

    /// @brief True for bodies derived from another body rather than queried.
    [[nodiscard]] constexpr bool is_derived(Body body)
    {
        return body == Body::SouthNode || body == Body::Earth;
    }

    [[nodiscard]] constexpr std::size_t body_index(Body body)
    {
        return static_cast<std::size_t>(body);
    }

} // namespace astrolabe::astro
