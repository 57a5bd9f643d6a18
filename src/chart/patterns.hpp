#pragma once

/// @file patterns.hpp
/// @brief Multi-body configurations detected over an aspect set.

#include "astro/houses.hpp"
#include "chart/aspects.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::chart
{
    enum class PatternType : u8
    {
        GrandTrine,
        TSquare,
        GrandCross,
        Yod,
        SignStellium,
        HouseStellium,
    };

    [[nodiscard]] std::string_view pattern_name(PatternType type);

    struct PatternConfig
    {
        i32 min_stellium_bodies = 3;
        f64 max_stellium_span_deg = 30.0;
    };

    struct Pattern
    {
        PatternType type = PatternType::GrandTrine;
        std::vector<Body> bodies;         ///< Ascending body id
        std::optional<Body> apex;         ///< T-square and yod focal body
        std::optional<i32> sign;          ///< Sign stellium
        std::optional<i32> house;         ///< House stellium (1..12)
        f64 span = 0.0;                   ///< Stellium longitude span
    };

    /// @brief Scan aspects and positions for patterns.
    ///
    /// House stelliums are only reported when @p houses is supplied.
    /// Chart points never join a stellium.
    [[nodiscard]] std::vector<Pattern> detect_patterns(std::span<const Aspect> aspects,
                                                       std::span<const BodyPosition> positions,
                                                       const PatternConfig& config = {},
                                                       const astro::HouseSystem* houses = nullptr);

    struct AspectReport
    {
        std::vector<Aspect> aspects;
        std::vector<Pattern> patterns;
    };

    /// @brief Aspects followed by pattern detection over them.
    [[nodiscard]] AspectReport calculate_aspects(std::span<const BodyPosition> positions,
                                                 const OrbConfig& orbs = {},
                                                 const PatternConfig& patterns = {},
                                                 const astro::HouseSystem* houses = nullptr);

} // namespace astrolabe::chart
