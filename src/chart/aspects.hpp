#pragma once

/// @file aspects.hpp
/// @brief Angular relationships between body pairs.

#include "astro/bodies.hpp"
#include "astro/positions.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::chart
{
    using astro::Body;
    using astro::BodyPosition;

    enum class AspectType : u8
    {
        Conjunction,
        Opposition,
        Trine,
        Square,
        Sextile,
        SemiSextile,
        SemiSquare,
        Sesquiquadrate,
        Quincunx,
        Quintile,
        Biquintile,
    };

    /// @brief Fixed catalog entry for one aspect type.
    struct AspectDefinition
    {
        AspectType type;
        std::string_view name;
        f64 angle;
        f64 default_orb;
        bool major;
    };

    /// @brief The full aspect catalog, majors first.
    [[nodiscard]] std::span<const AspectDefinition> aspect_catalog();

    [[nodiscard]] const AspectDefinition& aspect_definition(AspectType type);

    [[nodiscard]] std::string_view aspect_name(AspectType type);

    struct OrbConfig
    {
        bool include_minor = false;
        f64 orb_multiplier = 1.0;
        std::map<AspectType, f64> orb_overrides;   ///< Replaces the catalog orb before scaling

        /// @brief Effective orb of a type, or nullopt when the type is disabled.
        [[nodiscard]] std::optional<f64> orb_for(AspectType type) const;
    };

    struct Aspect
    {
        Body first = Body::Sun;    ///< Lower body id of the pair
        Body second = Body::Sun;
        AspectType type = AspectType::Conjunction;
        f64 exact_angle = 0.0;
        f64 separation = 0.0;      ///< [0, 180]
        f64 orb = 0.0;             ///< |separation − exact_angle|
        bool applying = false;

        [[nodiscard]] bool involves(Body body) const { return first == body || second == body; }
        [[nodiscard]] Body other(Body body) const { return first == body ? second : first; }
    };

    /// @brief Angular separation min(d, 360 − d) of two longitudes.
    [[nodiscard]] f64 angular_separation(f64 lon_a, f64 lon_b);

    /// @brief Aspect between two positions, if any type qualifies.
    ///
    /// The result is the same whichever argument comes first.
    [[nodiscard]] std::optional<Aspect> aspect_between(const BodyPosition& a, const BodyPosition& b,
                                                       const OrbConfig& config = {});

    /// @brief All aspects among a position set, sorted by body pair.
    [[nodiscard]] std::vector<Aspect> find_aspects(std::span<const BodyPosition> positions,
                                                   const OrbConfig& config = {});

    /// @brief Look up the aspect recorded for an unordered pair.
    [[nodiscard]] std::optional<Aspect> find_aspect(std::span<const Aspect> aspects, Body a, Body b);

} // namespace astrolabe::chart
