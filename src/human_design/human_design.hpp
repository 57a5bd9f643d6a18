#pragma once

/// @file human_design.hpp
/// @brief Personality/Design activations and the bodygraph derived from them.

#include "astro/ephemeris.hpp"
#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "human_design/gate_wheel.hpp"
#include "core/types.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace astrolabe::human_design
{
    using astro::Body;

    /// @brief Bodies placed on the wheel in both snapshots.
    inline constexpr std::array<Body, 13> kTrackedBodies = {
        Body::Sun, Body::Earth, Body::Moon, Body::NorthNode, Body::SouthNode,
        Body::Mercury, Body::Venus, Body::Mars, Body::Jupiter, Body::Saturn,
        Body::Uranus, Body::Neptune, Body::Pluto,
    };

    enum class HdType : u8
    {
        Generator,
        ManifestingGenerator,
        Manifestor,
        Projector,
        Reflector,
    };

    enum class Authority : u8
    {
        Emotional,
        Sacral,
        Splenic,
        EgoManifested,
        EgoProjected,
        SelfProjected,
        Mental,
        Lunar,
        None,
    };

    enum class Definition : u8
    {
        None,
        Single,
        Split,
        TripleSplit,
        QuadrupleSplit,
    };

    enum class Arrow : u8
    {
        Left,
        Right,
    };

    [[nodiscard]] std::string_view type_name(HdType type);
    [[nodiscard]] std::string_view authority_name(Authority authority);
    [[nodiscard]] std::string_view definition_name(Definition definition);

    struct HumanDesignConfig
    {
        f64 solar_arc_deg = 88.0;
        f64 search_min_days = 84.0;    ///< Nearest edge of the search window before birth
        f64 search_max_days = 96.0;    ///< Farthest edge of the search window before birth
        f64 tolerance_deg = 1e-5;
        i32 max_iterations = 60;
        astro::ZodiacMode zodiac = astro::ZodiacMode::Tropical;
        astro::AyanamsaId ayanamsa = astro::AyanamsaId::Lahiri;
    };

    struct Activation
    {
        Body body = Body::Sun;
        f64 longitude = 0.0;
        GateActivation gate;
    };

    struct ActiveChannel
    {
        ChannelDefinition definition;
        Center center_a;
        Center center_b;
    };

    struct CenterState
    {
        Center center = Center::Head;
        bool defined = false;
        std::vector<i32> active_gates;
    };

    /// @brief Channels, centers and the classifications that follow from a gate set.
    struct Bodygraph
    {
        std::vector<i32> active_gates;                 ///< Sorted, unique
        std::vector<ActiveChannel> channels;
        std::array<CenterState, kCenterCount> centers{};
        HdType type = HdType::Reflector;
        Authority authority = Authority::Lunar;
        Definition definition = Definition::None;

        [[nodiscard]] bool defined(Center center) const { return centers[static_cast<std::size_t>(center)].defined; }
        [[nodiscard]] bool has_channel(i32 gate_a, i32 gate_b) const;
    };

    struct IncarnationCross
    {
        i32 personality_sun = 0;
        i32 personality_earth = 0;
        i32 design_sun = 0;
        i32 design_earth = 0;
        std::string_view angle;     ///< Right Angle, Left Angle or Juxtaposition
        std::string_view quarter;
        std::string label;
    };

    struct Variable
    {
        i32 color = 1;
        i32 tone = 1;
        Arrow arrow = Arrow::Left;
    };

    struct Variables
    {
        Variable digestion;     ///< Design Sun
        Variable environment;   ///< Design Earth
        Variable cognition;     ///< Personality Sun
        Variable perspective;   ///< Personality Earth
    };

    struct HumanDesignChart
    {
        astro::Moment birth{0.0};
        astro::Moment design{0.0};
        astro::GeoLocation location;
        std::vector<Activation> personality;
        std::vector<Activation> design_activations;
        Bodygraph bodygraph;
        i32 personality_line = 1;
        i32 design_line = 1;
        std::string profile;        ///< "p/d", e.g. "1/3"
        IncarnationCross cross;
        Variables variables;
    };

    /// @brief Moment before birth when the Sun stood @c solar_arc_deg behind its birth longitude.
    ///
    /// Bisection over the configured window. Throws InsufficientEphemerisRange
    /// when the window does not bracket the target, the search does not
    /// converge, or the provider cannot cover the window.
    [[nodiscard]] astro::Moment find_design_moment(const astro::Moment& birth,
                                                   const astro::EphemerisProvider& provider,
                                                   const HumanDesignConfig& config = {});

    /// @brief Channels, centers, type, authority and definition for a set of active gates.
    [[nodiscard]] Bodygraph analyze_bodygraph(std::span<const i32> gates);

    /// @brief Full chart: both snapshots, bodygraph, profile, cross and variables.
    ///
    /// The location is validated and recorded; geocentric positions do not depend on it.
    [[nodiscard]] HumanDesignChart calculate_human_design(const astro::Moment& birth,
                                                          const astro::GeoLocation& location,
                                                          const astro::EphemerisProvider& provider,
                                                          const HumanDesignConfig& config = {});

} // namespace astrolabe::human_design
