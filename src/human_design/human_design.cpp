/// @file human_design.cpp
/// @brief Design-moment search, gate activation and bodygraph classification.

#include "human_design/human_design.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <queue>

namespace astrolabe::human_design
{

namespace
{
    constexpr const char* kStep = "human_design";

    using Adjacency = std::array<std::array<bool, kCenterCount>, kCenterCount>;

    std::size_t idx(Center c)
    {
        return static_cast<std::size_t>(c);
    }

    /// Centers reachable from @p start through active channels.
    std::array<bool, kCenterCount> reachable_from(const Adjacency& adj, Center start)
    {
        std::array<bool, kCenterCount> seen{};
        std::queue<std::size_t> open;
        seen[idx(start)] = true;
        open.push(idx(start));
        while (!open.empty())
        {
            const std::size_t current = open.front();
            open.pop();
            for (std::size_t next = 0; next < kCenterCount; ++next)
            {
                if (adj[current][next] && !seen[next])
                {
                    seen[next] = true;
                    open.push(next);
                }
            }
        }
        return seen;
    }

    bool connected(const Bodygraph& graph, const Adjacency& adj, Center a, Center b)
    {
        return graph.defined(a) && graph.defined(b) && reachable_from(adj, a)[idx(b)];
    }

    HdType classify_type(const Bodygraph& graph, const Adjacency& adj)
    {
        const bool any_defined = std::any_of(graph.centers.begin(), graph.centers.end(),
                                             [](const CenterState& c) { return c.defined; });
        if (!any_defined)
        {
            return HdType::Reflector;
        }

        bool motor_to_throat = false;
        for (const Center motor : {Center::Sacral, Center::SolarPlexus, Center::Heart, Center::Root})
        {
            motor_to_throat = motor_to_throat || connected(graph, adj, motor, Center::Throat);
        }

        if (graph.defined(Center::Sacral))
        {
            return motor_to_throat ? HdType::ManifestingGenerator : HdType::Generator;
        }
        return motor_to_throat ? HdType::Manifestor : HdType::Projector;
    }

    Authority classify_authority(const Bodygraph& graph, const Adjacency& adj)
    {
        if (graph.type == HdType::Reflector)
        {
            return Authority::Lunar;
        }
        if (graph.defined(Center::SolarPlexus))
        {
            return Authority::Emotional;
        }
        if (graph.defined(Center::Sacral))
        {
            return Authority::Sacral;
        }
        if (graph.defined(Center::Spleen))
        {
            return Authority::Splenic;
        }
        if (graph.defined(Center::Heart))
        {
            return (graph.has_channel(21, 45) && graph.type == HdType::Manifestor)
                ? Authority::EgoManifested
                : Authority::EgoProjected;
        }
        if (connected(graph, adj, Center::G, Center::Throat))
        {
            return Authority::SelfProjected;
        }
        if (graph.type == HdType::Projector)
        {
            return Authority::Mental;
        }
        return Authority::None;
    }

    Definition classify_definition(const Bodygraph& graph, const Adjacency& adj)
    {
        std::array<bool, kCenterCount> visited{};
        i32 components = 0;
        for (const auto& state : graph.centers)
        {
            if (!state.defined || visited[idx(state.center)])
            {
                continue;
            }
            ++components;
            const auto reach = reachable_from(adj, state.center);
            for (std::size_t i = 0; i < kCenterCount; ++i)
            {
                visited[i] = visited[i] || reach[i];
            }
        }

        switch (components)
        {
        case 0:  return Definition::None;
        case 1:  return Definition::Single;
        case 2:  return Definition::Split;
        case 3:  return Definition::TripleSplit;
        default: return Definition::QuadrupleSplit;
        }
    }

    std::vector<Activation> activate(std::span<const astro::BodyPosition> positions)
    {
        std::vector<Activation> result;
        result.reserve(positions.size());
        for (const auto& pos : positions)
        {
            result.push_back(Activation{
                .body = pos.body,
                .longitude = pos.longitude,
                .gate = activation_at(pos.longitude),
            });
        }
        return result;
    }

    const Activation& activation_of(const std::vector<Activation>& activations, Body body)
    {
        const auto it = std::find_if(activations.begin(), activations.end(),
                                     [body](const Activation& a) { return a.body == body; });
        if (it == activations.end())
        {
            throw IncompleteChartData(kStep, std::string(astro::body_name(body)) + " activation is required");
        }
        return *it;
    }

    Variable variable_of(const Activation& a)
    {
        return Variable{
            .color = a.gate.color,
            .tone = a.gate.tone,
            .arrow = a.gate.color <= 3 ? Arrow::Left : Arrow::Right,
        };
    }

    f64 tropical_sun(const astro::EphemerisProvider& provider, f64 jd)
    {
        return astro::resolve_raw_position(provider, jd, Body::Sun).longitude_deg;
    }
} // namespace

// -----------------------------------------------------------------
// Names
// -----------------------------------------------------------------

std::string_view type_name(HdType type)
{
    switch (type)
    {
    case HdType::Generator:            return "Generator";
    case HdType::ManifestingGenerator: return "Manifesting Generator";
    case HdType::Manifestor:           return "Manifestor";
    case HdType::Projector:            return "Projector";
    case HdType::Reflector:            return "Reflector";
    }
    return "Unknown";
}

std::string_view authority_name(Authority authority)
{
    switch (authority)
    {
    case Authority::Emotional:     return "Emotional";
    case Authority::Sacral:        return "Sacral";
    case Authority::Splenic:       return "Splenic";
    case Authority::EgoManifested: return "Ego Manifested";
    case Authority::EgoProjected:  return "Ego Projected";
    case Authority::SelfProjected: return "Self-Projected";
    case Authority::Mental:        return "Mental";
    case Authority::Lunar:         return "Lunar";
    case Authority::None:          return "None";
    }
    return "Unknown";
}

std::string_view definition_name(Definition definition)
{
    switch (definition)
    {
    case Definition::None:           return "None";
    case Definition::Single:         return "Single";
    case Definition::Split:          return "Split";
    case Definition::TripleSplit:    return "Triple Split";
    case Definition::QuadrupleSplit: return "Quadruple Split";
    }
    return "Unknown";
}

bool Bodygraph::has_channel(i32 gate_a, i32 gate_b) const
{
    return std::any_of(channels.begin(), channels.end(), [gate_a, gate_b](const ActiveChannel& c) {
        return (c.definition.gate_a == gate_a && c.definition.gate_b == gate_b)
            || (c.definition.gate_a == gate_b && c.definition.gate_b == gate_a);
    });
}

// -----------------------------------------------------------------
// Design moment: bisection on the Sun's longitude
// -----------------------------------------------------------------

astro::Moment find_design_moment(const astro::Moment& birth,
                                 const astro::EphemerisProvider& provider,
                                 const HumanDesignConfig& config)
{
    if (!(config.search_min_days < config.search_max_days) || config.max_iterations <= 0)
    {
        ASL_CORE_ERROR("HumanDesign: invalid search window [{}, {}] days", config.search_min_days, config.search_max_days);
        throw InvalidInput(kStep, "design search window must be non-empty");
    }

    // Birth itself must be covered; only gaps inside the window count as a short range
    const f64 target = normalize_degrees(tropical_sun(provider, birth.jd_ut()) - config.solar_arc_deg);

    try
    {
        auto error_at = [&](f64 jd) { return signed_difference(tropical_sun(provider, jd), target); };

        f64 lo = birth.jd_ut() - config.search_max_days;
        f64 hi = birth.jd_ut() - config.search_min_days;
        const f64 err_lo = error_at(lo);
        const f64 err_hi = error_at(hi);

        if (!(err_lo <= 0.0 && err_hi >= 0.0))
        {
            ASL_CORE_ERROR("HumanDesign: window does not bracket Sun {:.5f} (errors {:.4f}, {:.4f})", target, err_lo, err_hi);
            throw InsufficientEphemerisRange(kStep, "search window does not bracket the design Sun");
        }

        for (i32 i = 0; i < config.max_iterations; ++i)
        {
            const f64 mid = 0.5 * (lo + hi);
            const f64 err = error_at(mid);
            if (std::abs(err) <= config.tolerance_deg)
            {
                ASL_CORE_DEBUG("HumanDesign: design moment JD {:.6f} after {} iterations", mid, i + 1);
                return astro::Moment(mid, birth.utc_offset_minutes());
            }
            if (err < 0.0)
            {
                lo = mid;
            }
            else
            {
                hi = mid;
            }
        }
    }
    catch (const EphemerisUnavailable& e)
    {
        ASL_CORE_ERROR("HumanDesign: ephemeris exhausted during design search: {}", e.what());
        throw InsufficientEphemerisRange(kStep, std::string("ephemeris cannot cover the design search: ") + e.what());
    }

    ASL_CORE_ERROR("HumanDesign: design search did not converge in {} iterations", config.max_iterations);
    throw InsufficientEphemerisRange(kStep, "design search did not converge");
}

// -----------------------------------------------------------------
// Bodygraph
// -----------------------------------------------------------------

Bodygraph analyze_bodygraph(std::span<const i32> gates)
{
    Bodygraph graph;
    graph.active_gates.assign(gates.begin(), gates.end());
    std::sort(graph.active_gates.begin(), graph.active_gates.end());
    graph.active_gates.erase(std::unique(graph.active_gates.begin(), graph.active_gates.end()),
                             graph.active_gates.end());

    for (std::size_t i = 0; i < kCenterCount; ++i)
    {
        graph.centers[i].center = static_cast<Center>(i);
    }
    for (const i32 gate : graph.active_gates)
    {
        graph.centers[idx(center_of_gate(gate))].active_gates.push_back(gate);
    }

    auto active = [&graph](i32 gate) {
        return std::binary_search(graph.active_gates.begin(), graph.active_gates.end(), gate);
    };

    Adjacency adj{};
    for (const auto& channel : channel_catalog())
    {
        if (!active(channel.gate_a) || !active(channel.gate_b))
        {
            continue;
        }
        const Center a = center_of_gate(channel.gate_a);
        const Center b = center_of_gate(channel.gate_b);
        graph.channels.push_back(ActiveChannel{channel, a, b});
        graph.centers[idx(a)].defined = true;
        graph.centers[idx(b)].defined = true;
        adj[idx(a)][idx(b)] = true;
        adj[idx(b)][idx(a)] = true;
    }

    graph.type = classify_type(graph, adj);
    graph.authority = classify_authority(graph, adj);
    graph.definition = classify_definition(graph, adj);
    return graph;
}

// -----------------------------------------------------------------
// Full chart
// -----------------------------------------------------------------

HumanDesignChart calculate_human_design(const astro::Moment& birth,
                                        const astro::GeoLocation& location,
                                        const astro::EphemerisProvider& provider,
                                        const HumanDesignConfig& config)
{
    astro::validate_location(location, kStep);

    const astro::PositionConfig positions_config{
        .zodiac = config.zodiac,
        .ayanamsa = config.ayanamsa,
    };

    HumanDesignChart chart;
    chart.birth = birth;
    chart.location = location;
    chart.design = find_design_moment(birth, provider, config);

    chart.personality = activate(astro::calculate_positions(birth, kTrackedBodies, provider, positions_config));
    chart.design_activations = activate(astro::calculate_positions(chart.design, kTrackedBodies, provider, positions_config));

    std::vector<i32> gates;
    for (const auto* snapshot : {&chart.personality, &chart.design_activations})
    {
        for (const auto& a : *snapshot)
        {
            gates.push_back(a.gate.gate);
        }
    }
    chart.bodygraph = analyze_bodygraph(gates);

    const auto& p_sun = activation_of(chart.personality, Body::Sun);
    const auto& p_earth = activation_of(chart.personality, Body::Earth);
    const auto& d_sun = activation_of(chart.design_activations, Body::Sun);
    const auto& d_earth = activation_of(chart.design_activations, Body::Earth);

    chart.personality_line = p_sun.gate.line;
    chart.design_line = d_sun.gate.line;
    chart.profile = fmt::format("{}/{}", chart.personality_line, chart.design_line);

    auto& cross = chart.cross;
    cross.personality_sun = p_sun.gate.gate;
    cross.personality_earth = p_earth.gate.gate;
    cross.design_sun = d_sun.gate.gate;
    cross.design_earth = d_earth.gate.gate;
    if (chart.personality_line == 4 && chart.design_line == 1)
    {
        cross.angle = "Juxtaposition";
    }
    else if (chart.personality_line >= 5)
    {
        cross.angle = "Left Angle";
    }
    else
    {
        cross.angle = "Right Angle";
    }
    cross.quarter = quarter_of_gate(cross.personality_sun);
    cross.label = fmt::format("{} Cross ({}/{} | {}/{})", cross.angle,
                              cross.personality_sun, cross.personality_earth,
                              cross.design_sun, cross.design_earth);

    chart.variables = Variables{
        .digestion = variable_of(d_sun),
        .environment = variable_of(d_earth),
        .cognition = variable_of(p_sun),
        .perspective = variable_of(p_earth),
    };

    ASL_CORE_DEBUG("HumanDesign: {} / {} authority, profile {}, {} channels",
                   type_name(chart.bodygraph.type), authority_name(chart.bodygraph.authority),
                   chart.profile, chart.bodygraph.channels.size());
    return chart;
}

} // namespace astrolabe::human_design
