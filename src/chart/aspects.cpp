/// @file aspects.cpp
/// @brief Aspect catalog, orb matching and applying/separating direction.

#include "chart/aspects.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace astrolabe::chart
{

namespace
{
    constexpr std::array<AspectDefinition, 11> kCatalog = {{
        {AspectType::Conjunction,    "Conjunction",     0.0, 10.0, true},
        {AspectType::Opposition,     "Opposition",    180.0, 10.0, true},
        {AspectType::Trine,          "Trine",         120.0,  8.0, true},
        {AspectType::Square,         "Square",         90.0,  8.0, true},
        {AspectType::Sextile,        "Sextile",        60.0,  6.0, true},
        {AspectType::SemiSextile,    "Semi-Sextile",   30.0,  2.0, false},
        {AspectType::SemiSquare,     "Semi-Square",    45.0,  2.0, false},
        {AspectType::Sesquiquadrate, "Sesquiquadrate",135.0,  2.0, false},
        {AspectType::Quincunx,       "Quincunx",      150.0,  3.0, false},
        {AspectType::Quintile,       "Quintile",       72.0,  2.0, false},
        {AspectType::Biquintile,     "Biquintile",    144.0,  2.0, false},
    }};

    f64 sign_of_value(f64 v)
    {
        return (v > 0.0) - (v < 0.0);
    }

    /// Rate of change of the orb; negative means the aspect is tightening.
    bool is_applying(const BodyPosition& a, const BodyPosition& b, f64 separation, f64 exact_angle)
    {
        const f64 s = signed_difference(b.longitude, a.longitude);
        const f64 relative_speed = b.speed - a.speed;
        const f64 separation_rate = (s == 0.0) ? std::abs(relative_speed)
                                               : sign_of_value(s) * relative_speed;
        const f64 orb_rate = sign_of_value(separation - exact_angle) * separation_rate;
        return orb_rate < 0.0;
    }
} // namespace

std::span<const AspectDefinition> aspect_catalog()
{
    return kCatalog;
}

const AspectDefinition& aspect_definition(AspectType type)
{
    return kCatalog[static_cast<std::size_t>(type)];
}

std::string_view aspect_name(AspectType type)
{
    return aspect_definition(type).name;
}

std::optional<f64> OrbConfig::orb_for(AspectType type) const
{
    const auto& def = aspect_definition(type);
    if (!def.major && !include_minor)
    {
        return std::nullopt;
    }

    f64 orb = def.default_orb;
    if (const auto it = orb_overrides.find(type); it != orb_overrides.end())
    {
        orb = it->second;
    }
    return orb * orb_multiplier;
}

f64 angular_separation(f64 lon_a, f64 lon_b)
{
    const f64 d = std::abs(normalize_degrees(lon_a) - normalize_degrees(lon_b));
    return std::min(d, zodiac::kFullCircle - d);
}

std::optional<Aspect> aspect_between(const BodyPosition& a, const BodyPosition& b, const OrbConfig& config)
{
    if (a.body == b.body)
    {
        return std::nullopt;
    }

    // Canonical order: lower body id first
    const BodyPosition& lo = (a.body < b.body) ? a : b;
    const BodyPosition& hi = (a.body < b.body) ? b : a;

    const f64 separation = angular_separation(lo.longitude, hi.longitude);

    std::optional<Aspect> best;
    for (const auto& def : kCatalog)
    {
        const auto tolerance = config.orb_for(def.type);
        if (!tolerance)
        {
            continue;
        }

        const f64 orb = std::abs(separation - def.angle);
        if (orb > *tolerance)
        {
            continue;
        }
        if (best && best->orb <= orb)
        {
            continue;
        }

        best = Aspect{
            .first = lo.body,
            .second = hi.body,
            .type = def.type,
            .exact_angle = def.angle,
            .separation = separation,
            .orb = orb,
            .applying = is_applying(lo, hi, separation, def.angle),
        };
    }
    return best;
}

std::vector<Aspect> find_aspects(std::span<const BodyPosition> positions, const OrbConfig& config)
{
    if (config.orb_multiplier < 0.0)
    {
        ASL_CORE_ERROR("Aspects: negative orb multiplier {}", config.orb_multiplier);
        throw InvalidInput("aspects", "orb multiplier must not be negative");
    }

    std::vector<Aspect> aspects;
    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        for (std::size_t j = i + 1; j < positions.size(); ++j)
        {
            if (auto aspect = aspect_between(positions[i], positions[j], config))
            {
                aspects.push_back(*aspect);
            }
        }
    }

    std::sort(aspects.begin(), aspects.end(), [](const Aspect& x, const Aspect& y) {
        return std::pair(x.first, x.second) < std::pair(y.first, y.second);
    });

    ASL_CORE_DEBUG("Aspects: {} found among {} positions", aspects.size(), positions.size());
    return aspects;
}

std::optional<Aspect> find_aspect(std::span<const Aspect> aspects, Body a, Body b)
{
    const Body lo = std::min(a, b);
    const Body hi = std::max(a, b);
    const auto it = std::find_if(aspects.begin(), aspects.end(), [lo, hi](const Aspect& x) {
        return x.first == lo && x.second == hi;
    });
    if (it == aspects.end())
    {
        return std::nullopt;
    }
    return *it;
}

} // namespace astrolabe::chart
