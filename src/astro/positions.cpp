/// @file positions.cpp
/// @brief Position resolver: provider output → zodiacal BodyPosition.

#include "astro/positions.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace astrolabe::astro
{

namespace
{
    constexpr f64 kNakshatraSpan = zodiac::kFullCircle / 27.0;
}

std::string_view zodiac_name(ZodiacMode mode)
{
    return mode == ZodiacMode::Sidereal ? "sidereal" : "tropical";
}

i32 BodyPosition::nakshatra_index() const
{
    const auto index = static_cast<i32>(std::floor(normalize_degrees(longitude) / kNakshatraSpan));
    return std::clamp(index, 0, 26);
}

BodyPosition make_position(Body body, f64 longitude, f64 speed, ZodiacMode zodiac)
{
    BodyPosition pos;
    pos.body = body;
    pos.longitude = normalize_degrees(longitude);
    pos.speed = speed;
    pos.zodiac = zodiac;
    return pos;
}

BodyPosition calculate_position(const Moment& moment, Body body,
                                const EphemerisProvider& provider,
                                const PositionConfig& config)
{
    const RawPosition raw = resolve_raw_position(provider, moment.jd_ut(), body);

    f64 longitude = raw.longitude_deg;
    if (config.zodiac == ZodiacMode::Sidereal)
    {
        longitude -= provider.ayanamsa(config.ayanamsa, moment.jd_ut());
    }

    BodyPosition pos = make_position(body, longitude, raw.speed_deg_per_day, config.zodiac);
    pos.latitude = raw.latitude_deg;
    pos.distance_au = raw.distance_au;
    return pos;
}

std::vector<BodyPosition> calculate_positions(const Moment& moment,
                                              std::span<const Body> bodies,
                                              const EphemerisProvider& provider,
                                              const PositionConfig& config)
{
    std::vector<BodyPosition> result;
    result.reserve(bodies.size());

    for (const Body body : bodies)
    {
        const bool seen = std::any_of(result.begin(), result.end(),
                                      [body](const BodyPosition& p) { return p.body == body; });
        if (seen)
        {
            continue;
        }
        result.push_back(calculate_position(moment, body, provider, config));
    }

    ASL_CORE_DEBUG("Positions: resolved {} bodies at JD {:.5f} ({})",
                   result.size(), moment.jd_ut(), zodiac_name(config.zodiac));
    return result;
}

std::optional<BodyPosition> find_position(std::span<const BodyPosition> positions, Body body)
{
    const auto it = std::find_if(positions.begin(), positions.end(),
                                 [body](const BodyPosition& p) { return p.body == body; });
    if (it == positions.end())
    {
        return std::nullopt;
    }
    return *it;
}

} // namespace astrolabe::astro
