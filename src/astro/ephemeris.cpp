/// @file ephemeris.cpp
/// @brief Derived-body resolution on top of an EphemerisProvider.

#include "astro/ephemeris.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

namespace astrolabe::astro
{

RawPosition resolve_raw_position(const EphemerisProvider& provider, f64 jd_ut, Body body)
{
    if (is_chart_point(body))
    {
        ASL_CORE_ERROR("Ephemeris: {} is a chart point, not an ephemeris body", body_name(body));
        throw InvalidInput("positions", std::string(body_name(body)) + " is resolved by the house calculator");
    }

    if (!is_derived(body))
    {
        RawPosition raw = provider.position(jd_ut, body);
        raw.longitude_deg = normalize_degrees(raw.longitude_deg);
        return raw;
    }

    // SouthNode mirrors the node; Earth mirrors the Sun
    const Body source = (body == Body::SouthNode) ? Body::NorthNode : Body::Sun;
    RawPosition raw = provider.position(jd_ut, source);
    raw.longitude_deg = normalize_degrees(raw.longitude_deg + 180.0);
    raw.latitude_deg = -raw.latitude_deg;
    return raw;
}

} // namespace astrolabe::astro
