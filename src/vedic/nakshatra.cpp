/// @file nakshatra.cpp
/// @brief Nakshatra table lookups.

#include "vedic/nakshatra.hpp"

#include <algorithm>
#include <cmath>

namespace astrolabe::vedic
{

namespace
{
    constexpr std::array<std::string_view, kNakshatraCount> kNakshatraNames = {
        "Ashwini", "Bharani", "Krittika", "Rohini", "Mrigashira", "Ardra",
        "Punarvasu", "Pushya", "Ashlesha", "Magha", "Purva Phalguni", "Uttara Phalguni",
        "Hasta", "Chitra", "Swati", "Vishakha", "Anuradha", "Jyeshtha",
        "Mula", "Purva Ashadha", "Uttara Ashadha", "Shravana", "Dhanishta", "Shatabhisha",
        "Purva Bhadrapada", "Uttara Bhadrapada", "Revati",
    };
} // namespace

NakshatraInfo nakshatra_of(f64 sidereal_longitude)
{
    const f64 lon = normalize_degrees(sidereal_longitude);
    const i32 index = std::clamp(static_cast<i32>(std::floor(lon / kNakshatraSpan)), 0, kNakshatraCount - 1);
    const f64 within = std::clamp(lon - static_cast<f64>(index) * kNakshatraSpan, 0.0, kNakshatraSpan);

    NakshatraInfo info;
    info.index = index;
    info.name = kNakshatraNames[static_cast<std::size_t>(index)];
    info.lord_sequence = index % static_cast<i32>(kDashaLords.size());
    info.lord = kDashaLords[static_cast<std::size_t>(info.lord_sequence)].body;
    info.degrees_elapsed = within;
    info.fraction_elapsed = std::min(within / kNakshatraSpan, std::nextafter(1.0, 0.0));
    info.pada = std::clamp(static_cast<i32>(within / kPadaSpan) + 1, 1, 4);
    return info;
}

std::string_view nakshatra_name(i32 index)
{
    if (index < 0 || index >= kNakshatraCount)
    {
        return "Unknown";
    }
    return kNakshatraNames[static_cast<std::size_t>(index)];
}

std::string_view lord_name(Body body)
{
    switch (body)
    {
    case Body::NorthNode: return "Rahu";
    case Body::SouthNode: return "Ketu";
    default:              return astro::body_name(body);
    }
}

i32 lord_sequence_of(Body body)
{
    for (std::size_t i = 0; i < kDashaLords.size(); ++i)
    {
        if (kDashaLords[i].body == body)
        {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

} // namespace astrolabe::vedic
