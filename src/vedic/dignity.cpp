/// @file dignity.cpp
/// @brief Exaltation, debilitation, own-sign and moolatrikona tables.

#include "vedic/dignity.hpp"

#include "core/error.hpp"

#include <algorithm>

namespace astrolabe::vedic
{

namespace
{
    constexpr std::array<DignityEntry, 7> kDignities = {{
        {Body::Sun,     0, 10.0,  6, {4, -1},  4},
        {Body::Moon,    1,  3.0,  7, {3, -1},  1},
        {Body::Mars,    9, 28.0,  3, {0, 7},   0},
        {Body::Mercury, 5, 15.0, 11, {2, 5},   5},
        {Body::Jupiter, 3,  5.0,  9, {8, 11},  8},
        {Body::Venus,  11, 27.0,  5, {1, 6},   6},
        {Body::Saturn,  6, 20.0,  0, {9, 10}, 10},
    }};

    constexpr std::array<Body, 12> kSignLords = {
        Body::Mars, Body::Venus, Body::Mercury, Body::Moon, Body::Sun, Body::Mercury,
        Body::Venus, Body::Mars, Body::Jupiter, Body::Saturn, Body::Saturn, Body::Jupiter,
    };
} // namespace

std::string_view dignity_name(Dignity dignity)
{
    switch (dignity)
    {
    case Dignity::Exalted:      return "Exalted";
    case Dignity::Moolatrikona: return "Moolatrikona";
    case Dignity::OwnSign:      return "Own Sign";
    case Dignity::Neutral:      return "Neutral";
    case Dignity::Debilitated:  return "Debilitated";
    }
    return "Unknown";
}

std::optional<DignityEntry> dignity_entry(Body planet)
{
    const auto it = std::find_if(kDignities.begin(), kDignities.end(),
                                 [planet](const DignityEntry& e) { return e.planet == planet; });
    if (it == kDignities.end())
    {
        return std::nullopt;
    }
    return *it;
}

Dignity dignity_of(Body planet, f64 longitude)
{
    const auto entry = dignity_entry(planet);
    if (!entry)
    {
        return Dignity::Neutral;
    }

    const i32 sign = sign_of(longitude);
    if (sign == entry->exaltation_sign)
    {
        return Dignity::Exalted;
    }
    if (sign == entry->debilitation_sign)
    {
        return Dignity::Debilitated;
    }
    if (sign == entry->moolatrikona_sign)
    {
        return Dignity::Moolatrikona;
    }
    if (sign == entry->own_signs[0] || sign == entry->own_signs[1])
    {
        return Dignity::OwnSign;
    }
    return Dignity::Neutral;
}

Body sign_lord(i32 sign)
{
    if (sign < 0 || sign >= zodiac::kSignCount)
    {
        throw InvalidInput("dignity", "sign index must be 0..11");
    }
    return kSignLords[static_cast<std::size_t>(sign)];
}

} // namespace astrolabe::vedic
