/// @file bodies.cpp
/// @brief Body and sign name tables.

#include "astro/bodies.hpp"

namespace astrolabe::astro
{

namespace
{
    constexpr std::array<std::string_view, kBodyCount> kBodyNames = {
        "Sun", "Moon", "Mercury", "Venus", "Mars", "Jupiter", "Saturn",
        "Uranus", "Neptune", "Pluto", "North Node", "South Node", "Earth",
        "Ascendant", "Midheaven",
    };

    constexpr std::array<std::string_view, kBodyCount> kBodyCodes = {
        "Su", "Mo", "Me", "Ve", "Ma", "Ju", "Sa",
        "Ur", "Ne", "Pl", "NN", "SN", "Ea",
        "As", "MC",
    };

    constexpr std::array<std::string_view, 12> kSignNames = {
        "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
        "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
    };
} // namespace

std::string_view body_name(Body body)
{
    const auto i = body_index(body);
    return i < kBodyNames.size() ? kBodyNames[i] : "Unknown";
}

std::string_view body_code(Body body)
{
    const auto i = body_index(body);
    return i < kBodyCodes.size() ? kBodyCodes[i] : "??";
}

std::string_view sign_name(i32 sign)
{
    if (sign < 0 || sign >= zodiac::kSignCount)
    {
        return "Unknown";
    }
    return kSignNames[static_cast<std::size_t>(sign)];
}

} // namespace astrolabe::astro
