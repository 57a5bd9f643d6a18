/// @file ayanamsa.cpp
/// @brief Fixed-epoch linear ayanamsa model.

#include "astro/ayanamsa.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace astrolabe::astro
{

namespace
{
    struct AyanamsaEntry
    {
        AyanamsaId id;
        std::string_view name;
        std::string_view key;
        f64 value_at_j2000;   ///< degrees
    };

    constexpr std::array<AyanamsaEntry, 6> kAyanamsas = {{
        {AyanamsaId::Lahiri,       "Lahiri",        "lahiri",        23.8531},
        {AyanamsaId::Raman,        "Raman",         "raman",         22.4108},
        {AyanamsaId::Krishnamurti, "Krishnamurti",  "krishnamurti",  23.7597},
        {AyanamsaId::FaganBradley, "Fagan-Bradley", "fagan_bradley", 24.7403},
        {AyanamsaId::Yukteshwar,   "Yukteshwar",    "yukteshwar",    22.4789},
        {AyanamsaId::JnBhasin,     "J.N. Bhasin",   "jn_bhasin",     22.7621},
    }};

    const AyanamsaEntry& entry_for(AyanamsaId id)
    {
        return kAyanamsas[static_cast<std::size_t>(id)];
    }
} // namespace

f64 linear_ayanamsa(AyanamsaId id, f64 jd)
{
    const f64 years = (jd - astro_constants::kJ2000) / astro_constants::kDaysPerYear;
    return entry_for(id).value_at_j2000 + kPrecessionDegPerYear * years;
}

std::string_view ayanamsa_name(AyanamsaId id)
{
    return entry_for(id).name;
}

std::optional<AyanamsaId> parse_ayanamsa(std::string_view name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });

    for (const auto& entry : kAyanamsas)
    {
        if (entry.key == key)
        {
            return entry.id;
        }
    }
    return std::nullopt;
}

} // namespace astrolabe::astro
