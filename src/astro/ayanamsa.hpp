#pragma once

/// @file ayanamsa.hpp
/// @brief Tropical-to-sidereal offsets.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace astrolabe::astro
{
    enum class AyanamsaId : u8
    {
        Lahiri,
        Raman,
        Krishnamurti,
        FaganBradley,
        Yukteshwar,
        JnBhasin,
    };

    /// @brief General precession in longitude, degrees per Julian year (50.2388″).
    inline constexpr f64 kPrecessionDegPerYear = 50.2388 / 3600.0;

    /// @brief Ayanamsa in degrees: value at J2000.0 plus linear precession.
    [[nodiscard]] f64 linear_ayanamsa(AyanamsaId id, f64 jd);

    [[nodiscard]] std::string_view ayanamsa_name(AyanamsaId id);

    /// @brief Parse a case-insensitive ayanamsa name ("lahiri", "fagan_bradley", ...).
    [[nodiscard]] std::optional<AyanamsaId> parse_ayanamsa(std::string_view name);

} // namespace astrolabe::astro
