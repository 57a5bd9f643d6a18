#pragma once

/// @file ephemeris.hpp
/// @brief Abstract source of raw geocentric body positions.

#include "astro/ayanamsa.hpp"
#include "astro/bodies.hpp"
#include "core/types.hpp"

namespace astrolabe::astro
{
    /// @brief Tropical geocentric ecliptic position as delivered by a provider.
    struct RawPosition
    {
        f64 longitude_deg = 0.0;
        f64 latitude_deg = 0.0;
        f64 distance_au = 0.0;
        f64 speed_deg_per_day = 0.0;   ///< Negative while retrograde
    };

    /// @brief Interface for anything that can place a body at a Julian Day.
    ///
    /// Implementations throw EphemerisUnavailable when the moment lies
    /// outside their supported range or the body is unknown to them.
    /// Derived bodies (SouthNode, Earth) and chart points are never
    /// requested; see resolve_raw_position().
    class EphemerisProvider
    {
    public:
        virtual ~EphemerisProvider() = default;

        [[nodiscard]] virtual RawPosition position(f64 jd_ut, Body body) const = 0;

        /// @brief Ayanamsa in degrees; defaults to the linear fixed-epoch model.
        [[nodiscard]] virtual f64 ayanamsa(AyanamsaId id, f64 jd_ut) const
        {
            return linear_ayanamsa(id, jd_ut);
        }
    };

    /// @brief Resolve any non chart-point body, deriving SouthNode and Earth.
    ///
    /// Throws InvalidInput for Ascendant/Midheaven; provider failures
    /// propagate unchanged.
    [[nodiscard]] RawPosition resolve_raw_position(const EphemerisProvider& provider, f64 jd_ut, Body body);

} // namespace astrolabe::astro
