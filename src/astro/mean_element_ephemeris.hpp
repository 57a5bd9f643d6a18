#pragma once

/// @file mean_element_ephemeris.hpp
/// @brief Built-in low-precision ephemeris from Keplerian mean elements.

#include "astro/ephemeris.hpp"
#include "core/types.hpp"

namespace astrolabe::astro
{
    /// @brief Supported Julian Day range of the built-in provider.
    struct MeanElementConfig
    {
        f64 min_jd = 2086302.5;   ///< 1000-01-01
        f64 max_jd = 2816787.5;   ///< 3000-01-01
    };

    /// @brief Approximate geocentric positions good to roughly a degree.
    ///
    /// Planets use the JPL "Keplerian elements for approximate positions"
    /// table (Standish) with linear rates, the Moon a four-term truncated
    /// lunar theory, the node its mean motion. Longitudes are referred to
    /// the mean equinox of date. Speeds come from a one-day central
    /// difference.
    class MeanElementEphemeris final : public EphemerisProvider
    {
    public:
        explicit MeanElementEphemeris(const MeanElementConfig& config = {});

        [[nodiscard]] RawPosition position(f64 jd_ut, Body body) const override;

        [[nodiscard]] const MeanElementConfig& config() const { return m_config; }

    private:
        /// @brief Longitude/latitude/distance without range check or speed.
        [[nodiscard]] static RawPosition sample(f64 jd_ut, Body body);

        MeanElementConfig m_config;
    };

} // namespace astrolabe::astro
