#pragma once

/// @file houses.hpp
/// @brief House cusp calculation (Placidus, Koch, Regiomontanus, Porphyry, Equal, Whole Sign).

#include "astro/ayanamsa.hpp"
#include "astro/ephemeris.hpp"
#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::astro
{
    enum class HouseSystemKind : u8
    {
        Placidus,
        Koch,
        Regiomontanus,
        Porphyry,
        Equal,
        WholeSign,
    };

    [[nodiscard]] std::string_view house_system_name(HouseSystemKind kind);

    /// @brief Parse "placidus", "koch", "regiomontanus", "porphyry", "equal", "whole_sign".
    [[nodiscard]] std::optional<HouseSystemKind> parse_house_system(std::string_view name);

    /// @brief True for systems that divide semi-arcs in time (Placidus, Koch).
    [[nodiscard]] constexpr bool is_time_based(HouseSystemKind kind)
    {
        return kind == HouseSystemKind::Placidus || kind == HouseSystemKind::Koch;
    }

    struct HouseConfig
    {
        HouseSystemKind system = HouseSystemKind::Placidus;
        f64 polar_limit_deg = 66.0;       ///< |latitude| above this fails for time-based systems
        i32 max_iterations = 50;          ///< Placidus semi-arc iteration cap
        f64 tolerance_deg = 1e-7;         ///< Placidus convergence threshold
        ZodiacMode zodiac = ZodiacMode::Tropical;
        AyanamsaId ayanamsa = AyanamsaId::Lahiri;
    };

    struct HouseAssignment
    {
        Body body;
        i32 house;   ///< 1..12
    };

    /// @brief Twelve cusps plus the angles they were derived from.
    struct HouseSystem
    {
        HouseSystemKind kind = HouseSystemKind::Placidus;
        ZodiacMode zodiac = ZodiacMode::Tropical;
        std::array<f64, 12> cusps{};   ///< cusps[0] = house 1
        f64 ascendant = 0.0;
        f64 midheaven = 0.0;
        f64 armc = 0.0;                ///< Local sidereal time in degrees
        f64 obliquity = 0.0;

        /// @brief Longitude of cusp n (1..12).
        [[nodiscard]] f64 cusp(i32 house) const;

        /// @brief House 1..12 containing a longitude, by [cusp_k, cusp_k+1) membership.
        [[nodiscard]] i32 house_of(f64 longitude) const;

        [[nodiscard]] std::vector<HouseAssignment> assign_houses(std::span<const BodyPosition> positions) const;

        /// @brief Ascendant and Midheaven as aspectable positions.
        [[nodiscard]] std::vector<BodyPosition> angle_points() const;
    };

    /// @brief Compute cusps for a moment and location.
    ///
    /// Throws InvalidInput for out-of-range coordinates and
    /// HouseSystemUndefined when a time-based system has no solution.
    /// When sidereal output is requested the ayanamsa comes from
    /// @p provider if given, otherwise from the linear model.
    [[nodiscard]] HouseSystem calculate_houses(const Moment& moment, const GeoLocation& location,
                                               const HouseConfig& config = {},
                                               const EphemerisProvider* provider = nullptr);

    /// @brief Ascendant longitude for a sidereal time, obliquity and latitude (degrees).
    [[nodiscard]] f64 ascendant_from(f64 armc_deg, f64 obliquity_deg, f64 latitude_deg);

    /// @brief Midheaven longitude for a sidereal time and obliquity (degrees).
    [[nodiscard]] f64 midheaven_from(f64 armc_deg, f64 obliquity_deg);

} // namespace astrolabe::astro
