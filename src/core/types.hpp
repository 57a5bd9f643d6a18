#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>
#include <cstdint>

namespace astrolabe
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for astronomy)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi           = glm::pi<f64>();
        constexpr f64 kTwoPi        = 2.0 * kPi;
        constexpr f64 kDegToRad     = kPi / 180.0;
        constexpr f64 kRadToDeg     = 180.0 / kPi;
        constexpr f64 kJ2000        = 2451545.0;   // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerYear  = 365.25;      // Julian year
        constexpr f64 kAuKm         = 149597870.7;
    }

    // Zodiac geometry
    namespace zodiac
    {
        constexpr f64 kFullCircle   = 360.0;
        constexpr f64 kSignWidth    = 30.0;
        constexpr i32 kSignCount    = 12;
    }

    /// @brief Normalize an angle in degrees to [0, 360).
    [[nodiscard]] inline f64 normalize_degrees(f64 deg)
    {
        deg = std::fmod(deg, zodiac::kFullCircle);
        if (deg < 0.0)
        {
            deg += zodiac::kFullCircle;
        }
        // fmod of a tiny negative value can round up to exactly 360
        if (deg >= zodiac::kFullCircle)
        {
            deg -= zodiac::kFullCircle;
        }
        return deg;
    }

    /// @brief Shortest signed difference a - b in degrees, in (-180, 180].
    [[nodiscard]] inline f64 signed_difference(f64 a, f64 b)
    {
        f64 diff = normalize_degrees(a - b);
        if (diff > 180.0)
        {
            diff -= zodiac::kFullCircle;
        }
        return diff;
    }

    /// @brief Zodiac sign index (0 = Aries .. 11 = Pisces) of a longitude.
    [[nodiscard]] inline i32 sign_of(f64 longitude)
    {
        const auto sign = static_cast<i32>(normalize_degrees(longitude) / zodiac::kSignWidth);
        return sign < zodiac::kSignCount ? sign : zodiac::kSignCount - 1;
    }

} // namespace astrolabe
