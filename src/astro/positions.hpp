#pragma once

/// @file positions.hpp
/// @brief Zodiacal body positions resolved from an ephemeris provider.

#include "astro/ayanamsa.hpp"
#include "astro/bodies.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::astro
{
    enum class ZodiacMode : u8
    {
        Tropical,
        Sidereal,
    };

    [[nodiscard]] std::string_view zodiac_name(ZodiacMode mode);

    struct PositionConfig
    {
        ZodiacMode zodiac = ZodiacMode::Tropical;
        AyanamsaId ayanamsa = AyanamsaId::Lahiri;   ///< Used only when sidereal
    };

    /// @brief A body placed on the zodiac.
    struct BodyPosition
    {
        Body body = Body::Sun;
        f64 longitude = 0.0;          ///< [0, 360)
        f64 latitude = 0.0;
        f64 distance_au = 0.0;
        f64 speed = 0.0;              ///< degrees/day, negative ⇒ retrograde
        ZodiacMode zodiac = ZodiacMode::Tropical;

        [[nodiscard]] i32 sign() const { return sign_of(longitude); }
        [[nodiscard]] f64 degree_in_sign() const { return longitude - zodiac::kSignWidth * static_cast<f64>(sign()); }
        [[nodiscard]] bool retrograde() const { return speed < 0.0; }
        [[nodiscard]] std::string_view sign_label() const { return sign_name(sign()); }

        /// @brief Lunar mansion index 0..26 of this longitude.
        [[nodiscard]] i32 nakshatra_index() const;
    };

    /// @brief Build a BodyPosition from a longitude, normalizing it.
    [[nodiscard]] BodyPosition make_position(Body body, f64 longitude, f64 speed = 0.0,
                                             ZodiacMode zodiac = ZodiacMode::Tropical);

    /// @brief Resolve each requested body in request order.
    ///
    /// Repeated bodies are resolved once. Any provider failure aborts the
    /// whole call with the provider's exception.
    [[nodiscard]] std::vector<BodyPosition> calculate_positions(const Moment& moment,
                                                                std::span<const Body> bodies,
                                                                const EphemerisProvider& provider,
                                                                const PositionConfig& config = {});

    /// @brief Resolve a single body.
    [[nodiscard]] BodyPosition calculate_position(const Moment& moment, Body body,
                                                  const EphemerisProvider& provider,
                                                  const PositionConfig& config = {});

    /// @brief Find a body in a position list.
    [[nodiscard]] std::optional<BodyPosition> find_position(std::span<const BodyPosition> positions, Body body);

} // namespace astrolabe::astro
