#pragma once

/// @file dignity.hpp
/// @brief Planetary dignity tables and sign rulership.

#include "astro/bodies.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace astrolabe::vedic
{
    using astro::Body;

    enum class Dignity : u8
    {
        Exalted,
        Moolatrikona,
        OwnSign,
        Neutral,
        Debilitated,
    };

    [[nodiscard]] std::string_view dignity_name(Dignity dignity);

    /// @brief Fixed dignity data for one classical planet. Signs are 0..11, -1 when absent.
    struct DignityEntry
    {
        Body planet;
        i32 exaltation_sign;
        f64 deep_exaltation_deg;   ///< Degree within the exaltation sign
        i32 debilitation_sign;
        std::array<i32, 2> own_signs;
        i32 moolatrikona_sign;
    };

    /// @brief Table entry for a classical planet, nullopt for any other body.
    [[nodiscard]] std::optional<DignityEntry> dignity_entry(Body planet);

    /// @brief Dignity of a planet at a longitude.
    ///
    /// Exaltation outranks moolatrikona, which outranks own sign.
    /// Bodies without a table entry are Neutral.
    [[nodiscard]] Dignity dignity_of(Body planet, f64 longitude);

    /// @brief Traditional ruler of a sign (0 = Aries).
    [[nodiscard]] Body sign_lord(i32 sign);

    /// @brief True for Exalted, Moolatrikona and OwnSign.
    [[nodiscard]] constexpr bool is_dignified(Dignity dignity)
    {
        return dignity == Dignity::Exalted || dignity == Dignity::Moolatrikona || dignity == Dignity::OwnSign;
    }

} // namespace astrolabe::vedic
