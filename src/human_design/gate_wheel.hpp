#pragma once

/// @file gate_wheel.hpp
/// @brief The 64-gate wheel, its centers and channels.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace astrolabe::human_design
{
    inline constexpr i32 kGateCount = 64;
    inline constexpr f64 kWheelStartDeg = 302.0;              ///< Tropical longitude where gate 41 begins
    inline constexpr f64 kGateSpan = zodiac::kFullCircle / kGateCount;   ///< 5.625°
    inline constexpr f64 kLineSpan = kGateSpan / 6.0;         ///< 0.9375°
    inline constexpr f64 kColorSpan = kLineSpan / 6.0;        ///< 0.15625°
    inline constexpr f64 kToneSpan = kColorSpan / 6.0;
    inline constexpr f64 kBaseSpan = kToneSpan / 5.0;

    /// @brief Gate numbers in wheel order starting at kWheelStartDeg.
    inline constexpr std::array<i32, kGateCount> kGateWheel = {
        41, 19, 13, 49, 30, 55, 37, 63, 22, 36, 25, 17, 21, 51, 42, 3,
        27, 24, 2, 23, 8, 20, 16, 35, 45, 12, 15, 52, 39, 53, 62, 56,
        31, 33, 7, 4, 29, 59, 40, 64, 47, 6, 46, 18, 48, 57, 32, 50,
        28, 44, 1, 43, 14, 34, 9, 5, 26, 11, 10, 58, 38, 54, 61, 60,
    };

    enum class Center : u8
    {
        Head,
        Ajna,
        Throat,
        G,
        Heart,
        Sacral,
        SolarPlexus,
        Spleen,
        Root,
    };

    inline constexpr std::size_t kCenterCount = 9;

    [[nodiscard]] std::string_view center_name(Center center);

    /// @brief Sacral, Solar Plexus, Heart and Root.
    [[nodiscard]] constexpr bool is_motor(Center center)
    {
        return center == Center::Sacral || center == Center::SolarPlexus
            || center == Center::Heart || center == Center::Root;
    }

    /// @brief Center a gate belongs to; throws InvalidInput for gates outside 1..64.
    [[nodiscard]] Center center_of_gate(i32 gate);

    struct ChannelDefinition
    {
        i32 gate_a;
        i32 gate_b;
        std::string_view name;
    };

    [[nodiscard]] std::span<const ChannelDefinition> channel_catalog();

    /// @brief Position of a longitude within the wheel.
    struct GateActivation
    {
        i32 gate = 41;
        i32 line = 1;     ///< 1..6
        i32 color = 1;    ///< 1..6
        i32 tone = 1;     ///< 1..6
        i32 base = 1;     ///< 1..5
    };

    /// @brief Map a tropical longitude onto gate, line, color, tone and base.
    [[nodiscard]] GateActivation activation_at(f64 longitude);

    /// @brief Wheel-order index 0..63 of a gate, or nullopt.
    [[nodiscard]] std::optional<i32> wheel_index(i32 gate);

    /// @brief Quarter of the wheel a gate lies in (Initiation, Civilization, Duality, Mutation).
    [[nodiscard]] std::string_view quarter_of_gate(i32 gate);

} // namespace astrolabe::human_design
