/// @file gate_wheel.cpp
/// @brief Gate lookup, center membership and channel catalog.

#include "human_design/gate_wheel.hpp"

#include "core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace astrolabe::human_design
{

namespace
{
    constexpr std::array<std::string_view, kCenterCount> kCenterNames = {
        "Head", "Ajna", "Throat", "G", "Heart", "Sacral", "Solar Plexus", "Spleen", "Root",
    };

    struct CenterGates
    {
        Center center;
        std::array<i32, 11> gates;   ///< Zero-padded
    };

    constexpr std::array<CenterGates, kCenterCount> kCenterGates = {{
        {Center::Head,        {64, 61, 63}},
        {Center::Ajna,        {47, 24, 4, 17, 43, 11}},
        {Center::Throat,      {62, 23, 56, 35, 12, 45, 33, 8, 31, 20, 16}},
        {Center::G,           {7, 1, 13, 25, 46, 2, 15, 10}},
        {Center::Heart,       {21, 40, 26, 51}},
        {Center::Sacral,      {5, 14, 29, 59, 9, 3, 42, 27, 34}},
        {Center::SolarPlexus, {6, 37, 22, 36, 30, 55, 49}},
        {Center::Spleen,      {48, 57, 44, 50, 32, 28, 18}},
        {Center::Root,        {53, 60, 52, 19, 39, 41, 58, 38, 54}},
    }};

    constexpr std::array<ChannelDefinition, 36> kChannels = {{
        // Head - Ajna
        {64, 47, "Abstraction"},
        {61, 24, "Awareness"},
        {63, 4, "Logic"},
        // Ajna - Throat
        {17, 62, "Acceptance"},
        {43, 23, "Structuring"},
        {11, 56, "Curiosity"},
        // Throat - G
        {8, 1, "Inspiration"},
        {31, 7, "The Alpha"},
        {33, 13, "The Prodigal"},
        {20, 10, "Awakening"},
        // Throat - Heart
        {45, 21, "Money"},
        // Throat - Solar Plexus
        {12, 22, "Openness"},
        {35, 36, "Transitoriness"},
        // Throat - Spleen
        {16, 48, "Wavelength"},
        {20, 57, "Brain Wave"},
        // Throat - Sacral
        {34, 20, "Charisma"},
        // G - Heart
        {25, 51, "Initiation"},
        // G - Sacral
        {15, 5, "Rhythm"},
        {2, 14, "The Beat"},
        {46, 29, "Discovery"},
        {10, 34, "Exploration"},
        // G - Spleen
        {10, 57, "Perfected Form"},
        // Heart - Spleen
        {26, 44, "Surrender"},
        // Heart - Solar Plexus
        {40, 37, "Community"},
        // Sacral - Solar Plexus
        {59, 6, "Mating"},
        // Sacral - Spleen
        {34, 57, "Power"},
        {27, 50, "Preservation"},
        // Sacral - Root
        {9, 52, "Concentration"},
        {3, 60, "Mutation"},
        {42, 53, "Maturation"},
        // Solar Plexus - Root
        {30, 41, "Recognition"},
        {55, 39, "Emoting"},
        {49, 19, "Synthesis"},
        // Spleen - Root
        {28, 38, "Struggle"},
        {18, 58, "Judgment"},
        {32, 54, "Transformation"},
    }};

    constexpr std::array<std::string_view, 4> kQuarters = {
        "Initiation", "Civilization", "Duality", "Mutation",
    };

    /// Wheel index where the Quarter of Initiation begins (gate 13).
    constexpr i32 kQuarterOffset = 2;

    i32 clamp_index(f64 value, i32 count)
    {
        return std::clamp(static_cast<i32>(std::floor(value)), 0, count - 1);
    }
} // namespace

std::string_view center_name(Center center)
{
    return kCenterNames[static_cast<std::size_t>(center)];
}

Center center_of_gate(i32 gate)
{
    if (gate >= 1 && gate <= kGateCount)
    {
        for (const auto& entry : kCenterGates)
        {
            if (std::find(entry.gates.begin(), entry.gates.end(), gate) != entry.gates.end())
            {
                return entry.center;
            }
        }
    }
    throw InvalidInput("human_design", "gate " + std::to_string(gate) + " is not on the wheel");
}

std::span<const ChannelDefinition> channel_catalog()
{
    return kChannels;
}

GateActivation activation_at(f64 longitude)
{
    const f64 offset = normalize_degrees(longitude - kWheelStartDeg);

    const i32 index = clamp_index(offset / kGateSpan, kGateCount);
    const f64 in_gate = offset - static_cast<f64>(index) * kGateSpan;

    const i32 line = clamp_index(in_gate / kLineSpan, 6);
    const f64 in_line = in_gate - static_cast<f64>(line) * kLineSpan;

    const i32 color = clamp_index(in_line / kColorSpan, 6);
    const f64 in_color = in_line - static_cast<f64>(color) * kColorSpan;

    const i32 tone = clamp_index(in_color / kToneSpan, 6);
    const f64 in_tone = in_color - static_cast<f64>(tone) * kToneSpan;

    const i32 base = clamp_index(in_tone / kBaseSpan, 5);

    return GateActivation{
        .gate = kGateWheel[static_cast<std::size_t>(index)],
        .line = line + 1,
        .color = color + 1,
        .tone = tone + 1,
        .base = base + 1,
    };
}

std::optional<i32> wheel_index(i32 gate)
{
    const auto it = std::find(kGateWheel.begin(), kGateWheel.end(), gate);
    if (it == kGateWheel.end())
    {
        return std::nullopt;
    }
    return static_cast<i32>(it - kGateWheel.begin());
}

std::string_view quarter_of_gate(i32 gate)
{
    const auto index = wheel_index(gate);
    if (!index)
    {
        return "Unknown";
    }
    const i32 shifted = (*index - kQuarterOffset + kGateCount) % kGateCount;
    return kQuarters[static_cast<std::size_t>(shifted / 16)];
}

} // namespace astrolabe::human_design
