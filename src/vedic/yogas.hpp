#pragma once

/// @file yogas.hpp
/// @brief Named planetary combinations detected from sign and house placements.

#include "astro/positions.hpp"
#include "vedic/dignity.hpp"
#include "core/types.hpp"

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace astrolabe::vedic
{
    enum class YogaCategory : u8
    {
        Raja,
        Dhana,
        PanchaMahapurusha,
        Chandra,
        Surya,
        Other,
        Negative,
    };

    enum class YogaStrength : u8
    {
        Strong,
        Moderate,
        Weak,
    };

    [[nodiscard]] std::string_view yoga_category_name(YogaCategory category);
    [[nodiscard]] std::string_view yoga_strength_name(YogaStrength strength);

    struct YogaConfig
    {
        bool include_weak = true;
        f64 tight_orb_deg = 5.0;          ///< Conjunction yogas promoted at or below this
        f64 wide_orb_deg = 20.0;          ///< Conjunction yogas demoted above this
        f64 boundary_margin_deg = 1.0;    ///< Dignity yogas demoted this close to a sign edge
    };

    /// @brief Caller-supplied dignities; planets not listed use the computed dignity.
    using DignityOverrides = std::map<Body, Dignity>;

    struct Yoga
    {
        std::string name;
        YogaCategory category = YogaCategory::Other;
        std::vector<Body> planets;
        std::vector<i32> houses;          ///< Whole-sign houses from the ascendant
        YogaStrength strength = YogaStrength::Moderate;
        std::string description;
    };

    struct YogaSummary
    {
        std::map<YogaCategory, i32> counts;
        std::vector<std::string> strongest;   ///< Names of up to five strong yogas
        std::string assessment;
    };

    struct YogaReport
    {
        std::vector<Yoga> yogas;
        YogaSummary summary;
    };

    /// @brief Scan the yoga catalog.
    ///
    /// Needs the seven classical planets; the lunar nodes are optional
    /// (a missing node is derived from the other). Throws
    /// IncompleteChartData otherwise.
    [[nodiscard]] YogaReport detect_yogas(std::span<const astro::BodyPosition> positions,
                                          f64 ascendant_longitude,
                                          const DignityOverrides& dignities = {},
                                          const YogaConfig& config = {});

} // namespace astrolabe::vedic
