#pragma once

/// @file dasha.hpp
/// @brief Vimshottari dasha periods as a flat parent-indexed tree.

#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "vedic/nakshatra.hpp"
#include "core/types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace astrolabe::vedic
{
    enum class DashaLevel : u8
    {
        Mahadasha,
        Antardasha,
        Pratyantardasha,
    };

    [[nodiscard]] std::string_view dasha_level_name(DashaLevel level);

    /// Three full Vimshottari cycles; longer horizons are rejected.
    inline constexpr f64 kMaxHorizonYears = 360.0;

    struct DashaConfig
    {
        i32 depth = 1;                 ///< Sub-levels below mahadasha: 0, 1 or 2
        f64 horizon_years = 120.0;     ///< Mahadashas are emitted until this is covered
    };

    struct DashaPeriod
    {
        Body lord = Body::SouthNode;
        DashaLevel level = DashaLevel::Mahadasha;
        astro::Moment start{0.0};
        astro::Moment end{0.0};
        i32 parent_index = -1;         ///< -1 for mahadashas

        /// @brief Length in Julian years.
        [[nodiscard]] f64 years() const;

        /// @brief Half-open containment [start, end).
        [[nodiscard]] bool contains(f64 jd_ut) const;
    };

    /// @brief Where the first mahadasha came from.
    struct DashaInfo
    {
        Body starting_lord = Body::SouthNode;
        NakshatraInfo nakshatra;
        f64 elapsed_years = 0.0;       ///< Portion of the first lord consumed before birth
        f64 remaining_years = 0.0;     ///< Length of the first mahadasha
    };

    /// @brief All periods in depth-first order; children follow their parent.
    struct DashaTree
    {
        std::vector<DashaPeriod> periods;
        DashaInfo info;

        [[nodiscard]] std::vector<i32> mahadashas() const;
        [[nodiscard]] std::vector<i32> children_of(i32 parent_index) const;
    };

    /// @brief Build the Vimshottari tree from the sidereal Moon.
    ///
    /// Throws InvalidInput when the position is not the Moon, the depth is
    /// outside 0..2 or the horizon is not in (0, kMaxHorizonYears].
    [[nodiscard]] DashaTree calculate_dasha(const astro::BodyPosition& moon,
                                            const astro::Moment& birth,
                                            const DashaConfig& config = {});

    /// @brief Running periods at a moment, outermost first.
    [[nodiscard]] std::vector<DashaPeriod> active_periods(const DashaTree& tree, f64 jd_ut);

    /// @brief Lord names joined by '-', e.g. "Venus-Mars-Jupiter".
    [[nodiscard]] std::string format_chain(std::span<const DashaPeriod> chain);

} // namespace astrolabe::vedic
