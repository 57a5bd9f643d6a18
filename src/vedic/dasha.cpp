/// @file dasha.cpp
/// @brief Vimshottari mahadasha sequence and proportional subdivision.

#include "vedic/dasha.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace astrolabe::vedic
{

namespace
{
    using astro_constants::kDaysPerYear;

    constexpr const char* kStep = "dasha";
    constexpr i32 kMaxDepth = 2;

    /// Split a period into nine sub-periods starting from its own lord.
    void subdivide(DashaTree& tree, i32 parent_index, i32 levels_left)
    {
        if (levels_left <= 0)
        {
            return;
        }

        // Copy: push_back below may reallocate
        const DashaPeriod parent = tree.periods[static_cast<std::size_t>(parent_index)];
        const f64 parent_days = parent.end.jd_ut() - parent.start.jd_ut();
        const auto child_level = static_cast<DashaLevel>(static_cast<i32>(parent.level) + 1);
        const i32 first = lord_sequence_of(parent.lord);
        const auto count = static_cast<i32>(kDashaLords.size());

        f64 cursor = parent.start.jd_ut();
        for (i32 n = 0; n < count; ++n)
        {
            const auto& sub = kDashaLords[static_cast<std::size_t>((first + n) % count)];
            const bool last = (n == count - 1);
            const f64 end = last ? parent.end.jd_ut() : cursor + sub.years / kVimshottariYears * parent_days;

            tree.periods.push_back(DashaPeriod{
                .lord = sub.body,
                .level = child_level,
                .start = astro::Moment(cursor, parent.start.utc_offset_minutes()),
                .end = astro::Moment(end, parent.start.utc_offset_minutes()),
                .parent_index = parent_index,
            });

            subdivide(tree, static_cast<i32>(tree.periods.size()) - 1, levels_left - 1);
            cursor = end;
        }
    }
} // namespace

std::string_view dasha_level_name(DashaLevel level)
{
    switch (level)
    {
    case DashaLevel::Mahadasha:       return "Mahadasha";
    case DashaLevel::Antardasha:      return "Antardasha";
    case DashaLevel::Pratyantardasha: return "Pratyantardasha";
    }
    return "Unknown";
}

f64 DashaPeriod::years() const
{
    return (end.jd_ut() - start.jd_ut()) / kDaysPerYear;
}

bool DashaPeriod::contains(f64 jd_ut) const
{
    return jd_ut >= start.jd_ut() && jd_ut < end.jd_ut();
}

std::vector<i32> DashaTree::mahadashas() const
{
    return children_of(-1);
}

std::vector<i32> DashaTree::children_of(i32 parent_index) const
{
    std::vector<i32> result;
    for (std::size_t i = 0; i < periods.size(); ++i)
    {
        if (periods[i].parent_index == parent_index)
        {
            result.push_back(static_cast<i32>(i));
        }
    }
    return result;
}

DashaTree calculate_dasha(const astro::BodyPosition& moon, const astro::Moment& birth, const DashaConfig& config)
{
    if (moon.body != Body::Moon)
    {
        ASL_CORE_ERROR("Dasha: expected the Moon, got {}", astro::body_name(moon.body));
        throw InvalidInput(kStep, "dasha is computed from the Moon's position");
    }
    if (config.depth < 0 || config.depth > kMaxDepth)
    {
        ASL_CORE_ERROR("Dasha: depth {} outside 0..{}", config.depth, kMaxDepth);
        throw InvalidInput(kStep, "depth must be 0, 1 or 2");
    }
    if (!std::isfinite(config.horizon_years) || config.horizon_years <= 0.0)
    {
        ASL_CORE_ERROR("Dasha: horizon {} years is not positive", config.horizon_years);
        throw InvalidInput(kStep, "horizon must be a positive number of years");
    }
    if (config.horizon_years > kMaxHorizonYears)
    {
        ASL_CORE_ERROR("Dasha: horizon {} years exceeds {}", config.horizon_years, kMaxHorizonYears);
        throw InvalidInput(kStep, "horizon is limited to three Vimshottari cycles");
    }
    if (moon.zodiac != astro::ZodiacMode::Sidereal)
    {
        ASL_CORE_WARN("Dasha: Moon longitude {:.4f} is tropical; Vimshottari expects sidereal", moon.longitude);
    }

    DashaTree tree;
    auto& info = tree.info;
    info.nakshatra = nakshatra_of(moon.longitude);
    info.starting_lord = info.nakshatra.lord;

    const f64 first_years = kDashaLords[static_cast<std::size_t>(info.nakshatra.lord_sequence)].years;
    info.elapsed_years = info.nakshatra.fraction_elapsed * first_years;
    info.remaining_years = first_years - info.elapsed_years;

    // -----------------------------------------------------------------
    // Mahadashas: partial first lord, then full lengths in cyclic order
    // -----------------------------------------------------------------
    const auto count = static_cast<i32>(kDashaLords.size());
    i32 sequence = info.nakshatra.lord_sequence;
    f64 covered = 0.0;
    f64 cursor = birth.jd_ut();
    bool first = true;

    while (covered < config.horizon_years)
    {
        const auto& lord = kDashaLords[static_cast<std::size_t>(sequence)];
        const f64 years = first ? info.remaining_years : lord.years;
        const f64 end = cursor + years * kDaysPerYear;

        tree.periods.push_back(DashaPeriod{
            .lord = lord.body,
            .level = DashaLevel::Mahadasha,
            .start = astro::Moment(cursor, birth.utc_offset_minutes()),
            .end = astro::Moment(end, birth.utc_offset_minutes()),
            .parent_index = -1,
        });
        subdivide(tree, static_cast<i32>(tree.periods.size()) - 1, config.depth);

        covered += years;
        cursor = end;
        sequence = (sequence + 1) % count;
        first = false;
    }

    ASL_CORE_DEBUG("Dasha: start {} in {} (pada {}), {:.3f} years remaining, {} periods",
                   lord_name(info.starting_lord), info.nakshatra.name, info.nakshatra.pada,
                   info.remaining_years, tree.periods.size());
    return tree;
}

std::vector<DashaPeriod> active_periods(const DashaTree& tree, f64 jd_ut)
{
    std::vector<DashaPeriod> chain;
    i32 parent = -1;

    for (;;)
    {
        bool found = false;
        for (const i32 index : tree.children_of(parent))
        {
            const auto& period = tree.periods[static_cast<std::size_t>(index)];
            if (period.contains(jd_ut))
            {
                chain.push_back(period);
                parent = index;
                found = true;
                break;
            }
        }
        if (!found)
        {
            break;
        }
    }
    return chain;
}

std::string format_chain(std::span<const DashaPeriod> chain)
{
    std::string text;
    for (const auto& period : chain)
    {
        if (!text.empty())
        {
            text += '-';
        }
        text += lord_name(period.lord);
    }
    return text;
}

} // namespace astrolabe::vedic
