/// @file patterns.cpp
/// @brief Grand trine, T-square, grand cross, yod and stellium detection.

#include "chart/patterns.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <map>
#include <utility>

namespace astrolabe::chart
{

namespace
{
    constexpr std::array<std::string_view, 6> kPatternNames = {
        "Grand Trine", "T-Square", "Grand Cross", "Yod", "Stellium (sign)", "Stellium (house)",
    };

    bool has(std::span<const Aspect> aspects, Body a, Body b, AspectType type)
    {
        const auto found = find_aspect(aspects, a, b);
        return found && found->type == type;
    }

    std::vector<Body> sorted(std::vector<Body> bodies)
    {
        std::sort(bodies.begin(), bodies.end());
        return bodies;
    }

    /// Distinct bodies appearing in the aspect set, ascending.
    std::vector<Body> aspected_bodies(std::span<const Aspect> aspects)
    {
        std::vector<Body> bodies;
        for (const auto& a : aspects)
        {
            bodies.push_back(a.first);
            bodies.push_back(a.second);
        }
        std::sort(bodies.begin(), bodies.end());
        bodies.erase(std::unique(bodies.begin(), bodies.end()), bodies.end());
        return bodies;
    }

    // -----------------------------------------------------------------
    // Aspect geometry
    // -----------------------------------------------------------------
    void grand_trines(std::span<const Aspect> aspects, const std::vector<Body>& bodies, std::vector<Pattern>& out)
    {
        for (std::size_t i = 0; i < bodies.size(); ++i)
        for (std::size_t j = i + 1; j < bodies.size(); ++j)
        {
            if (!has(aspects, bodies[i], bodies[j], AspectType::Trine))
            {
                continue;
            }
            for (std::size_t k = j + 1; k < bodies.size(); ++k)
            {
                if (has(aspects, bodies[i], bodies[k], AspectType::Trine)
                    && has(aspects, bodies[j], bodies[k], AspectType::Trine))
                {
                    Pattern p;
                    p.type = PatternType::GrandTrine;
                    p.bodies = {bodies[i], bodies[j], bodies[k]};
                    out.push_back(std::move(p));
                }
            }
        }
    }

    /// Shared shape of T-square and yod: a base aspect with a third body
    /// making the same focal aspect to both ends.
    void focal_patterns(std::span<const Aspect> aspects, const std::vector<Body>& bodies,
                        AspectType base, AspectType focal, PatternType type, std::vector<Pattern>& out)
    {
        for (const auto& a : aspects)
        {
            if (a.type != base)
            {
                continue;
            }
            for (const Body apex : bodies)
            {
                if (apex == a.first || apex == a.second)
                {
                    continue;
                }
                if (has(aspects, apex, a.first, focal) && has(aspects, apex, a.second, focal))
                {
                    Pattern p;
                    p.type = type;
                    p.bodies = sorted({a.first, a.second, apex});
                    p.apex = apex;
                    out.push_back(std::move(p));
                }
            }
        }
    }

    void grand_crosses(std::span<const Aspect> aspects, std::vector<Pattern>& out)
    {
        std::vector<Aspect> oppositions;
        std::copy_if(aspects.begin(), aspects.end(), std::back_inserter(oppositions),
                     [](const Aspect& a) { return a.type == AspectType::Opposition; });

        for (std::size_t i = 0; i < oppositions.size(); ++i)
        for (std::size_t j = i + 1; j < oppositions.size(); ++j)
        {
            const auto& x = oppositions[i];
            const auto& y = oppositions[j];
            if (x.involves(y.first) || x.involves(y.second))
            {
                continue;
            }
            if (has(aspects, x.first, y.first, AspectType::Square)
                && has(aspects, x.first, y.second, AspectType::Square)
                && has(aspects, x.second, y.first, AspectType::Square)
                && has(aspects, x.second, y.second, AspectType::Square))
            {
                Pattern p;
                p.type = PatternType::GrandCross;
                p.bodies = sorted({x.first, x.second, y.first, y.second});
                out.push_back(std::move(p));
            }
        }
    }

    // -----------------------------------------------------------------
    // Stelliums
    // -----------------------------------------------------------------

    /// Span of longitudes measured forward from a reference start.
    struct StelliumRun
    {
        std::vector<const BodyPosition*> members;
        f64 span = 0.0;
    };

    /// Largest run of members, by forward offset from @p start, that fits in
    /// the configured span. Ties go to the tighter run.
    std::optional<StelliumRun> tightest_run(std::vector<const BodyPosition*> members, f64 start,
                                            const PatternConfig& config)
    {
        const auto min_bodies = static_cast<std::size_t>(config.min_stellium_bodies);
        if (members.size() < min_bodies)
        {
            return std::nullopt;
        }

        auto offset = [start](const BodyPosition* p) { return normalize_degrees(p->longitude - start); };
        std::sort(members.begin(), members.end(),
                  [&offset](const BodyPosition* a, const BodyPosition* b) { return offset(a) < offset(b); });

        std::size_t best_first = 0;
        std::size_t best_count = 0;
        f64 best_span = 0.0;
        std::size_t first = 0;
        for (std::size_t last = 0; last < members.size(); ++last)
        {
            while (offset(members[last]) - offset(members[first]) > config.max_stellium_span_deg)
            {
                ++first;
            }
            const std::size_t count = last - first + 1;
            const f64 span = offset(members[last]) - offset(members[first]);
            if (count > best_count || (count == best_count && span < best_span))
            {
                best_first = first;
                best_count = count;
                best_span = span;
            }
        }

        if (best_count < min_bodies)
        {
            return std::nullopt;
        }
        const auto begin = members.begin() + static_cast<std::ptrdiff_t>(best_first);
        return StelliumRun{
            .members = std::vector<const BodyPosition*>(begin, begin + static_cast<std::ptrdiff_t>(best_count)),
            .span = best_span,
        };
    }

    void emit_stellium(PatternType type, const StelliumRun& run, std::optional<i32> sign,
                       std::optional<i32> house, std::vector<Pattern>& out)
    {
        Pattern p;
        p.type = type;
        for (const auto* m : run.members)
        {
            p.bodies.push_back(m->body);
        }
        std::sort(p.bodies.begin(), p.bodies.end());
        p.sign = sign;
        p.house = house;
        p.span = run.span;
        out.push_back(std::move(p));
    }

    void stelliums(std::span<const BodyPosition> positions, const PatternConfig& config,
                   const astro::HouseSystem* houses, std::vector<Pattern>& out)
    {
        std::map<i32, std::vector<const BodyPosition*>> by_sign;
        std::map<i32, std::vector<const BodyPosition*>> by_house;

        for (const auto& pos : positions)
        {
            if (astro::is_chart_point(pos.body))
            {
                continue;
            }
            by_sign[pos.sign()].push_back(&pos);
            if (houses)
            {
                by_house[houses->house_of(pos.longitude)].push_back(&pos);
            }
        }

        for (const auto& [sign, members] : by_sign)
        {
            if (const auto run = tightest_run(members, static_cast<f64>(sign) * zodiac::kSignWidth, config))
            {
                emit_stellium(PatternType::SignStellium, *run, sign, std::nullopt, out);
            }
        }

        for (const auto& [house, members] : by_house)
        {
            if (const auto run = tightest_run(members, houses->cusp(house), config))
            {
                emit_stellium(PatternType::HouseStellium, *run, std::nullopt, house, out);
            }
        }
    }
} // namespace

std::string_view pattern_name(PatternType type)
{
    return kPatternNames[static_cast<std::size_t>(type)];
}

std::vector<Pattern> detect_patterns(std::span<const Aspect> aspects,
                                     std::span<const BodyPosition> positions,
                                     const PatternConfig& config,
                                     const astro::HouseSystem* houses)
{
    if (config.min_stellium_bodies < 2)
    {
        ASL_CORE_ERROR("Patterns: stellium size {} below 2", config.min_stellium_bodies);
        throw InvalidInput("patterns", "a stellium needs at least two bodies");
    }
    if (!std::isfinite(config.max_stellium_span_deg) || config.max_stellium_span_deg < 0.0)
    {
        ASL_CORE_ERROR("Patterns: stellium span {} is not a non-negative angle", config.max_stellium_span_deg);
        throw InvalidInput("patterns", "stellium span must be a non-negative number of degrees");
    }

    const std::vector<Body> bodies = aspected_bodies(aspects);

    std::vector<Pattern> patterns;
    grand_trines(aspects, bodies, patterns);
    focal_patterns(aspects, bodies, AspectType::Opposition, AspectType::Square, PatternType::TSquare, patterns);
    grand_crosses(aspects, patterns);
    focal_patterns(aspects, bodies, AspectType::Sextile, AspectType::Quincunx, PatternType::Yod, patterns);
    stelliums(positions, config, houses, patterns);

    ASL_CORE_DEBUG("Patterns: {} detected", patterns.size());
    return patterns;
}

AspectReport calculate_aspects(std::span<const BodyPosition> positions,
                               const OrbConfig& orbs,
                               const PatternConfig& patterns,
                               const astro::HouseSystem* houses)
{
    AspectReport report;
    report.aspects = find_aspects(positions, orbs);
    report.patterns = detect_patterns(report.aspects, positions, patterns, houses);
    return report;
}

} // namespace astrolabe::chart
