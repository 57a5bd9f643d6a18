/// @file yogas.cpp
/// @brief Yoga rule catalog and strength grading.

#include "vedic/yogas.hpp"

#include "chart/aspects.hpp"
#include "vedic/nakshatra.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <utility>

namespace astrolabe::vedic
{

namespace
{
    using astro::BodyPosition;

    constexpr const char* kStep = "yogas";

    constexpr std::array<i32, 4> kKendras = {1, 4, 7, 10};
    constexpr std::array<i32, 3> kDusthanas = {6, 8, 12};

    /// Non-luminary classical planets, used by the Moon/Sun flanking yogas.
    constexpr std::array<Body, 5> kTaraGrahas = {
        Body::Mars, Body::Mercury, Body::Jupiter, Body::Venus, Body::Saturn,
    };

    bool is_kendra(i32 house)
    {
        return std::find(kKendras.begin(), kKendras.end(), house) != kKendras.end();
    }

    bool is_trikona(i32 house)
    {
        return house == 1 || house == 5 || house == 9;
    }

    bool is_dusthana(i32 house)
    {
        return std::find(kDusthanas.begin(), kDusthanas.end(), house) != kDusthanas.end();
    }

    YogaStrength promote(YogaStrength s)
    {
        return s == YogaStrength::Weak ? YogaStrength::Moderate : YogaStrength::Strong;
    }

    YogaStrength demote(YogaStrength s)
    {
        return s == YogaStrength::Strong ? YogaStrength::Moderate : YogaStrength::Weak;
    }

    struct Placement
    {
        Body body = Body::Sun;
        f64 longitude = 0.0;
        i32 sign = 0;
        i32 house = 1;
        Dignity dignity = Dignity::Neutral;
    };

    // -----------------------------------------------------------------
    // Whole-sign view of the chart shared by every rule
    // -----------------------------------------------------------------
    class ChartView
    {
    public:
        ChartView(std::span<const BodyPosition> positions, f64 ascendant, const DignityOverrides& dignities)
            : m_asc_sign(sign_of(ascendant))
        {
            for (const auto& pos : positions)
            {
                if (astro::is_chart_point(pos.body))
                {
                    continue;
                }
                place(pos.body, pos.longitude, dignities);
            }

            // Either node implies the other
            if (has(Body::NorthNode) && !has(Body::SouthNode))
            {
                place(Body::SouthNode, at(Body::NorthNode).longitude + 180.0, dignities);
            }
            else if (has(Body::SouthNode) && !has(Body::NorthNode))
            {
                place(Body::NorthNode, at(Body::SouthNode).longitude + 180.0, dignities);
            }
        }

        [[nodiscard]] bool has(Body body) const { return m_slots[astro::body_index(body)].has_value(); }
        [[nodiscard]] const Placement& at(Body body) const { return *m_slots[astro::body_index(body)]; }

        [[nodiscard]] i32 house(Body body) const { return at(body).house; }

        [[nodiscard]] Body lord_of(i32 house) const
        {
            return sign_lord((m_asc_sign + house - 1) % 12);
        }

        /// House of @p other counted from the sign of @p from (1..12).
        [[nodiscard]] i32 counted_from(Body from, Body other) const
        {
            return (at(other).sign - at(from).sign + 12) % 12 + 1;
        }

        [[nodiscard]] bool conjunct(Body a, Body b) const
        {
            return has(a) && has(b) && at(a).sign == at(b).sign;
        }

        [[nodiscard]] f64 orb(Body a, Body b) const
        {
            return chart::angular_separation(at(a).longitude, at(b).longitude);
        }

        [[nodiscard]] bool exchange(Body a, Body b) const
        {
            return sign_lord(at(a).sign) == b && sign_lord(at(b).sign) == a;
        }

        /// Bodies from @p candidates sitting @p house signs from @p from.
        template <std::size_t N>
        [[nodiscard]] std::vector<Body> in_house_from(Body from, i32 house, const std::array<Body, N>& candidates) const
        {
            std::vector<Body> result;
            for (const Body b : candidates)
            {
                if (b != from && has(b) && counted_from(from, b) == house)
                {
                    result.push_back(b);
                }
            }
            return result;
        }

    private:
        void place(Body body, f64 longitude, const DignityOverrides& dignities)
        {
            Placement p;
            p.body = body;
            p.longitude = normalize_degrees(longitude);
            p.sign = sign_of(p.longitude);
            p.house = (p.sign - m_asc_sign + 12) % 12 + 1;
            const auto it = dignities.find(body);
            p.dignity = (it != dignities.end()) ? it->second : dignity_of(body, p.longitude);
            m_slots[astro::body_index(body)] = p;
        }

        i32 m_asc_sign;
        std::array<std::optional<Placement>, astro::kBodyCount> m_slots{};
    };

    // -----------------------------------------------------------------
    // Rule scan
    // -----------------------------------------------------------------
    class Detector
    {
    public:
        Detector(const ChartView& chart, const YogaConfig& config)
            : m_chart(chart), m_config(config) {}

        std::vector<Yoga> run()
        {
            raja();
            pancha_mahapurusha();
            dhana();
            chandra();
            surya();
            other();
            negative();
            return std::move(m_yogas);
        }

    private:
        void add(std::string name, YogaCategory category, std::vector<Body> planets,
                 std::vector<i32> houses, YogaStrength strength, std::string description)
        {
            // The same combination can be reached through different house pairs
            for (auto& existing : m_yogas)
            {
                if (existing.name == name && existing.planets == planets)
                {
                    existing.strength = std::min(existing.strength, strength);
                    return;
                }
            }
            m_yogas.push_back(Yoga{
                .name = std::move(name),
                .category = category,
                .planets = std::move(planets),
                .houses = std::move(houses),
                .strength = strength,
                .description = std::move(description),
            });
        }

        YogaStrength grade_conjunction(YogaStrength base, Body a, Body b) const
        {
            const f64 orb = m_chart.orb(a, b);
            if (orb <= m_config.tight_orb_deg)
            {
                return promote(base);
            }
            if (orb > m_config.wide_orb_deg)
            {
                return demote(base);
            }
            return base;
        }

        YogaStrength grade_dignity(YogaStrength base, Body planet) const
        {
            const f64 degree = m_chart.at(planet).longitude - zodiac::kSignWidth * static_cast<f64>(m_chart.at(planet).sign);
            if (degree < m_config.boundary_margin_deg || degree > zodiac::kSignWidth - m_config.boundary_margin_deg)
            {
                return demote(base);
            }
            return base;
        }

        static std::vector<Body> pair(Body a, Body b)
        {
            return a < b ? std::vector<Body>{a, b} : std::vector<Body>{b, a};
        }

        static std::string names(const std::vector<Body>& planets)
        {
            std::string text;
            for (const Body b : planets)
            {
                if (!text.empty())
                {
                    text += ", ";
                }
                text += lord_name(b);
            }
            return text;
        }

        // ---- Raja -------------------------------------------------------
        void raja()
        {
            for (const i32 kendra : kKendras)
            {
                for (const i32 trikona : {5, 9})
                {
                    const Body kl = m_chart.lord_of(kendra);
                    const Body tl = m_chart.lord_of(trikona);
                    if (kl == tl)
                    {
                        continue;
                    }

                    const YogaStrength base = (kendra == 1 || trikona == 9) ? YogaStrength::Strong : YogaStrength::Moderate;
                    const std::string title = fmt::format("Raja Yoga ({}-{})", lord_name(kl), lord_name(tl));

                    if (m_chart.conjunct(kl, tl))
                    {
                        add(title, YogaCategory::Raja, pair(kl, tl), {kendra, trikona},
                            grade_conjunction(base, kl, tl),
                            fmt::format("Lords of houses {} and {} conjunct in house {}", kendra, trikona, m_chart.house(kl)));
                    }
                    else if (m_chart.exchange(kl, tl))
                    {
                        add(title, YogaCategory::Raja, pair(kl, tl), {kendra, trikona}, base,
                            fmt::format("Lords of houses {} and {} exchange signs", kendra, trikona));
                    }
                }
            }

            if (is_kendra(m_chart.counted_from(Body::Moon, Body::Jupiter)))
            {
                add("Gaja Kesari Yoga", YogaCategory::Raja, {Body::Moon, Body::Jupiter},
                    {m_chart.house(Body::Moon), m_chart.house(Body::Jupiter)}, YogaStrength::Strong,
                    "Jupiter in a kendra from the Moon");
            }

            for (const i32 dusthana : kDusthanas)
            {
                const Body lord = m_chart.lord_of(dusthana);
                const i32 placed = m_chart.house(lord);
                if (is_dusthana(placed) && placed != dusthana)
                {
                    add("Viparita Raja Yoga", YogaCategory::Raja, {lord}, {dusthana, placed}, YogaStrength::Moderate,
                        fmt::format("Lord of house {} ({}) placed in house {}", dusthana, lord_name(lord), placed));
                }
            }
        }

        // ---- Pancha Mahapurusha ----------------------------------------
        void pancha_mahapurusha()
        {
            struct Entry
            {
                Body planet;
                const char* name;
            };
            constexpr std::array<Entry, 5> kMahapurushas = {{
                {Body::Mars, "Ruchaka"},
                {Body::Mercury, "Bhadra"},
                {Body::Jupiter, "Hamsa"},
                {Body::Venus, "Malavya"},
                {Body::Saturn, "Sasa"},
            }};

            for (const auto& entry : kMahapurushas)
            {
                const auto& p = m_chart.at(entry.planet);
                if (!is_kendra(p.house) || !is_dignified(p.dignity))
                {
                    continue;
                }
                const YogaStrength base = (p.dignity == Dignity::Exalted) ? YogaStrength::Strong : YogaStrength::Moderate;
                add(fmt::format("{} Yoga", entry.name), YogaCategory::PanchaMahapurusha, {entry.planet}, {p.house},
                    grade_dignity(base, entry.planet),
                    fmt::format("{} {} in kendra house {}", lord_name(entry.planet), dignity_name(p.dignity), p.house));
            }
        }

        // ---- Dhana -----------------------------------------------------
        void dhana()
        {
            const Body second = m_chart.lord_of(2);
            const Body eleventh = m_chart.lord_of(11);
            if (second != eleventh && m_chart.conjunct(second, eleventh))
            {
                add("Dhana Yoga (2-11)", YogaCategory::Dhana, pair(second, eleventh), {2, 11},
                    grade_conjunction(YogaStrength::Strong, second, eleventh),
                    "Lords of the 2nd and 11th houses conjunct");
            }

            for (const auto& [wealth, ordinal] : {std::pair{2, "2nd"}, std::pair{11, "11th"}})
            {
                const Body lord = m_chart.lord_of(wealth);
                const i32 placed = m_chart.house(lord);
                if (is_kendra(placed) || is_trikona(placed))
                {
                    add(fmt::format("Dhana Yoga ({} lord)", ordinal), YogaCategory::Dhana, {lord}, {wealth, placed},
                        YogaStrength::Moderate,
                        fmt::format("Lord of house {} ({}) in house {}", wealth, lord_name(lord), placed));
                }
            }

            const Body ninth = m_chart.lord_of(9);
            const auto& p = m_chart.at(ninth);
            if (is_dignified(p.dignity) && (is_kendra(p.house) || is_trikona(p.house)))
            {
                add("Lakshmi Yoga", YogaCategory::Dhana, {ninth}, {9, p.house},
                    grade_dignity(YogaStrength::Strong, ninth),
                    fmt::format("9th lord {} {} in house {}", lord_name(ninth), dignity_name(p.dignity), p.house));
            }
        }

        // ---- Chandra ---------------------------------------------------
        void chandra()
        {
            const i32 moon_house = m_chart.house(Body::Moon);

            if (m_chart.conjunct(Body::Moon, Body::Mars))
            {
                add("Chandra-Mangala Yoga", YogaCategory::Chandra, {Body::Moon, Body::Mars}, {moon_house},
                    grade_conjunction(YogaStrength::Moderate, Body::Moon, Body::Mars), "Moon conjunct Mars");
            }

            const auto second = m_chart.in_house_from(Body::Moon, 2, kTaraGrahas);
            const auto twelfth = m_chart.in_house_from(Body::Moon, 12, kTaraGrahas);

            auto with_moon = [](std::vector<Body> bodies) {
                bodies.insert(bodies.begin(), Body::Moon);
                return bodies;
            };

            if (!second.empty())
            {
                add("Sunapha Yoga", YogaCategory::Chandra, with_moon(second), {moon_house}, YogaStrength::Moderate,
                    "Planet(s) in 2nd from Moon: " + names(second));
            }
            if (!twelfth.empty())
            {
                add("Anapha Yoga", YogaCategory::Chandra, with_moon(twelfth), {moon_house}, YogaStrength::Moderate,
                    "Planet(s) in 12th from Moon: " + names(twelfth));
            }
            if (!second.empty() && !twelfth.empty())
            {
                std::vector<Body> both = second;
                both.insert(both.end(), twelfth.begin(), twelfth.end());
                add("Durudhara Yoga", YogaCategory::Chandra, with_moon(both), {moon_house}, YogaStrength::Strong,
                    "Planets in both 2nd and 12th from Moon");
            }

            std::vector<Body> adhi;
            for (const Body b : {Body::Mercury, Body::Jupiter, Body::Venus})
            {
                const i32 h = m_chart.counted_from(Body::Moon, b);
                if (h >= 6 && h <= 8)
                {
                    adhi.push_back(b);
                }
            }
            if (adhi.size() >= 2)
            {
                add("Adhi Yoga", YogaCategory::Chandra, with_moon(adhi), {moon_house},
                    adhi.size() == 3 ? YogaStrength::Strong : YogaStrength::Moderate,
                    "Benefics in 6th, 7th or 8th from Moon: " + names(adhi));
            }
        }

        // ---- Surya -----------------------------------------------------
        void surya()
        {
            const i32 sun_house = m_chart.house(Body::Sun);

            if (m_chart.conjunct(Body::Sun, Body::Mercury))
            {
                add("Budha-Aditya Yoga", YogaCategory::Surya, {Body::Sun, Body::Mercury}, {sun_house},
                    grade_conjunction(YogaStrength::Moderate, Body::Sun, Body::Mercury), "Sun conjunct Mercury");
            }

            const auto second = m_chart.in_house_from(Body::Sun, 2, kTaraGrahas);
            const auto twelfth = m_chart.in_house_from(Body::Sun, 12, kTaraGrahas);

            auto with_sun = [](std::vector<Body> bodies) {
                bodies.insert(bodies.begin(), Body::Sun);
                return bodies;
            };

            if (!second.empty())
            {
                add("Vesi Yoga", YogaCategory::Surya, with_sun(second), {sun_house}, YogaStrength::Moderate,
                    "Planet(s) in 2nd from Sun: " + names(second));
            }
            if (!twelfth.empty())
            {
                add("Vosi Yoga", YogaCategory::Surya, with_sun(twelfth), {sun_house}, YogaStrength::Moderate,
                    "Planet(s) in 12th from Sun: " + names(twelfth));
            }
            if (!second.empty() && !twelfth.empty())
            {
                std::vector<Body> both = second;
                both.insert(both.end(), twelfth.begin(), twelfth.end());
                add("Ubhayachari Yoga", YogaCategory::Surya, with_sun(both), {sun_house}, YogaStrength::Strong,
                    "Planets on both sides of the Sun");
            }
        }

        // ---- Other -----------------------------------------------------
        void other()
        {
            const std::array<Body, 3> wisdom = {Body::Jupiter, Body::Venus, Body::Mercury};
            const bool saraswati = std::all_of(wisdom.begin(), wisdom.end(), [this](Body b) {
                const i32 h = m_chart.house(b);
                return is_kendra(h) || is_trikona(h);
            });
            if (saraswati)
            {
                add("Saraswati Yoga", YogaCategory::Other, {Body::Mercury, Body::Jupiter, Body::Venus},
                    {m_chart.house(Body::Jupiter), m_chart.house(Body::Venus), m_chart.house(Body::Mercury)},
                    YogaStrength::Strong, "Jupiter, Venus and Mercury all in kendras or trikonas");
            }

            const Body fourth = m_chart.lord_of(4);
            if (is_kendra(m_chart.house(fourth)) && is_kendra(m_chart.house(Body::Jupiter)))
            {
                add("Kahala Yoga", YogaCategory::Other,
                    fourth == Body::Jupiter ? std::vector<Body>{Body::Jupiter} : pair(fourth, Body::Jupiter),
                    {4, m_chart.house(fourth), m_chart.house(Body::Jupiter)}, YogaStrength::Moderate,
                    fmt::format("4th lord ({}) and Jupiter both in kendras", lord_name(fourth)));
            }
        }

        // ---- Negative --------------------------------------------------
        void negative()
        {
            constexpr std::array<Body, 6> kFlanking = {
                Body::Sun, Body::Mars, Body::Mercury, Body::Jupiter, Body::Venus, Body::Saturn,
            };
            const i32 moon_house = m_chart.house(Body::Moon);
            const bool flanked = !m_chart.in_house_from(Body::Moon, 2, kFlanking).empty()
                              || !m_chart.in_house_from(Body::Moon, 12, kFlanking).empty();
            if (!flanked && !is_kendra(moon_house))
            {
                add("Kemadruma Yoga", YogaCategory::Negative, {Body::Moon}, {moon_house}, YogaStrength::Moderate,
                    "No planets in 2nd or 12th from Moon, Moon not in a kendra");
            }

            if (!m_chart.has(Body::NorthNode))
            {
                return;
            }
            for (const Body light : {Body::Sun, Body::Moon})
            {
                if (m_chart.conjunct(light, Body::NorthNode))
                {
                    add(fmt::format("Grahan Yoga ({}-Rahu)", lord_name(light)), YogaCategory::Negative,
                        {light, Body::NorthNode}, {m_chart.house(light)}, YogaStrength::Moderate,
                        fmt::format("{} conjunct Rahu", lord_name(light)));
                }
                if (m_chart.conjunct(light, Body::SouthNode))
                {
                    add(fmt::format("Grahan Yoga ({}-Ketu)", lord_name(light)), YogaCategory::Negative,
                        {light, Body::SouthNode}, {m_chart.house(light)}, YogaStrength::Weak,
                        fmt::format("{} conjunct Ketu", lord_name(light)));
                }
            }
        }

        const ChartView& m_chart;
        const YogaConfig& m_config;
        std::vector<Yoga> m_yogas;
    };

    YogaSummary summarize(const std::vector<Yoga>& yogas)
    {
        YogaSummary summary;
        for (const auto& yoga : yogas)
        {
            ++summary.counts[yoga.category];
            if (yoga.strength == YogaStrength::Strong && summary.strongest.size() < 5)
            {
                summary.strongest.push_back(yoga.name);
            }
        }

        auto count = [&summary](YogaCategory c) {
            const auto it = summary.counts.find(c);
            return it == summary.counts.end() ? 0 : it->second;
        };
        const i32 positive = count(YogaCategory::Raja) + count(YogaCategory::Dhana) + count(YogaCategory::PanchaMahapurusha);
        const i32 negative = count(YogaCategory::Negative);

        if (positive >= 5 && negative <= 1)
        {
            summary.assessment = "Exceptionally favorable chart with multiple powerful yogas";
        }
        else if (positive >= 3)
        {
            summary.assessment = "Strong chart with beneficial planetary combinations";
        }
        else if (positive >= 1)
        {
            summary.assessment = "Chart has some beneficial yogas supporting success";
        }
        else if (negative >= 2)
        {
            summary.assessment = "Chart has challenging yogas requiring careful navigation";
        }
        else
        {
            summary.assessment = "Chart has standard planetary combinations";
        }
        return summary;
    }
} // namespace

std::string_view yoga_category_name(YogaCategory category)
{
    switch (category)
    {
    case YogaCategory::Raja:              return "raja";
    case YogaCategory::Dhana:             return "dhana";
    case YogaCategory::PanchaMahapurusha: return "pancha_mahapurusha";
    case YogaCategory::Chandra:           return "chandra";
    case YogaCategory::Surya:             return "surya";
    case YogaCategory::Other:             return "other";
    case YogaCategory::Negative:          return "negative";
    }
    return "unknown";
}

std::string_view yoga_strength_name(YogaStrength strength)
{
    switch (strength)
    {
    case YogaStrength::Strong:   return "strong";
    case YogaStrength::Moderate: return "moderate";
    case YogaStrength::Weak:     return "weak";
    }
    return "unknown";
}

YogaReport detect_yogas(std::span<const BodyPosition> positions,
                        f64 ascendant_longitude,
                        const DignityOverrides& dignities,
                        const YogaConfig& config)
{
    if (!std::isfinite(ascendant_longitude))
    {
        ASL_CORE_ERROR("Yogas: ascendant longitude is not finite");
        throw IncompleteChartData(kStep, "ascendant is required");
    }

    const ChartView chart(positions, ascendant_longitude, dignities);
    for (const Body planet : astro::kClassicalPlanets)
    {
        if (!chart.has(planet))
        {
            ASL_CORE_ERROR("Yogas: missing {}", astro::body_name(planet));
            throw IncompleteChartData(kStep, std::string(astro::body_name(planet)) + " position is required");
        }
    }

    YogaReport report;
    report.yogas = Detector(chart, config).run();

    if (!config.include_weak)
    {
        std::erase_if(report.yogas, [](const Yoga& y) { return y.strength == YogaStrength::Weak; });
    }
    report.summary = summarize(report.yogas);

    ASL_CORE_DEBUG("Yogas: {} detected ({})", report.yogas.size(), report.summary.assessment);
    return report;
}

} // namespace astrolabe::vedic
