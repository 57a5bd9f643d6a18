// src/main.cpp - Astrolabe chart printer entry point
//
// Usage: astrolabe YYYY-MM-DD HH:MM:SS <lat> <lon> [house_system] [tropical|sidereal]
//
// Computes, for a UTC birth moment and location:
//  1. Natal positions, houses, aspects and patterns
//  2. Vimshottari dasha from the sidereal Moon
//  3. Ashtakavarga bindu tables
//  4. Yogas
//  5. Human Design bodygraph

#include "astro/houses.hpp"
#include "astro/mean_element_ephemeris.hpp"
#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "chart/natal_chart.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "human_design/human_design.hpp"
#include "vedic/ashtakavarga.hpp"
#include "vedic/dasha.hpp"
#include "vedic/yogas.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace astrolabe;

namespace
{
    struct CliArguments
    {
        astro::DateTime utc{};
        astro::GeoLocation location;
        astro::HouseSystemKind houses = astro::HouseSystemKind::Placidus;
        astro::ZodiacMode zodiac = astro::ZodiacMode::Tropical;
    };

    void print_usage()
    {
        std::cout << "Usage: astrolabe YYYY-MM-DD HH:MM:SS <latitude> <longitude> "
                     "[placidus|koch|regiomontanus|porphyry|equal|whole_sign] [tropical|sidereal]\n"
                  << "  Time is UTC; longitude is east-positive.\n";
    }

    std::optional<f64> parse_number(const char* text)
    {
        f64 value = 0.0;
        char trailing = '\0';
        if (std::sscanf(text, "%lf%c", &value, &trailing) != 1)
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<CliArguments> parse_arguments(int argc, char** argv)
    {
        if (argc < 5 || argc > 7)
        {
            return std::nullopt;
        }

        CliArguments args;
        if (std::sscanf(argv[1], "%d-%d-%d", &args.utc.year, &args.utc.month, &args.utc.day) != 3)
        {
            ASL_ERROR("Bad date '{}', expected YYYY-MM-DD", argv[1]);
            return std::nullopt;
        }
        if (std::sscanf(argv[2], "%d:%d:%lf", &args.utc.hour, &args.utc.minute, &args.utc.second) != 3)
        {
            ASL_ERROR("Bad time '{}', expected HH:MM:SS", argv[2]);
            return std::nullopt;
        }

        const auto lat = parse_number(argv[3]);
        const auto lon = parse_number(argv[4]);
        if (!lat || !lon)
        {
            ASL_ERROR("Latitude and longitude must be numbers");
            return std::nullopt;
        }
        args.location = {.latitude_deg = *lat, .longitude_deg = *lon};

        if (argc > 5)
        {
            const auto kind = astro::parse_house_system(argv[5]);
            if (!kind)
            {
                ASL_ERROR("Unknown house system '{}'", argv[5]);
                return std::nullopt;
            }
            args.houses = *kind;
        }
        if (argc > 6)
        {
            const std::string_view zodiac = argv[6];
            if (zodiac == "sidereal")
            {
                args.zodiac = astro::ZodiacMode::Sidereal;
            }
            else if (zodiac != "tropical")
            {
                ASL_ERROR("Unknown zodiac '{}'", zodiac);
                return std::nullopt;
            }
        }
        return args;
    }

    std::string format_longitude(f64 longitude)
    {
        const i32 sign = sign_of(longitude);
        const f64 in_sign = longitude - zodiac::kSignWidth * static_cast<f64>(sign);
        return fmt::format("{:6.2f}° {}", in_sign, astro::sign_name(sign));
    }

    void print_rule(std::string_view title)
    {
        std::cout << "\n--- " << title << " ---\n";
    }

    // -----------------------------------------------------------------
    // Sections
    // -----------------------------------------------------------------

    void print_natal(const chart::NatalChart& natal)
    {
        print_rule(fmt::format("Natal chart ({}, {})",
                               astro::zodiac_name(natal.houses.zodiac),
                               astro::house_system_name(natal.houses.kind)));

        for (std::size_t i = 0; i < natal.positions.size(); ++i)
        {
            const auto& pos = natal.positions[i];
            std::cout << fmt::format("  {:<11} {:<18} house {:>2}{}\n",
                                     astro::body_name(pos.body), format_longitude(pos.longitude),
                                     natal.house_assignments[i].house, pos.retrograde() ? "  R" : "");
        }

        std::cout << fmt::format("  Ascendant   {}\n  Midheaven   {}\n",
                                 format_longitude(natal.houses.ascendant),
                                 format_longitude(natal.houses.midheaven));
        for (i32 house = 1; house <= 12; ++house)
        {
            std::cout << fmt::format("  Cusp {:>2}     {}\n", house, format_longitude(natal.houses.cusp(house)));
        }

        print_rule("Aspects");
        for (const auto& aspect : natal.aspects)
        {
            std::cout << fmt::format("  {:<11} {:<14} {:<11} orb {:4.2f}{}\n",
                                     astro::body_name(aspect.first), chart::aspect_name(aspect.type),
                                     astro::body_name(aspect.second), aspect.orb,
                                     aspect.applying ? "  applying" : "");
        }
        for (const auto& pattern : natal.patterns)
        {
            std::string members;
            for (const astro::Body body : pattern.bodies)
            {
                members += members.empty() ? "" : ", ";
                members += astro::body_name(body);
            }
            std::cout << fmt::format("  Pattern: {} ({})\n", chart::pattern_name(pattern.type), members);
        }
    }

    void print_dasha(const vedic::DashaTree& tree, f64 now_jd)
    {
        print_rule("Vimshottari dasha");
        std::cout << fmt::format("  Birth nakshatra {} pada {}, starting lord {} ({:.2f} years remaining)\n",
                                 tree.info.nakshatra.name, tree.info.nakshatra.pada,
                                 vedic::lord_name(tree.info.starting_lord), tree.info.remaining_years);

        for (const i32 index : tree.mahadashas())
        {
            const auto& period = tree.periods[static_cast<std::size_t>(index)];
            const auto start = period.start.utc();
            const auto end = period.end.utc();
            std::cout << fmt::format("  {:<8} {:04}-{:02}-{:02} .. {:04}-{:02}-{:02}\n",
                                     vedic::lord_name(period.lord),
                                     start.year, start.month, start.day, end.year, end.month, end.day);
        }

        const auto chain = vedic::active_periods(tree, now_jd);
        if (!chain.empty())
        {
            std::cout << "  Running now: " << vedic::format_chain(chain) << "\n";
        }
    }

    void print_ashtakavarga(const vedic::AshtakavargaResult& result)
    {
        print_rule("Ashtakavarga");
        std::cout << "           ";
        for (i32 sign = 0; sign < zodiac::kSignCount; ++sign)
        {
            std::cout << fmt::format("{:>4}", astro::sign_name(sign).substr(0, 3));
        }
        std::cout << "  total\n";

        for (const auto& planet : result.planets)
        {
            std::cout << fmt::format("  {:<9}", astro::body_name(planet.planet));
            for (const i32 bindus : planet.bindus)
            {
                std::cout << fmt::format("{:>4}", bindus);
            }
            std::cout << fmt::format("  {:>5}\n", planet.total);
        }

        i32 total = 0;
        std::cout << fmt::format("  {:<9}", "Sarva");
        for (const i32 bindus : result.sarva)
        {
            std::cout << fmt::format("{:>4}", bindus);
            total += bindus;
        }
        std::cout << fmt::format("  {:>5}\n", total);
        std::cout << fmt::format("  Strongest sign {}, weakest sign {}\n",
                                 astro::sign_name(result.summary.strongest_sign),
                                 astro::sign_name(result.summary.weakest_sign));
    }

    void print_yogas(const vedic::YogaReport& report)
    {
        print_rule("Yogas");
        for (const auto& yoga : report.yogas)
        {
            std::cout << fmt::format("  {:<28} {:<20} {}\n", yoga.name,
                                     vedic::yoga_category_name(yoga.category),
                                     vedic::yoga_strength_name(yoga.strength));
        }
        std::cout << "  Assessment: " << report.summary.assessment << "\n";
    }

    void print_human_design(const human_design::HumanDesignChart& hd)
    {
        using namespace human_design;

        print_rule("Human Design");
        const auto design = hd.design.utc();
        std::cout << fmt::format("  Design moment  {:04}-{:02}-{:02} {:02}:{:02} UTC\n",
                                 design.year, design.month, design.day, design.hour, design.minute);
        std::cout << fmt::format("  Type           {}\n", type_name(hd.bodygraph.type));
        std::cout << fmt::format("  Authority      {}\n", authority_name(hd.bodygraph.authority));
        std::cout << fmt::format("  Definition     {}\n", definition_name(hd.bodygraph.definition));
        std::cout << fmt::format("  Profile        {}\n", hd.profile);
        std::cout << fmt::format("  Cross          {} (Quarter of {})\n", hd.cross.label, hd.cross.quarter);

        std::string defined;
        for (const auto& state : hd.bodygraph.centers)
        {
            if (state.defined)
            {
                defined += defined.empty() ? "" : ", ";
                defined += center_name(state.center);
            }
        }
        std::cout << "  Defined        " << (defined.empty() ? "none" : defined) << "\n";
        for (const auto& channel : hd.bodygraph.channels)
        {
            std::cout << fmt::format("  Channel        {}-{} {}\n",
                                     channel.definition.gate_a, channel.definition.gate_b, channel.definition.name);
        }
    }
} // namespace

int main(int argc, char** argv)
{
    core::Logger::init({.level = spdlog::level::warn});

    const auto args = parse_arguments(argc, argv);
    if (!args)
    {
        print_usage();
        return 1;
    }

    std::cout << "================================================================\n"
              << "  ASTROLABE - natal chart calculator\n"
              << "================================================================\n";

    try
    {
        const astro::MeanElementEphemeris ephemeris;
        const astro::Moment birth = astro::Moment::from_utc(args->utc);
        ASL_INFO("Birth JD {:.5f} at {:.4f}, {:.4f}", birth.jd_ut(),
                 args->location.latitude_deg, args->location.longitude_deg);

        // -----------------------------------------------------------------
        // 1. Natal chart in the requested zodiac and house system
        // -----------------------------------------------------------------
        chart::ChartRequest request;
        request.positions.zodiac = args->zodiac;
        request.houses.system = args->houses;
        const auto natal = chart::calculate_natal_chart(birth, args->location, request, ephemeris);
        print_natal(natal);

        // -----------------------------------------------------------------
        // 2-4. Vedic techniques always use sidereal whole-sign placements
        // -----------------------------------------------------------------
        const astro::PositionConfig sidereal{.zodiac = astro::ZodiacMode::Sidereal};
        const auto vedic_positions = astro::calculate_positions(birth, astro::kDefaultChartBodies, ephemeris, sidereal);
        const auto vedic_houses = astro::calculate_houses(
            birth, args->location,
            {.system = astro::HouseSystemKind::WholeSign, .zodiac = astro::ZodiacMode::Sidereal},
            &ephemeris);

        const auto moon = astro::find_position(vedic_positions, astro::Body::Moon);
        if (!moon)
        {
            throw IncompleteChartData("dasha", "Moon position missing");
        }
        print_dasha(vedic::calculate_dasha(*moon, birth, {.depth = 2}), astro::TimeSystem::now_as_jd());
        print_ashtakavarga(vedic::calculate_ashtakavarga(vedic_positions, vedic_houses.ascendant));
        print_yogas(vedic::detect_yogas(vedic_positions, vedic_houses.ascendant));

        // -----------------------------------------------------------------
        // 5. Human Design
        // -----------------------------------------------------------------
        print_human_design(human_design::calculate_human_design(birth, args->location, ephemeris));
    }
    catch (const ChartError& e)
    {
        ASL_ERROR("{} failed ({}): {}", e.step(), to_string(e.code()), e.what());
        core::Logger::shutdown();
        return 2;
    }

    std::cout << "================================================================\n";
    core::Logger::shutdown();
    return 0;
}
