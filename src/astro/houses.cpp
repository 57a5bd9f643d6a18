/// @file houses.cpp
/// @brief House division algorithms.

#include "astro/houses.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace astrolabe::astro
{

namespace
{
    using astro_constants::kDegToRad;
    using astro_constants::kRadToDeg;

    constexpr const char* kStep = "houses";

    f64 sind(f64 deg) { return std::sin(deg * kDegToRad); }
    f64 cosd(f64 deg) { return std::cos(deg * kDegToRad); }
    f64 tand(f64 deg) { return std::tan(deg * kDegToRad); }
    f64 atan2d(f64 y, f64 x) { return normalize_degrees(std::atan2(y, x) * kRadToDeg); }

    struct SystemEntry
    {
        HouseSystemKind kind;
        std::string_view name;
        std::string_view key;
    };

    constexpr std::array<SystemEntry, 6> kSystems = {{
        {HouseSystemKind::Placidus,      "Placidus",      "placidus"},
        {HouseSystemKind::Koch,          "Koch",          "koch"},
        {HouseSystemKind::Regiomontanus, "Regiomontanus", "regiomontanus"},
        {HouseSystemKind::Porphyry,      "Porphyry",      "porphyry"},
        {HouseSystemKind::Equal,         "Equal",         "equal"},
        {HouseSystemKind::WholeSign,     "Whole Sign",    "whole_sign"},
    }};

    // -----------------------------------------------------------------
    // Ecliptic point on the great circle through the north/south points
    // of the horizon with pole height P, crossing the equator at RA H.
    //   λ = atan2(sin H, cos H cos ε − tan P sin ε)
    // -----------------------------------------------------------------
    f64 pole_cusp(f64 h, f64 tan_pole, f64 eps)
    {
        return atan2d(sind(h), cosd(h) * cosd(eps) - tan_pole * sind(eps));
    }

    /// Fill cusps 4..9 as opposites of 10..3.
    void mirror_cusps(std::array<f64, 12>& cusps)
    {
        for (std::size_t i = 3; i < 9; ++i)
        {
            cusps[i] = normalize_degrees(cusps[(i + 6) % 12] + 180.0);
        }
    }

    [[noreturn]] void fail_undefined(HouseSystemKind kind, f64 latitude, const std::string& detail)
    {
        ASL_CORE_ERROR("Houses: {} undefined at latitude {:.4f}: {}", house_system_name(kind), latitude, detail);
        throw HouseSystemUndefined(kStep, std::string(house_system_name(kind)) + " " + detail);
    }

    /// Diurnal semi-arc in degrees of a point with declination δ.
    f64 diurnal_semi_arc(f64 declination, f64 latitude, HouseSystemKind kind)
    {
        const f64 x = tand(latitude) * tand(declination);
        if (std::abs(x) > 1.0)
        {
            fail_undefined(kind, latitude, "semi-arc does not exist (circumpolar point)");
        }
        return std::acos(-x) * kRadToDeg;
    }

    // -----------------------------------------------------------------
    // Placidus: cusp whose hour angle is a fixed fraction of its own
    // semi-arc, solved by iterating on right ascension.
    // -----------------------------------------------------------------
    f64 placidus_cusp(f64 ramc, f64 eps, f64 lat, f64 fraction, bool above_horizon, const HouseConfig& config)
    {
        auto right_ascension = [&](f64 dsa) {
            return above_horizon ? ramc + fraction * dsa
                                 : ramc + 180.0 - fraction * (180.0 - dsa);
        };

        f64 alpha = right_ascension(90.0);
        f64 lambda = atan2d(sind(alpha), cosd(alpha) * cosd(eps));

        for (i32 i = 0; i < config.max_iterations; ++i)
        {
            const f64 declination = std::asin(sind(eps) * sind(lambda)) * kRadToDeg;
            const f64 dsa = diurnal_semi_arc(declination, lat, HouseSystemKind::Placidus);
            alpha = right_ascension(dsa);
            const f64 next = atan2d(sind(alpha), cosd(alpha) * cosd(eps));
            const f64 delta = std::abs(signed_difference(next, lambda));
            lambda = next;
            if (delta < config.tolerance_deg)
            {
                return lambda;
            }
        }

        fail_undefined(HouseSystemKind::Placidus, lat, "iteration did not converge");
    }

    void placidus(std::array<f64, 12>& cusps, f64 ramc, f64 eps, f64 lat, const HouseConfig& config)
    {
        cusps[10] = placidus_cusp(ramc, eps, lat, 1.0 / 3.0, true, config);
        cusps[11] = placidus_cusp(ramc, eps, lat, 2.0 / 3.0, true, config);
        cusps[1]  = placidus_cusp(ramc, eps, lat, 2.0 / 3.0, false, config);
        cusps[2]  = placidus_cusp(ramc, eps, lat, 1.0 / 3.0, false, config);
    }

    // -----------------------------------------------------------------
    // Koch: ascendants at times dividing the MC degree's semi-arc
    // -----------------------------------------------------------------
    void koch(std::array<f64, 12>& cusps, f64 ramc, f64 eps, f64 lat, f64 mc)
    {
        const f64 mc_declination = std::asin(sind(eps) * sind(mc)) * kRadToDeg;
        const f64 dsa = diurnal_semi_arc(mc_declination, lat, HouseSystemKind::Koch);
        const f64 third = dsa / 3.0;

        cusps[10] = ascendant_from(ramc - 2.0 * third, eps, lat);
        cusps[11] = ascendant_from(ramc - third, eps, lat);
        cusps[1]  = ascendant_from(ramc + third, eps, lat);
        cusps[2]  = ascendant_from(ramc + 2.0 * third, eps, lat);
    }

    // -----------------------------------------------------------------
    // Regiomontanus: equal 30° divisions of the celestial equator
    // -----------------------------------------------------------------
    void regiomontanus(std::array<f64, 12>& cusps, f64 ramc, f64 eps, f64 lat)
    {
        auto cusp_at = [&](f64 k) {
            const f64 tan_pole = tand(lat) * sind(30.0 * k);
            return pole_cusp(ramc + 30.0 * k, tan_pole, eps);
        };
        cusps[10] = cusp_at(1.0);
        cusps[11] = cusp_at(2.0);
        cusps[1]  = cusp_at(4.0);
        cusps[2]  = cusp_at(5.0);
    }

    // -----------------------------------------------------------------
    // Porphyry: trisect each ecliptic quadrant
    // -----------------------------------------------------------------
    void porphyry(std::array<f64, 12>& cusps, f64 asc, f64 mc)
    {
        const f64 upper = normalize_degrees(asc - mc);
        const f64 lower = normalize_degrees(mc + 180.0 - asc);
        cusps[10] = normalize_degrees(mc + upper / 3.0);
        cusps[11] = normalize_degrees(mc + 2.0 * upper / 3.0);
        cusps[1]  = normalize_degrees(asc + lower / 3.0);
        cusps[2]  = normalize_degrees(asc + 2.0 * lower / 3.0);
    }

    void from_ascendant(std::array<f64, 12>& cusps, f64 start)
    {
        for (std::size_t i = 0; i < cusps.size(); ++i)
        {
            cusps[i] = normalize_degrees(start + 30.0 * static_cast<f64>(i));
        }
    }

    f64 whole_sign_start(f64 asc)
    {
        return std::floor(normalize_degrees(asc) / zodiac::kSignWidth) * zodiac::kSignWidth;
    }
} // namespace

// -----------------------------------------------------------------
// Names
// -----------------------------------------------------------------

std::string_view house_system_name(HouseSystemKind kind)
{
    return kSystems[static_cast<std::size_t>(kind)].name;
}

std::optional<HouseSystemKind> parse_house_system(std::string_view name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    for (const auto& entry : kSystems)
    {
        if (entry.key == key)
        {
            return entry.kind;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Angles
// -----------------------------------------------------------------

f64 ascendant_from(f64 armc_deg, f64 obliquity_deg, f64 latitude_deg)
{
    return atan2d(cosd(armc_deg),
                  -(sind(armc_deg) * cosd(obliquity_deg) + tand(latitude_deg) * sind(obliquity_deg)));
}

f64 midheaven_from(f64 armc_deg, f64 obliquity_deg)
{
    return atan2d(sind(armc_deg), cosd(armc_deg) * cosd(obliquity_deg));
}

// -----------------------------------------------------------------
// HouseSystem queries
// -----------------------------------------------------------------

f64 HouseSystem::cusp(i32 house) const
{
    if (house < 1 || house > 12)
    {
        throw InvalidInput(kStep, "house number must be 1..12");
    }
    return cusps[static_cast<std::size_t>(house - 1)];
}

i32 HouseSystem::house_of(f64 longitude) const
{
    const f64 lon = normalize_degrees(longitude);

    std::size_t nearest = 0;
    f64 nearest_offset = zodiac::kFullCircle;

    for (std::size_t i = 0; i < cusps.size(); ++i)
    {
        const f64 start = cusps[i];
        const f64 width = normalize_degrees(cusps[(i + 1) % cusps.size()] - start);
        const f64 offset = normalize_degrees(lon - start);
        if (offset < width)
        {
            return static_cast<i32>(i) + 1;
        }
        if (offset < nearest_offset)
        {
            nearest_offset = offset;
            nearest = i;
        }
    }

    // Rounding left a sliver uncovered: take the cusp just behind the point
    return static_cast<i32>(nearest) + 1;
}

std::vector<HouseAssignment> HouseSystem::assign_houses(std::span<const BodyPosition> positions) const
{
    std::vector<HouseAssignment> result;
    result.reserve(positions.size());
    for (const auto& pos : positions)
    {
        result.push_back({pos.body, house_of(pos.longitude)});
    }
    return result;
}

std::vector<BodyPosition> HouseSystem::angle_points() const
{
    return {
        make_position(Body::Ascendant, ascendant, 0.0, zodiac),
        make_position(Body::Midheaven, midheaven, 0.0, zodiac),
    };
}

// -----------------------------------------------------------------
// Calculation
// -----------------------------------------------------------------

HouseSystem calculate_houses(const Moment& moment, const GeoLocation& location,
                             const HouseConfig& config, const EphemerisProvider* provider)
{
    validate_location(location, kStep);

    const f64 lat = location.latitude_deg;
    if (is_time_based(config.system) && std::abs(lat) > config.polar_limit_deg)
    {
        fail_undefined(config.system, lat, "beyond the polar limit");
    }

    HouseSystem houses;
    houses.kind = config.system;
    houses.zodiac = config.zodiac;
    houses.obliquity = TimeSystem::mean_obliquity_deg(moment.jd_ut());
    houses.armc = TimeSystem::lmst(moment.jd_ut(), location.longitude_deg * kDegToRad) * kRadToDeg;

    const f64 eps = houses.obliquity;
    const f64 ramc = houses.armc;
    const f64 asc = ascendant_from(ramc, eps, lat);
    const f64 mc = midheaven_from(ramc, eps);

    auto& cusps = houses.cusps;
    switch (config.system)
    {
    case HouseSystemKind::Placidus:
        placidus(cusps, ramc, eps, lat, config);
        break;
    case HouseSystemKind::Koch:
        koch(cusps, ramc, eps, lat, mc);
        break;
    case HouseSystemKind::Regiomontanus:
        regiomontanus(cusps, ramc, eps, lat);
        break;
    case HouseSystemKind::Porphyry:
        porphyry(cusps, asc, mc);
        break;
    case HouseSystemKind::Equal:
    case HouseSystemKind::WholeSign:
        break;
    }

    f64 offset = 0.0;
    if (config.zodiac == ZodiacMode::Sidereal)
    {
        offset = provider ? provider->ayanamsa(config.ayanamsa, moment.jd_ut())
                          : linear_ayanamsa(config.ayanamsa, moment.jd_ut());
    }
    houses.ascendant = normalize_degrees(asc - offset);
    houses.midheaven = normalize_degrees(mc - offset);

    if (config.system == HouseSystemKind::Equal)
    {
        from_ascendant(cusps, houses.ascendant);
    }
    else if (config.system == HouseSystemKind::WholeSign)
    {
        from_ascendant(cusps, whole_sign_start(houses.ascendant));
    }
    else
    {
        cusps[0] = asc;
        cusps[9] = mc;
        mirror_cusps(cusps);
        for (auto& c : cusps)
        {
            c = normalize_degrees(c - offset);
        }
    }

    ASL_CORE_DEBUG("Houses: {} at ({:.4f}, {:.4f}) ARMC={:.4f} Asc={:.4f} MC={:.4f}",
                   house_system_name(config.system), lat, location.longitude_deg,
                   houses.armc, houses.ascendant, houses.midheaven);
    return houses;
}

} // namespace astrolabe::astro
