/// @file mean_element_ephemeris.cpp
/// @brief Keplerian mean-element planets, truncated Moon, mean node.

#include "astro/mean_element_ephemeris.hpp"

#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <glm/geometric.hpp>

#include <array>
#include <cmath>
#include <optional>

namespace astrolabe::astro
{

namespace
{
    using namespace astro_constants;

    /// Element value at J2000.0 and its rate per Julian century.
    struct Element
    {
        f64 at_epoch;
        f64 per_century;

        [[nodiscard]] f64 at(f64 t) const { return at_epoch + per_century * t; }
    };

    struct OrbitalElements
    {
        Element a;          ///< semi-major axis (AU)
        Element e;          ///< eccentricity
        Element incl;       ///< inclination (deg)
        Element mean_lon;   ///< mean longitude L (deg)
        Element peri_lon;   ///< longitude of perihelion ϖ (deg)
        Element node_lon;   ///< longitude of ascending node Ω (deg)
    };

    // Standish, "Keplerian Elements for Approximate Positions of the Major Planets", 1800-2050 AD
    constexpr OrbitalElements kMercury = {
        {0.38709927, 0.00000037}, {0.20563593, 0.00001906}, {7.00497902, -0.00594749},
        {252.25032350, 149472.67411175}, {77.45779628, 0.16047689}, {48.33076593, -0.12534081}};
    constexpr OrbitalElements kVenus = {
        {0.72333566, 0.00000390}, {0.00677672, -0.00004107}, {3.39467605, -0.00078890},
        {181.97909950, 58517.81538729}, {131.60246718, 0.00268329}, {76.67984255, -0.27769418}};
    constexpr OrbitalElements kEarthMoonBary = {
        {1.00000261, 0.00000562}, {0.01671123, -0.00004392}, {-0.00001531, -0.01294668},
        {100.46457166, 35999.37244981}, {102.93768193, 0.32327364}, {0.0, 0.0}};
    constexpr OrbitalElements kMars = {
        {1.52371034, 0.00001847}, {0.09339410, 0.00007882}, {1.84969142, -0.00813131},
        {-4.55343205, 19140.30268499}, {-23.94362959, 0.44441088}, {49.55953891, -0.29257343}};
    constexpr OrbitalElements kJupiter = {
        {5.20288700, -0.00011607}, {0.04838624, -0.00013253}, {1.30439695, -0.00183714},
        {34.39644051, 3034.74612775}, {14.72847983, 0.21252668}, {100.47390909, 0.20469106}};
    constexpr OrbitalElements kSaturn = {
        {9.53667594, -0.00125060}, {0.05386179, -0.00050991}, {2.48599187, 0.00193609},
        {49.95424423, 1222.49362201}, {92.59887831, -0.41897216}, {113.66242448, -0.28867794}};
    constexpr OrbitalElements kUranus = {
        {19.18916464, -0.00196176}, {0.04725744, -0.00004397}, {0.77263783, -0.00242939},
        {313.23810451, 428.48202785}, {170.95427630, 0.40805281}, {74.01692503, 0.04240589}};
    constexpr OrbitalElements kNeptune = {
        {30.06992276, 0.00026291}, {0.00859048, 0.00005105}, {1.77004347, 0.00035372},
        {-55.12002969, 218.45945325}, {44.96476227, -0.32241464}, {131.78422574, -0.00508664}};
    constexpr OrbitalElements kPluto = {
        {39.48211675, -0.00031596}, {0.24882730, 0.00005170}, {17.14001206, 0.00004818},
        {238.92903833, 145.20780515}, {224.06891629, -0.04062942}, {110.30393684, -0.01183482}};

    /// General precession, J2000 ecliptic → ecliptic of date (deg per century)
    constexpr f64 kPrecessionPerCentury = 1.396971;

    constexpr i32 kKeplerIterations = 12;

    std::optional<OrbitalElements> elements_for(Body body)
    {
        switch (body)
        {
        case Body::Mercury: return kMercury;
        case Body::Venus:   return kVenus;
        case Body::Mars:    return kMars;
        case Body::Jupiter: return kJupiter;
        case Body::Saturn:  return kSaturn;
        case Body::Uranus:  return kUranus;
        case Body::Neptune: return kNeptune;
        case Body::Pluto:   return kPluto;
        default:            return std::nullopt;
        }
    }

    // -----------------------------------------------------------------
    // Heliocentric ecliptic (J2000) position from mean elements
    // -----------------------------------------------------------------
    Vec3d heliocentric(const OrbitalElements& el, f64 t)
    {
        const f64 a = el.a.at(t);
        const f64 e = el.e.at(t);
        const f64 incl = el.incl.at(t) * kDegToRad;
        const f64 node = el.node_lon.at(t) * kDegToRad;
        const f64 peri = el.peri_lon.at(t);
        const f64 arg_peri = (peri - el.node_lon.at(t)) * kDegToRad;
        const f64 mean_anomaly = signed_difference(el.mean_lon.at(t), peri) * kDegToRad;

        // Kepler's equation E − e sin E = M by Newton iteration
        f64 ecc_anomaly = mean_anomaly + e * std::sin(mean_anomaly);
        for (i32 i = 0; i < kKeplerIterations; ++i)
        {
            const f64 delta = (ecc_anomaly - e * std::sin(ecc_anomaly) - mean_anomaly)
                            / (1.0 - e * std::cos(ecc_anomaly));
            ecc_anomaly -= delta;
            if (std::abs(delta) < 1e-12)
            {
                break;
            }
        }

        // Position in the orbital plane
        const f64 xp = a * (std::cos(ecc_anomaly) - e);
        const f64 yp = a * std::sqrt(1.0 - e * e) * std::sin(ecc_anomaly);

        const f64 cw = std::cos(arg_peri), sw = std::sin(arg_peri);
        const f64 cn = std::cos(node), sn = std::sin(node);
        const f64 ci = std::cos(incl), si = std::sin(incl);

        return Vec3d{
            (cw * cn - sw * sn * ci) * xp + (-sw * cn - cw * sn * ci) * yp,
            (cw * sn + sw * cn * ci) * xp + (-sw * sn + cw * cn * ci) * yp,
            (sw * si) * xp + (cw * si) * yp,
        };
    }

    RawPosition from_vector(const Vec3d& v, f64 t)
    {
        const f64 rho = std::sqrt(v.x * v.x + v.y * v.y);
        return RawPosition{
            .longitude_deg = normalize_degrees(std::atan2(v.y, v.x) * kRadToDeg + kPrecessionPerCentury * t),
            .latitude_deg = std::atan2(v.z, rho) * kRadToDeg,
            .distance_au = glm::length(v),
            .speed_deg_per_day = 0.0,
        };
    }

    // -----------------------------------------------------------------
    // Moon: mean longitude plus the four largest periodic terms
    // -----------------------------------------------------------------
    RawPosition moon(f64 jd)
    {
        const f64 d = jd - kJ2000;
        const f64 mean_lon = 218.316 + 13.176396 * d;
        const f64 moon_anomaly = (134.963 + 13.064993 * d) * kDegToRad;
        const f64 arg_latitude = (93.272 + 13.229350 * d) * kDegToRad;
        const f64 elongation = (297.850 + 12.190749 * d) * kDegToRad;
        const f64 sun_anomaly = (357.529 + 0.98560028 * d) * kDegToRad;

        const f64 lon = mean_lon
                      + 6.289 * std::sin(moon_anomaly)
                      - 1.274 * std::sin(2.0 * elongation - moon_anomaly)
                      + 0.658 * std::sin(2.0 * elongation)
                      - 0.186 * std::sin(sun_anomaly);

        const f64 distance_km = 385001.0 - 20905.0 * std::cos(moon_anomaly);

        return RawPosition{
            .longitude_deg = normalize_degrees(lon),
            .latitude_deg = 5.128 * std::sin(arg_latitude),
            .distance_au = distance_km / kAuKm,
            .speed_deg_per_day = 0.0,
        };
    }

    // Ω = 125.04452° − 1934.136261° T
    RawPosition mean_node(f64 t)
    {
        return RawPosition{
            .longitude_deg = normalize_degrees(125.04452 - 1934.136261 * t),
            .latitude_deg = 0.0,
            .distance_au = 0.0,
            .speed_deg_per_day = 0.0,
        };
    }
} // namespace

MeanElementEphemeris::MeanElementEphemeris(const MeanElementConfig& config)
    : m_config(config)
{
    if (!(m_config.min_jd < m_config.max_jd))
    {
        ASL_CORE_ERROR("MeanElementEphemeris: empty range [{}, {}]", m_config.min_jd, m_config.max_jd);
        throw InvalidInput("ephemeris", "supported range must satisfy min_jd < max_jd");
    }
}

RawPosition MeanElementEphemeris::position(f64 jd_ut, Body body) const
{
    if (!std::isfinite(jd_ut) || jd_ut < m_config.min_jd || jd_ut > m_config.max_jd)
    {
        ASL_CORE_ERROR("MeanElementEphemeris: JD {} outside [{}, {}]", jd_ut, m_config.min_jd, m_config.max_jd);
        throw EphemerisUnavailable("positions",
            std::string(body_name(body)) + " requested outside the supported date range");
    }

    RawPosition pos = sample(jd_ut, body);

    constexpr f64 kHalfStep = 0.5;
    const f64 before = sample(jd_ut - kHalfStep, body).longitude_deg;
    const f64 after = sample(jd_ut + kHalfStep, body).longitude_deg;
    pos.speed_deg_per_day = signed_difference(after, before) / (2.0 * kHalfStep);

    return pos;
}

RawPosition MeanElementEphemeris::sample(f64 jd_ut, Body body)
{
    const f64 t = TimeSystem::julian_centuries(jd_ut);

    switch (body)
    {
    case Body::Moon:
        return moon(jd_ut);
    case Body::NorthNode:
        return mean_node(t);
    case Body::Sun:
        return from_vector(-heliocentric(kEarthMoonBary, t), t);
    default:
        break;
    }

    const auto elements = elements_for(body);
    if (!elements)
    {
        ASL_CORE_ERROR("MeanElementEphemeris: no theory for {}", body_name(body));
        throw EphemerisUnavailable("positions", std::string(body_name(body)) + " is not provided by the mean-element ephemeris");
    }

    const Vec3d earth = heliocentric(kEarthMoonBary, t);
    return from_vector(heliocentric(*elements, t) - earth, t);
}

} // namespace astrolabe::astro
