#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Day, sidereal time, chart moments.

#include "core/types.hpp"

namespace astrolabe::astro
{
    /// @brief Civil date/time representation.
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Day conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), mean obliquity and system clock access.
    /// Sidereal times are in radians; obliquity is in degrees.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Day.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Day as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Day back to civil date/time (UTC).
        /// @param jd Julian Day (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Day.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Day (UT).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Day (UT).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Mean obliquity of the ecliptic in degrees (IAU 1980, linear term).
        [[nodiscard]] static f64 mean_obliquity_deg(f64 jd);

        /// @brief Get current system time as a Julian Day.
        /// @return Julian Day corresponding to the current UTC system clock.
        [[nodiscard]] static f64 now_as_jd();

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

    /// @brief An instant on the continuous UT Julian Day scale.
    ///
    /// The civil offset is carried for display only; every calculation
    /// uses jd_ut. Immutable once constructed.
    class Moment
    {
    public:
        /// @brief Moment from a raw Julian Day (UT).
        explicit Moment(f64 jd_ut, i32 utc_offset_minutes = 0)
            : m_jd_ut(jd_ut), m_utc_offset_minutes(utc_offset_minutes) {}

        /// @brief Moment from a UTC civil date/time.
        [[nodiscard]] static Moment from_utc(const DateTime& utc);

        /// @brief Moment from a local civil date/time and its offset from UTC.
        [[nodiscard]] static Moment from_local(const DateTime& local, i32 utc_offset_minutes);

        [[nodiscard]] f64 jd_ut() const { return m_jd_ut; }
        [[nodiscard]] i32 utc_offset_minutes() const { return m_utc_offset_minutes; }

        /// @brief Julian centuries since J2000.0.
        [[nodiscard]] f64 centuries() const { return TimeSystem::julian_centuries(m_jd_ut); }

        /// @brief UTC civil date/time.
        [[nodiscard]] DateTime utc() const { return TimeSystem::from_julian_date(m_jd_ut); }

        /// @brief Civil date/time in the originating offset.
        [[nodiscard]] DateTime local() const;

        /// @brief New moment shifted by a (possibly negative) number of days.
        [[nodiscard]] Moment plus_days(f64 days) const { return Moment(m_jd_ut + days, m_utc_offset_minutes); }

    private:
        f64 m_jd_ut;
        i32 m_utc_offset_minutes;
    };

    /// @brief Observer position on Earth in degrees (east longitude positive).
    struct GeoLocation
    {
        f64 latitude_deg = 0.0;
        f64 longitude_deg = 0.0;
    };

    /// @brief Throw InvalidInput if latitude/longitude are out of range.
    void validate_location(const GeoLocation& location, const char* step);

} // namespace astrolabe::astro
