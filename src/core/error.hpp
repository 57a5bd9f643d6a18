#pragma once

/// @file error.hpp
/// @brief Typed failures raised by the chart calculation steps.

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace astrolabe
{
    /// @brief Failure taxonomy shared by every calculation step.
    enum class ErrorCode
    {
        EphemerisUnavailable,       ///< Provider cannot resolve a moment/body
        HouseSystemUndefined,       ///< Time-based house system has no solution at this latitude
        IncompleteChartData,        ///< Required planet or ascendant input missing
        InsufficientEphemerisRange, ///< Design-moment search could not converge
        InvalidInput,               ///< Caller passed an out-of-range argument
    };

    [[nodiscard]] std::string_view to_string(ErrorCode code);

    /// @brief Base class of all engine failures.
    ///
    /// Carries the error code and the calculation step that failed
    /// ("positions", "houses", "ashtakavarga", ...).
    class ChartError : public std::runtime_error
    {
    public:
        ChartError(ErrorCode code, std::string step, const std::string& message);

        [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
        [[nodiscard]] const std::string& step() const noexcept { return m_step; }

    private:
        ErrorCode m_code;
        std::string m_step;
    };

    class EphemerisUnavailable : public ChartError
    {
    public:
        EphemerisUnavailable(std::string step, const std::string& message)
            : ChartError(ErrorCode::EphemerisUnavailable, std::move(step), message) {}
    };

    class HouseSystemUndefined : public ChartError
    {
    public:
        HouseSystemUndefined(std::string step, const std::string& message)
            : ChartError(ErrorCode::HouseSystemUndefined, std::move(step), message) {}
    };

    class IncompleteChartData : public ChartError
    {
    public:
        IncompleteChartData(std::string step, const std::string& message)
            : ChartError(ErrorCode::IncompleteChartData, std::move(step), message) {}
    };

    class InsufficientEphemerisRange : public ChartError
    {
    public:
        InsufficientEphemerisRange(std::string step, const std::string& message)
            : ChartError(ErrorCode::InsufficientEphemerisRange, std::move(step), message) {}
    };

    class InvalidInput : public ChartError
    {
    public:
        InvalidInput(std::string step, const std::string& message)
            : ChartError(ErrorCode::InvalidInput, std::move(step), message) {}
    };

} // namespace astrolabe
