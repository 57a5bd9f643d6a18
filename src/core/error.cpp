/// @file error.cpp
/// @brief Error code names and ChartError message formatting.

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace astrolabe
{

std::string_view to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::EphemerisUnavailable:       return "EphemerisUnavailable";
    case ErrorCode::HouseSystemUndefined:       return "HouseSystemUndefined";
    case ErrorCode::IncompleteChartData:        return "IncompleteChartData";
    case ErrorCode::InsufficientEphemerisRange: return "InsufficientEphemerisRange";
    case ErrorCode::InvalidInput:               return "InvalidInput";
    }
    return "Unknown";
}

ChartError::ChartError(ErrorCode code, std::string step, const std::string& message)
    : std::runtime_error(fmt::format("[{}] {}: {}", to_string(code), step, message))
    , m_code(code)
    , m_step(std::move(step))
{
}

} // namespace astrolabe
