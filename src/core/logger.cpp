/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + optional rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace astrolabe::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;
std::mutex Logger::s_mutex;

void Logger::init(const LoggerConfig& config)
{
    std::lock_guard lock(s_mutex);
    init_locked(config);
}

void Logger::shutdown()
{
    std::lock_guard lock(s_mutex);
    shutdown_locked();
}

void Logger::init_locked(const LoggerConfig& config)
{
    if (s_core_logger || s_app_logger)
    {
        shutdown_locked();
    }

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (config.file_output)
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(file_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("ASTROLABE"): engine internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("ASTROLABE", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line front end
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown_locked()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    ensure_initialized();
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    ensure_initialized();
    return s_app_logger;
}

void Logger::ensure_initialized()
{
    std::lock_guard lock(s_mutex);
    if (!s_core_logger || !s_app_logger)
    {
        init_locked({});
    }
}

} // namespace astrolabe::core
