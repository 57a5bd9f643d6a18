#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace astrolabe::core
{
    /// @brief Logger setup options.
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        bool file_output = false;               ///< Add the rotating file sink
        std::string file_path = "astrolabe.log";
    };

    /// @brief Centralized logging facility for astrolabe.
    ///
    /// Provides two separate loggers:
    /// - **ASTROLABE** (core): calculation engine internals
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored console output and, when enabled, a rotating log file.
    /// init() may be called once from main(); library code that logs before
    /// init() gets console-only loggers at the default level. Setup, teardown
    /// and the lazy first use are serialized, so worker threads may log freely.
    class Logger
    {
    public:
        /// @brief Initialize both loggers. Repeated calls replace the previous setup.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the engine-internal logger ("ASTROLABE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void ensure_initialized();
        static void init_locked(const LoggerConfig& config);
        static void shutdown_locked();

        static std::mutex s_mutex;
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace astrolabe::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ASL_CORE_TRACE(...)    ::astrolabe::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ASL_CORE_DEBUG(...)    ::astrolabe::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ASL_CORE_INFO(...)     ::astrolabe::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ASL_CORE_WARN(...)     ::astrolabe::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ASL_CORE_ERROR(...)    ::astrolabe::core::Logger::get_core_logger()->error(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ASL_TRACE(...)         ::astrolabe::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ASL_INFO(...)          ::astrolabe::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ASL_WARN(...)          ::astrolabe::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ASL_ERROR(...)         ::astrolabe::core::Logger::get_app_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
