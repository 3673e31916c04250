#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace orrery::core
{
    /// @brief Sink and level settings applied by Logger::init().
    struct LoggerConfig
    {
        std::string file_name = "orrery.log";   ///< Empty logs to the console only
        spdlog::level::level_enum level = spdlog::level::info;
    };

    /// @brief Centralized logging facility for Orrery.
    ///
    /// Provides two separate loggers:
    /// - **ORRERY** (core): physics, bodies, orbits, catalog loading
    /// - **APP**: command-line report and user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called before any ORR_ macros are used; calling it again
        /// replaces both loggers.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library logger ("ORRERY").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace orrery::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ORR_CORE_TRACE(...)    ::orrery::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ORR_CORE_INFO(...)     ::orrery::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ORR_CORE_WARN(...)     ::orrery::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ORR_CORE_ERROR(...)    ::orrery::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ORR_CORE_CRITICAL(...) ::orrery::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ORR_TRACE(...)         ::orrery::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ORR_INFO(...)          ::orrery::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ORR_WARN(...)          ::orrery::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ORR_ERROR(...)         ::orrery::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ORR_CRITICAL(...)      ::orrery::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
