#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + viewer loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace skychart::core
{
    /// @brief Centralized logging facility for skychart.
    ///
    /// Provides two separate loggers:
    /// - **SKYCHART** (core): projection setup, caches, viewer subsystems
    /// - **APP**: viewer actions triggered by the user
    ///
    /// Both write to colored console output and a rotating log file.
    /// The library may be used before init() is called: the SKC_ macros
    /// do nothing while the loggers are unset.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief True between init() and shutdown().
        [[nodiscard]] static bool is_initialized();

        /// @brief Access the library logger ("SKYCHART"). May be null before init().
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the viewer logger ("APP"). May be null before init().
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skychart::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKC_LOG_TO(getter, level, ...)                                   \
    do                                                                   \
    {                                                                    \
        if (auto& skc_logger_ = ::skychart::core::Logger::getter())      \
        {                                                                \
            skc_logger_->level(__VA_ARGS__);                             \
        }                                                                \
    } while (false)

#define SKC_CORE_TRACE(...)    SKC_LOG_TO(get_core_logger, trace, __VA_ARGS__)
#define SKC_CORE_INFO(...)     SKC_LOG_TO(get_core_logger, info, __VA_ARGS__)
#define SKC_CORE_WARN(...)     SKC_LOG_TO(get_core_logger, warn, __VA_ARGS__)
#define SKC_CORE_ERROR(...)    SKC_LOG_TO(get_core_logger, error, __VA_ARGS__)
#define SKC_CORE_CRITICAL(...) SKC_LOG_TO(get_core_logger, critical, __VA_ARGS__)

// -----------------------------------------------------------------
// Viewer log macros
// -----------------------------------------------------------------
#define SKC_TRACE(...)         SKC_LOG_TO(get_app_logger, trace, __VA_ARGS__)
#define SKC_INFO(...)          SKC_LOG_TO(get_app_logger, info, __VA_ARGS__)
#define SKC_WARN(...)          SKC_LOG_TO(get_app_logger, warn, __VA_ARGS__)
#define SKC_ERROR(...)         SKC_LOG_TO(get_app_logger, error, __VA_ARGS__)
#define SKC_CRITICAL(...)      SKC_LOG_TO(get_app_logger, critical, __VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
