#pragma once
/*
===============================================================================
LOGGING — Library logger backed by spdlog
===============================================================================

OVERVIEW
--------
mpkit writes its diagnostics through a single named spdlog logger. The logger
is created on first use, writes to stderr and is shared by every component
(builder, solver facade, engine adapters).

CONFIGURATION
-------------
• MPKIT_LOG_LEVEL : compile-time default level, as an spdlog level number
                    (0 = trace ... 6 = off). Defaults to warn.
• setLogLevel()   : runtime override.

Pattern: [%Y-%m-%d %H:%M:%S:%f] [%n] [%-6l] %v

USAGE EXAMPLES
--------------
    mpkit::logger()->debug("solving {} with {}", mp.name(), params.toString());
    mpkit::setLogLevel(spdlog::level::trace);

===============================================================================
*/

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#ifndef MPKIT_LOG_LEVEL
#define MPKIT_LOG_LEVEL SPDLOG_LEVEL_WARN
#endif

namespace mpkit {

    /// @brief Name under which the library logger is registered
    inline constexpr const char* kLoggerName = "mpkit";

    /// @brief Default pattern of the library logger
    inline std::string defaultLogPattern() { return "[%Y-%m-%d %H:%M:%S:%f] [%n] [%-6l] %v"; }

    /// @brief Level selected at compile time through MPKIT_LOG_LEVEL
    inline spdlog::level::level_enum defaultLogLevel()
    {
        return static_cast<spdlog::level::level_enum>(MPKIT_LOG_LEVEL);
    }

    /**
     * @brief Returns the shared library logger, creating it on first use
     *
     * @details If a logger named "mpkit" was already registered with spdlog
     *          (for instance by an application redirecting it to a file), that
     *          logger is used as is.
     */
    inline std::shared_ptr<spdlog::logger> logger()
    {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(kLoggerName))
                return existing;
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_pattern(defaultLogPattern());
            created->set_level(defaultLogLevel());
            created->flush_on(spdlog::level::warn);
            return created;
        }();
        return instance;
    }

    /// @brief Adjust the verbosity of the library logger at runtime
    inline void setLogLevel(spdlog::level::level_enum level)
    {
        logger()->set_level(level);
    }

} // namespace mpkit
