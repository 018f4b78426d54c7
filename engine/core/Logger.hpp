#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace Strata {

/**
 * @brief Logging setup for the terrain library, tools and tests
 *
 * Wraps spdlog. The configured logger becomes the spdlog default, so library code
 * can call spdlog::info() and friends directly.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for a rotating log file
     * @param consoleOutput Enable colored console output
     */
    static void Initialize(const std::string& logFile = "",
                           bool consoleOutput = true);

    /**
     * @brief Flush and drop all registered loggers
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the terrain logger, initializing a console logger on first use
     */
    static std::shared_ptr<spdlog::logger>& Get();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace Strata

#define STRATA_LOG_TRACE(...)    ::Strata::Logger::Get()->trace(__VA_ARGS__)
#define STRATA_LOG_DEBUG(...)    ::Strata::Logger::Get()->debug(__VA_ARGS__)
#define STRATA_LOG_INFO(...)     ::Strata::Logger::Get()->info(__VA_ARGS__)
#define STRATA_LOG_WARN(...)     ::Strata::Logger::Get()->warn(__VA_ARGS__)
#define STRATA_LOG_ERROR(...)    ::Strata::Logger::Get()->error(__VA_ARGS__)
#define STRATA_LOG_CRITICAL(...) ::Strata::Logger::Get()->critical(__VA_ARGS__)
