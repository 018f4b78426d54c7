#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Strata {

std::shared_ptr<spdlog::logger> Logger::s_logger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // A logger without sinks is valid and simply discards messages
    s_logger = std::make_shared<spdlog::logger>("STRATA", sinks.begin(), sinks.end());
    s_logger->set_level(spdlog::level::info);
    s_logger->flush_on(spdlog::level::warn);

    spdlog::drop("STRATA");
    spdlog::register_logger(s_logger);
    spdlog::set_default_logger(s_logger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_logger->flush();
    spdlog::drop_all();
    s_logger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!s_initialized) {
        Initialize();
    }
    return s_logger;
}

} // namespace Strata
