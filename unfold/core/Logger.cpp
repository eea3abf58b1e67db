#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Unfold {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_viewLogger;
std::shared_ptr<spdlog::logger> Logger::s_previousDefault;
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

    s_engineLogger = std::make_shared<spdlog::logger>("UNFOLD", sinks.begin(), sinks.end());
    s_engineLogger->set_level(spdlog::level::trace);
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    s_viewLogger = std::make_shared<spdlog::logger>("VIEW", sinks.begin(), sinks.end());
    s_viewLogger->set_level(spdlog::level::trace);
    s_viewLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_viewLogger);

    s_previousDefault = spdlog::default_logger();
    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_viewLogger->flush();

    spdlog::drop("UNFOLD");
    spdlog::drop("VIEW");
    // Hand the default slot back so the macros stay usable after shutdown
    spdlog::set_default_logger(s_previousDefault);

    s_engineLogger.reset();
    s_viewLogger.reset();
    s_previousDefault.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_engineLogger) {
        s_engineLogger->set_level(level);
    }
    if (s_viewLogger) {
        s_viewLogger->set_level(level);
    }
    if (!s_initialized) {
        spdlog::set_level(level);
    }
}

spdlog::level::level_enum Logger::LevelFromString(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace Unfold
