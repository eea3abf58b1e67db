#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>
#include <string_view>

namespace Unfold {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two named loggers share the same sinks: "UNFOLD" for the layout and
 * timeline engine, "VIEW" for the presentation host.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace" ... "critical", "off")
     * @return spdlog::level::info for unknown names
     */
    static spdlog::level::level_enum LevelFromString(std::string_view name);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the engine logger (default logger before Initialize)
     */
    static std::shared_ptr<spdlog::logger> GetEngineLogger() {
        return s_engineLogger ? s_engineLogger : spdlog::default_logger();
    }

    /**
     * @brief Get the viewer logger (default logger before Initialize)
     */
    static std::shared_ptr<spdlog::logger> GetViewLogger() {
        return s_viewLogger ? s_viewLogger : spdlog::default_logger();
    }

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_viewLogger;
    static std::shared_ptr<spdlog::logger> s_previousDefault;
    static bool s_initialized;
};

} // namespace Unfold

// Engine logging
#define UNFOLD_LOG_TRACE(...)    ::Unfold::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define UNFOLD_LOG_DEBUG(...)    ::Unfold::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define UNFOLD_LOG_INFO(...)     ::Unfold::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define UNFOLD_LOG_WARN(...)     ::Unfold::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define UNFOLD_LOG_ERROR(...)    ::Unfold::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define UNFOLD_LOG_CRITICAL(...) ::Unfold::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Viewer logging
#define VIEW_LOG_TRACE(...)    ::Unfold::Logger::GetViewLogger()->trace(__VA_ARGS__)
#define VIEW_LOG_DEBUG(...)    ::Unfold::Logger::GetViewLogger()->debug(__VA_ARGS__)
#define VIEW_LOG_INFO(...)     ::Unfold::Logger::GetViewLogger()->info(__VA_ARGS__)
#define VIEW_LOG_WARN(...)     ::Unfold::Logger::GetViewLogger()->warn(__VA_ARGS__)
#define VIEW_LOG_ERROR(...)    ::Unfold::Logger::GetViewLogger()->error(__VA_ARGS__)
#define VIEW_LOG_CRITICAL(...) ::Unfold::Logger::GetViewLogger()->critical(__VA_ARGS__)
