#pragma once

#include "animation/Timeline.hpp"
#include "assembly/Backdrop.hpp"
#include "assembly/LayoutGenerator.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Error types for viewer configuration loading
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidFormat,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

struct LoggingSettings {
    std::string level = "info";
    std::string file;               // empty = console only
};

/**
 * @brief Everything needed to set up an exploded view
 *
 * Missing keys keep their defaults. The loader checks JSON types and easing names;
 * ranges are validated by LayoutGenerator and TimelineController so every
 * entry point shares one validation path.
 */
struct ViewerConfig {
    StructuralParameters assembly;
    BackdropParameters backdrop;
    TimelineSettings timeline;
    LoggingSettings logging;

    [[nodiscard]] static std::expected<ViewerConfig, ConfigError> FromJson(const nlohmann::json& j);
    [[nodiscard]] static std::expected<ViewerConfig, ConfigError> Load(const std::filesystem::path& filepath);

    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] std::expected<void, ConfigError> Save(const std::filesystem::path& filepath) const;

    /**
     * @brief Write the default configuration
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);
};

} // namespace Unfold
