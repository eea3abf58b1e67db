#include "config/ViewerConfig.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <iomanip>
#include <utility>

namespace Unfold {

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound:  return "File not found";
        case ConfigError::ParseError:    return "JSON parse error";
        case ConfigError::InvalidFormat: return "Invalid format";
        case ConfigError::WriteError:    return "Write error";
    }
    return "Unknown error";
}

std::expected<ViewerConfig, ConfigError> ViewerConfig::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        UNFOLD_LOG_ERROR("Viewer config must be a JSON object");
        return std::unexpected(ConfigError::InvalidFormat);
    }

    ViewerConfig config;

    if (j.contains("assembly") && !config.assembly.ApplyJson(j["assembly"])) {
        UNFOLD_LOG_ERROR("Viewer config: 'assembly' has a malformed field");
        return std::unexpected(ConfigError::InvalidFormat);
    }

    if (j.contains("backdrop") && !config.backdrop.ApplyJson(j["backdrop"])) {
        UNFOLD_LOG_ERROR("Viewer config: 'backdrop' must be an object of numbers");
        return std::unexpected(ConfigError::InvalidFormat);
    }

    if (j.contains("timeline") && !config.timeline.ApplyJson(j["timeline"])) {
        UNFOLD_LOG_ERROR("Viewer config: 'timeline' must be an object of numbers");
        return std::unexpected(ConfigError::InvalidFormat);
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (!logging.is_object()) {
            UNFOLD_LOG_ERROR("Viewer config: 'logging' must be an object");
            return std::unexpected(ConfigError::InvalidFormat);
        }
        for (auto [key, target] : {std::pair{"level", &config.logging.level},
                                   std::pair{"file", &config.logging.file}}) {
            if (!logging.contains(key)) {
                continue;
            }
            if (!logging[key].is_string()) {
                UNFOLD_LOG_ERROR("Viewer config: 'logging.{}' must be a string", key);
                return std::unexpected(ConfigError::InvalidFormat);
            }
            *target = logging[key].get<std::string>();
        }
    }

    return config;
}

std::expected<ViewerConfig, ConfigError> ViewerConfig::Load(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        UNFOLD_LOG_ERROR("Config file not found: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        UNFOLD_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        UNFOLD_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    auto config = FromJson(data);
    if (config) {
        UNFOLD_LOG_INFO("Loaded configuration from: {}", filepath.string());
    }
    return config;
}

nlohmann::json ViewerConfig::ToJson() const {
    nlohmann::json j;
    j["assembly"] = assembly.ToJson();
    j["backdrop"] = backdrop.ToJson();
    j["timeline"] = timeline.ToJson();
    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;
    return j;
}

std::expected<void, ConfigError> ViewerConfig::Save(const std::filesystem::path& filepath) const {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            UNFOLD_LOG_ERROR("Failed to open config file for writing: {}", filepath.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << ToJson() << std::endl;
        UNFOLD_LOG_INFO("Saved configuration to: {}", filepath.string());
        return {};
    } catch (const std::exception& e) {
        UNFOLD_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> ViewerConfig::CreateDefault(const std::filesystem::path& filepath) {
    return ViewerConfig{}.Save(filepath);
}

} // namespace Unfold
