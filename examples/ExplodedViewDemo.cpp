/**
 * @file ExplodedViewDemo.cpp
 * @brief Headless host for the window-unit exploded view
 *
 * Plays the assembly timeline with a simulated 60 Hz frame source and logs
 * the controls state at every quarter of the animation. Optionally writes
 * the scene description and the sampled frames to a JSON file that an
 * external renderer can replay.
 *
 * Usage: unfold_demo [config.json] [frames_out.json]
 */

#include "config/ViewerConfig.hpp"
#include "core/Logger.hpp"
#include "view/ExplodedView.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <string>
#include <utility>

using namespace Unfold;

namespace {

constexpr const char* kDefaultConfigPath = "config/exploded_view.json";
constexpr float kFrameRate = 60.0f;

std::optional<ViewerConfig> LoadOrCreateConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        VIEW_LOG_WARN("Config file not found: {}. Creating default.", path.string());
        if (auto created = ViewerConfig::CreateDefault(path); !created) {
            VIEW_LOG_WARN("Could not write default config ({}); using built-in defaults",
                          ConfigErrorToString(created.error()));
            return ViewerConfig{};
        }
    }

    auto config = ViewerConfig::Load(path);
    if (!config) {
        VIEW_LOG_ERROR("Invalid config {}: {}", path.string(), ConfigErrorToString(config.error()));
        return std::nullopt;
    }
    return *config;
}

} // namespace

class ExplodedViewDemo {
public:
    bool Initialize(const ViewerConfig& config) {
        auto view = ExplodedView::Create(config);
        if (!view) {
            VIEW_LOG_CRITICAL("{}", view.error());
            return false;
        }
        m_view.emplace(std::move(*view));

        m_output["scene"] = m_view->SceneToJson();
        m_output["frames"] = nlohmann::json::array();

        VIEW_LOG_INFO("Scene: {} animated parts, {} backdrop parts",
                      m_view->GetAssembly().GetPartCount(), m_view->GetBackdrop().size());
        return true;
    }

    void Run() {
        using namespace std::chrono;
        const auto frameStep = duration_cast<FrameClock::Clock::duration>(duration<float>(1.0f / kFrameRate));
        auto now = FrameClock::Clock::time_point{};

        m_view->PlayPause(now);
        Record();

        float nextMilestone = 25.0f;
        int frames = 0;
        while (m_view->WantsFrames()) {
            now += frameStep;
            m_view->OnFrame(now);
            ++frames;

            const ControlsState controls = m_view->GetControls();
            if (controls.progressPercent >= nextMilestone) {
                VIEW_LOG_INFO("{:5.1f}%  speed {}  {}", controls.progressPercent, controls.speedLabel,
                              controls.isPlaying ? "playing" : "stopped");
                Record();
                nextMilestone += 25.0f;
            }
        }
        VIEW_LOG_INFO("Assembled after {} frames ({:.2f}s simulated)", frames,
                      static_cast<float>(frames) / kFrameRate);

        // Playing again from the end rewinds to the exploded state
        m_view->PlayPause(now);
        VIEW_LOG_INFO("Replay requested: progress {:.1f}%, {}", m_view->GetControls().progressPercent,
                      m_view->GetControls().isPlaying ? "playing" : "stopped");
        m_view->Reset();
    }

    bool WriteOutput(const std::filesystem::path& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            VIEW_LOG_ERROR("Failed to open output file: {}", path.string());
            return false;
        }
        file << std::setw(2) << m_output << std::endl;
        VIEW_LOG_INFO("Wrote {} frames to {}", m_output.at("frames").size(), path.string());
        return true;
    }

private:
    void Record() {
        m_output["frames"].push_back(m_view->FrameToJson());
    }

    std::optional<ExplodedView> m_view;
    nlohmann::json m_output;
};

int main(int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : kDefaultConfigPath;

    auto config = LoadOrCreateConfig(configPath);
    if (!config) {
        return 1;
    }

    Logger::Initialize(config->logging.file);
    Logger::SetLevel(Logger::LevelFromString(config->logging.level));
    VIEW_LOG_INFO("Unfold exploded view demo");

    ExplodedViewDemo demo;
    if (!demo.Initialize(*config)) {
        Logger::Shutdown();
        return 1;
    }

    demo.Run();

    int exitCode = 0;
    if (argc > 2 && !demo.WriteOutput(argv[2])) {
        exitCode = 1;
    }

    Logger::Shutdown();
    return exitCode;
}
