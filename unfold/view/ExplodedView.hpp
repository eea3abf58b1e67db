#pragma once

#include "animation/Timeline.hpp"
#include "assembly/Assembly.hpp"
#include "assembly/Backdrop.hpp"
#include "config/ViewerConfig.hpp"
#include "core/FrameClock.hpp"

#include <expected>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Where one part is drawn this frame
 */
struct PartPose {
    const PartDescriptor* part = nullptr;
    glm::vec3 position{0.0f};
    glm::mat4 model{1.0f};
};

/**
 * @brief State the control widgets mirror
 */
struct ControlsState {
    float progressPercent = 0.0f;   // 0-100
    bool isPlaying = false;
    float speed = 1.0f;
    std::string speedLabel;         // e.g. "0.8x"
};

/**
 * @brief In-process boundary between the engine and a presentation host
 *
 * Owns the immutable assembly, its static backdrop, the timeline and the
 * frame clock. The host
 * forwards frame notifications and widget actions, then reads controls
 * state and per-part poses to draw. All poses of one EvaluatePoses() call
 * come from the same progress snapshot.
 */
class ExplodedView {
public:
    /**
     * @brief Generate the assembly and backdrop, then create the timeline
     * @return Error message if the configuration is rejected
     */
    [[nodiscard]] static std::expected<ExplodedView, std::string> Create(const ViewerConfig& config);

    // Poses point into the owned assembly
    ExplodedView(const ExplodedView&) = delete;
    ExplodedView& operator=(const ExplodedView&) = delete;
    ExplodedView(ExplodedView&&) noexcept = default;
    ExplodedView& operator=(ExplodedView&&) noexcept = default;

    // Frame notifications
    void OnFrame(FrameClock::TimePoint now);
    void OnFrameElapsed(float elapsedSeconds);

    /**
     * @brief True while the timeline wants frame notifications
     */
    [[nodiscard]] bool WantsFrames() const { return m_timeline.IsPlaying(); }

    // Widget actions
    void PlayPause(FrameClock::TimePoint now = FrameClock::Clock::now());
    void Reset();
    void SeekPercent(float percent);
    std::expected<void, TimelineError> SetSpeed(float speed);

    [[nodiscard]] ControlsState GetControls() const;
    [[nodiscard]] const std::vector<PartPose>& EvaluatePoses();

    [[nodiscard]] const Assembly& GetAssembly() const { return m_assembly; }
    [[nodiscard]] const std::vector<StaticPart>& GetBackdrop() const { return m_backdrop; }
    [[nodiscard]] const TimelineController& GetTimeline() const { return m_timeline; }

    /**
     * @brief Static scene description: animated parts and backdrop
     */
    [[nodiscard]] nlohmann::json SceneToJson() const;

    /**
     * @brief Current progress and every part's position
     */
    [[nodiscard]] nlohmann::json FrameToJson();

    [[nodiscard]] static std::string FormatSpeed(float speed);

private:
    ExplodedView(Assembly assembly, std::vector<StaticPart> backdrop, TimelineController timeline);

    Assembly m_assembly;
    std::vector<StaticPart> m_backdrop;
    TimelineController m_timeline;
    FrameClock m_clock;
    std::vector<PartPose> m_poses;
};

} // namespace Unfold
