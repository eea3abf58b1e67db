#include "view/ExplodedView.hpp"
#include "animation/Interpolator.hpp"
#include "assembly/LayoutGenerator.hpp"
#include "core/Logger.hpp"

#include <cstdio>

namespace Unfold {

std::expected<ExplodedView, std::string> ExplodedView::Create(const ViewerConfig& config) {
    auto assembly = LayoutGenerator(config.assembly).Generate();
    if (!assembly) {
        return std::unexpected("Assembly layout failed: " + assembly.error().ToString());
    }

    auto backdrop = GenerateBackdrop(config.backdrop);
    if (!backdrop) {
        return std::unexpected("Backdrop failed: " + backdrop.error().ToString());
    }

    auto timeline = TimelineController::Create(config.timeline);
    if (!timeline) {
        return std::unexpected(std::string("Timeline setup failed: ") + TimelineErrorToString(timeline.error()));
    }

    VIEW_LOG_INFO("Exploded view ready: {} parts, {} backdrop parts, {:.1f}s at speed {}",
                  assembly->GetPartCount(), backdrop->size(), config.timeline.totalDurationSeconds,
                  FormatSpeed(config.timeline.defaultSpeed));
    return ExplodedView(std::move(*assembly), std::move(*backdrop), std::move(*timeline));
}

ExplodedView::ExplodedView(Assembly assembly, std::vector<StaticPart> backdrop, TimelineController timeline)
    : m_assembly(std::move(assembly))
    , m_backdrop(std::move(backdrop))
    , m_timeline(std::move(timeline))
{
    m_poses.resize(m_assembly.GetPartCount());
    for (std::size_t i = 0; i < m_poses.size(); ++i) {
        m_poses[i].part = &m_assembly.GetParts()[i];
    }
}

void ExplodedView::OnFrame(FrameClock::TimePoint now) {
    OnFrameElapsed(m_clock.Advance(now));
}

void ExplodedView::OnFrameElapsed(float elapsedSeconds) {
    if (!m_timeline.IsPlaying()) {
        return;
    }
    if (!m_timeline.Tick(elapsedSeconds)) {
        m_clock.Stop();
        VIEW_LOG_DEBUG("Playback finished after {} frames", m_clock.GetFrameCount());
    }
}

void ExplodedView::PlayPause(FrameClock::TimePoint now) {
    m_timeline.PlayPause();
    if (m_timeline.IsPlaying()) {
        m_clock.Start(now);
    } else {
        m_clock.Stop();
    }
}

void ExplodedView::Reset() {
    m_timeline.Reset();
    m_clock.Stop();
}

void ExplodedView::SeekPercent(float percent) {
    m_timeline.SeekPercent(percent);
    m_clock.Stop();
}

std::expected<void, TimelineError> ExplodedView::SetSpeed(float speed) {
    return m_timeline.SetSpeed(speed);
}

ControlsState ExplodedView::GetControls() const {
    ControlsState controls;
    controls.progressPercent = m_timeline.GetProgressPercent();
    controls.isPlaying = m_timeline.IsPlaying();
    controls.speed = m_timeline.GetSpeed();
    controls.speedLabel = FormatSpeed(controls.speed);
    return controls;
}

const std::vector<PartPose>& ExplodedView::EvaluatePoses() {
    const auto positions = Interpolator::InterpolateAll(m_assembly.GetParts(), m_timeline.GetProgress());
    for (std::size_t i = 0; i < m_poses.size(); ++i) {
        m_poses[i].position = positions[i];
        m_poses[i].model = Interpolator::ComputeModelMatrix(*m_poses[i].part, positions[i]);
    }
    return m_poses;
}

nlohmann::json ExplodedView::SceneToJson() const {
    nlohmann::json backdrop = nlohmann::json::array();
    for (const auto& part : m_backdrop) {
        backdrop.push_back(part.ToJson());
    }
    nlohmann::json scene = m_assembly.ToJson();
    scene["backdrop"] = std::move(backdrop);
    return scene;
}

nlohmann::json ExplodedView::FrameToJson() {
    const float progress = m_timeline.GetProgress();
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& pose : EvaluatePoses()) {
        parts.push_back({
            {"id", pose.part->id},
            {"position", {pose.position.x, pose.position.y, pose.position.z}}
        });
    }
    return {
        {"progress", progress},
        {"state", PlaybackStateToString(m_timeline.GetPlaybackState())},
        {"parts", parts}
    };
}

std::string ExplodedView::FormatSpeed(float speed) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1fx", static_cast<double>(speed));
    return buffer;
}

} // namespace Unfold
