#include "animation/Timeline.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace Unfold {

namespace {

bool IsValidSpeed(float speed) {
    return std::isfinite(speed) && speed >= TimelineController::kMinSpeed;
}

bool IsValidDuration(float seconds) {
    return std::isfinite(seconds) && seconds > 0.0f &&
           seconds <= TimelineController::kMaxTotalDurationSeconds;
}

} // namespace

const char* PlaybackStateToString(PlaybackState state) noexcept {
    switch (state) {
        case PlaybackState::Paused: return "Paused";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Completed: return "Completed";
    }
    return "Unknown";
}

const char* TimelineErrorToString(TimelineError error) noexcept {
    switch (error) {
        case TimelineError::InvalidDuration: return "Total duration must be positive and at most one hour";
        case TimelineError::InvalidSpeed: return "Speed must be at least 0.01";
    }
    return "Unknown error";
}

// ============================================================================
// TimelineSettings
// ============================================================================

nlohmann::json TimelineSettings::ToJson() const {
    return {
        {"total_duration_seconds", totalDurationSeconds},
        {"default_speed", defaultSpeed}
    };
}

bool TimelineSettings::ApplyJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return false;
    }
    if (j.contains("total_duration_seconds")) {
        if (!j["total_duration_seconds"].is_number()) {
            return false;
        }
        totalDurationSeconds = j["total_duration_seconds"].get<float>();
    }
    if (j.contains("default_speed")) {
        if (!j["default_speed"].is_number()) {
            return false;
        }
        defaultSpeed = j["default_speed"].get<float>();
    }
    return true;
}

// ============================================================================
// TimelineController
// ============================================================================

std::expected<TimelineController, TimelineError> TimelineController::Create(
    const TimelineSettings& settings)
{
    if (!IsValidDuration(settings.totalDurationSeconds)) {
        UNFOLD_LOG_ERROR("Timeline rejected: total duration {} is outside (0, {}]",
                         settings.totalDurationSeconds, kMaxTotalDurationSeconds);
        return std::unexpected(TimelineError::InvalidDuration);
    }
    if (!IsValidSpeed(settings.defaultSpeed)) {
        UNFOLD_LOG_ERROR("Timeline rejected: default speed {} is below {}", settings.defaultSpeed, kMinSpeed);
        return std::unexpected(TimelineError::InvalidSpeed);
    }
    return TimelineController(settings.totalDurationSeconds, settings.defaultSpeed);
}

TimelineController::TimelineController(float totalDuration, float speed)
    : m_totalDuration(totalDuration)
{
    m_state.speed = speed;
}

bool TimelineController::Tick(float elapsedSeconds) {
    if (!m_state.isPlaying) {
        return false;
    }

    // First frames and clock hiccups may report nonsense; never run backwards
    if (!std::isfinite(elapsedSeconds) || elapsedSeconds < 0.0f) {
        elapsedSeconds = 0.0f;
    }

    const double increment = static_cast<double>(elapsedSeconds) * m_state.speed / m_totalDuration;
    SetPosition(m_position + increment);
    UNFOLD_LOG_TRACE("Tick {:.4f}s -> progress {:.4f}", elapsedSeconds, m_state.progress);

    if (m_state.progress >= 1.0f) {
        SetPosition(1.0);
        m_state.isPlaying = false;
        UNFOLD_LOG_DEBUG("Timeline completed");
        if (m_onCompleted) {
            m_onCompleted();
        }
        return false;
    }
    return true;
}

void TimelineController::Seek(float progress) {
    if (std::isnan(progress)) {
        progress = 0.0f;
    }
    m_state.isPlaying = false;
    SetPosition(std::clamp(progress, 0.0f, 1.0f));
    UNFOLD_LOG_TRACE("Seek -> progress {:.4f}", m_state.progress);
}

void TimelineController::SeekPercent(float percent) {
    if (std::isnan(percent)) {
        percent = 0.0f;
    }
    Seek(std::clamp(percent, 0.0f, 100.0f) / 100.0f);
}

void TimelineController::Reset() {
    m_state.isPlaying = false;
    SetPosition(0.0);
    UNFOLD_LOG_DEBUG("Timeline reset");
}

void TimelineController::PlayPause() {
    if (m_state.isPlaying) {
        m_state.isPlaying = false;
        UNFOLD_LOG_DEBUG("Timeline paused at {:.3f}", m_state.progress);
        return;
    }

    if (m_state.progress >= 1.0f) {
        SetPosition(0.0);
    }
    m_state.isPlaying = true;
    UNFOLD_LOG_DEBUG("Timeline playing from {:.3f}", m_state.progress);
}

std::expected<void, TimelineError> TimelineController::SetSpeed(float speed) {
    if (!IsValidSpeed(speed)) {
        UNFOLD_LOG_WARN("Rejected timeline speed {}; keeping {}", speed, m_state.speed);
        return std::unexpected(TimelineError::InvalidSpeed);
    }
    m_state.speed = speed;
    return {};
}

void TimelineController::SetPosition(double position) {
    m_position = std::clamp(position, 0.0, 1.0);
    m_state.progress = static_cast<float>(m_position);
}

PlaybackState TimelineController::GetPlaybackState() const {
    if (m_state.isPlaying) {
        return PlaybackState::Playing;
    }
    return m_state.progress >= 1.0f ? PlaybackState::Completed : PlaybackState::Paused;
}

} // namespace Unfold
