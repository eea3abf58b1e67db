#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Timeline playback state
 *
 * Completed is Paused with progress at 1; playing again rewinds first.
 */
enum class PlaybackState : uint8_t {
    Paused,
    Playing,
    Completed
};

[[nodiscard]] const char* PlaybackStateToString(PlaybackState state) noexcept;

/**
 * @brief The single mutable entity of a view
 */
struct AnimationState {
    float progress = 0.0f;      // 0 = exploded, 1 = assembled
    bool isPlaying = false;
    float speed = 1.0f;
};

struct TimelineSettings {
    float totalDurationSeconds = 3.0f;  // full 0 -> 1 traversal at speed 1
    float defaultSpeed = 0.8f;

    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Overwrite fields present in the JSON object
     * @return false if a present field has the wrong type
     */
    bool ApplyJson(const nlohmann::json& j);
};

enum class TimelineError {
    InvalidDuration,
    InvalidSpeed
};

[[nodiscard]] const char* TimelineErrorToString(TimelineError error) noexcept;

/**
 * @brief Drives global progress from elapsed wall-clock time
 *
 * Single writer: calls must be serialized by the owner. Progress stays in
 * [0,1] after every operation and never decreases between two ticks that
 * are not separated by Seek() or Reset().
 */
class TimelineController {
public:
    using CompletedCallback = std::function<void()>;

    /// Slowest accepted speed multiplier
    static constexpr float kMinSpeed = 0.01f;
    /// Longest accepted full traversal at speed 1, in seconds
    static constexpr float kMaxTotalDurationSeconds = 3600.0f;

    /**
     * @brief Create a paused timeline at progress 0
     * @return InvalidDuration if the duration is not in (0, kMaxTotalDurationSeconds],
     *         InvalidSpeed if the default speed is below kMinSpeed
     */
    [[nodiscard]] static std::expected<TimelineController, TimelineError> Create(
        const TimelineSettings& settings = {});

    /**
     * @brief Advance progress by elapsedSeconds * speed / totalDuration
     *
     * No-op unless playing. Negative or non-finite elapsed time counts as 0.
     * Reaching progress 1 pauses the timeline and fires the completed callback.
     * @return true while further ticks are wanted
     */
    bool Tick(float elapsedSeconds);

    /**
     * @brief Jump to a normalized progress value (clamped to [0,1]) and pause
     */
    void Seek(float progress);

    /**
     * @brief Jump to a 0-100 percentage (clamped) and pause
     */
    void SeekPercent(float percent);

    /**
     * @brief Pause at progress 0
     */
    void Reset();

    /**
     * @brief Toggle play/pause; playing from progress 1 rewinds to 0 first
     */
    void PlayPause();

    /**
     * @brief Change the speed multiplier for future ticks
     *
     * Values below kMinSpeed or non-finite are rejected and leave the speed as is.
     */
    std::expected<void, TimelineError> SetSpeed(float speed);

    [[nodiscard]] const AnimationState& GetState() const { return m_state; }
    [[nodiscard]] float GetProgress() const { return m_state.progress; }
    [[nodiscard]] float GetProgressPercent() const { return m_state.progress * 100.0f; }
    [[nodiscard]] bool IsPlaying() const { return m_state.isPlaying; }
    [[nodiscard]] float GetSpeed() const { return m_state.speed; }
    [[nodiscard]] PlaybackState GetPlaybackState() const;
    [[nodiscard]] float GetTotalDuration() const { return m_totalDuration; }

    void SetOnCompleted(CompletedCallback callback) { m_onCompleted = std::move(callback); }

private:
    TimelineController(float totalDuration, float speed);

    void SetPosition(double position);

    AnimationState m_state;
    double m_position = 0.0;        // unrounded progress; small increments still accumulate
    float m_totalDuration = 3.0f;
    CompletedCallback m_onCompleted;
};

} // namespace Unfold
