#pragma once

#include <chrono>
#include <cstdint>

namespace Unfold {

/**
 * @brief Converts host frame notifications into elapsed seconds
 *
 * The host's per-frame scheduler reports "time has advanced to T"; the
 * timeline wants "seconds since the previous frame". The first frame after
 * Start() measures from the Start() timestamp, so a stale timestamp from an
 * earlier play session never produces a jump.
 */
class FrameClock {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<float>;
    using TimePoint = Clock::time_point;

    static constexpr float kDefaultMaxDeltaSeconds = 0.25f;

    FrameClock() noexcept = default;
    explicit FrameClock(float maxDeltaSeconds) noexcept;

    /**
     * @brief Begin measuring frames from the given timestamp
     */
    void Start(TimePoint now = Clock::now()) noexcept;

    /**
     * @brief Stop measuring; Advance() returns 0 until the next Start()
     */
    void Stop() noexcept;

    [[nodiscard]] bool IsRunning() const noexcept { return m_running; }

    /**
     * @brief Seconds elapsed since the previous frame (or since Start)
     *
     * Returns 0 while stopped or if the clock went backwards, and never more
     * than the maximum delta.
     */
    [[nodiscard]] float Advance(TimePoint now = Clock::now()) noexcept;

    /**
     * @brief Set maximum delta time (prevents large jumps after a stall)
     * @param maxDelta Maximum delta in seconds (non-positive values are ignored)
     */
    void SetMaxDeltaTime(float maxDelta) noexcept {
        if (maxDelta > 0.0f) {
            m_maxDeltaTime = maxDelta;
        }
    }

    [[nodiscard]] float GetMaxDeltaTime() const noexcept { return m_maxDeltaTime; }

    /**
     * @brief Frames measured since the last Start()
     */
    [[nodiscard]] std::uint64_t GetFrameCount() const noexcept { return m_frameCount; }

private:
    TimePoint m_lastFrameTime{};
    float m_maxDeltaTime = kDefaultMaxDeltaSeconds;
    std::uint64_t m_frameCount = 0;
    bool m_running = false;
};

} // namespace Unfold
