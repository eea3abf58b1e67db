#include "core/FrameClock.hpp"
#include <algorithm>

namespace Unfold {

FrameClock::FrameClock(float maxDeltaSeconds) noexcept {
    SetMaxDeltaTime(maxDeltaSeconds);
}

void FrameClock::Start(TimePoint now) noexcept {
    m_lastFrameTime = now;
    m_frameCount = 0;
    m_running = true;
}

void FrameClock::Stop() noexcept {
    m_running = false;
}

float FrameClock::Advance(TimePoint now) noexcept {
    if (!m_running) {
        return 0.0f;
    }

    const Duration elapsed = now - m_lastFrameTime;
    m_lastFrameTime = std::max(now, m_lastFrameTime);
    ++m_frameCount;

    // Clamp to prevent huge jumps (e.g. window dragged, debugger break)
    return std::clamp(elapsed.count(), 0.0f, m_maxDeltaTime);
}

} // namespace Unfold
