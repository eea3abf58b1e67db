#pragma once

#include <optional>
#include <string_view>

namespace Unfold {

/**
 * @brief Easing curves a part may use inside its animation window
 *
 * Every curve maps [0,1] onto [0,1] monotonically with f(0) = 0 and
 * f(1) = 1; parts never overshoot their exploded or assembled position.
 */
enum class EasingKind : unsigned char {
    Linear,
    SmoothStep,
    QuadInOut,
    CubicInOut
};

[[nodiscard]] const char* EasingKindToString(EasingKind kind) noexcept;
[[nodiscard]] std::optional<EasingKind> EasingKindFromString(std::string_view name) noexcept;

namespace Easing {
    float Linear(float t);
    float SmoothStep(float t);
    float QuadInOut(float t);

    /**
     * @brief Cubic ease-in-out: 4t^3 below 0.5, 1 - (-2t + 2)^3 / 2 above
     *
     * Zero slope at both ends and symmetric: f(x) + f(1 - x) == 1.
     */
    float CubicInOut(float t);

    /**
     * @brief Evaluate a curve; t is clamped to [0,1] first
     */
    float Apply(EasingKind kind, float t);
}

} // namespace Unfold
