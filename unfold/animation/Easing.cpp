#include "animation/Easing.hpp"
#include <algorithm>

namespace Unfold {

const char* EasingKindToString(EasingKind kind) noexcept {
    switch (kind) {
        case EasingKind::Linear: return "linear";
        case EasingKind::SmoothStep: return "smooth_step";
        case EasingKind::QuadInOut: return "quad_in_out";
        case EasingKind::CubicInOut: return "cubic_in_out";
    }
    return "unknown";
}

std::optional<EasingKind> EasingKindFromString(std::string_view name) noexcept {
    if (name == "linear") return EasingKind::Linear;
    if (name == "smooth_step") return EasingKind::SmoothStep;
    if (name == "quad_in_out") return EasingKind::QuadInOut;
    if (name == "cubic_in_out") return EasingKind::CubicInOut;
    return std::nullopt;
}

namespace Easing {

float Linear(float t) {
    return t;
}

float SmoothStep(float t) {
    return t * t * (3.0f - 2.0f * t);
}

float QuadInOut(float t) {
    if (t < 0.5f) {
        return 2.0f * t * t;
    }
    const float u = -2.0f * t + 2.0f;
    return 1.0f - u * u / 2.0f;
}

float CubicInOut(float t) {
    if (t < 0.5f) {
        return 4.0f * t * t * t;
    }
    const float u = -2.0f * t + 2.0f;
    return 1.0f - u * u * u / 2.0f;
}

float Apply(EasingKind kind, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    switch (kind) {
        case EasingKind::Linear: return Linear(t);
        case EasingKind::SmoothStep: return SmoothStep(t);
        case EasingKind::QuadInOut: return QuadInOut(t);
        case EasingKind::CubicInOut: return CubicInOut(t);
    }
    return CubicInOut(t);
}

} // namespace Easing

} // namespace Unfold
