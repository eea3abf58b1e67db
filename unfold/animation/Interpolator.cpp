#include "animation/Interpolator.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>

namespace Unfold {

namespace Interpolator {

float LocalProgress(const AnimationWindow& window, float globalProgress) {
    if (std::isnan(globalProgress)) {
        globalProgress = 0.0f;
    }
    // Pinned outside the window; (g - start) / span can round short of 1 at the end
    if (globalProgress <= window.startOffset) {
        return 0.0f;
    }
    if (globalProgress >= window.End()) {
        return 1.0f;
    }
    const float raw = (globalProgress - window.startOffset) / window.span;
    return std::clamp(raw, 0.0f, 1.0f);
}

float EasedProgress(const AnimationWindow& window, float globalProgress) {
    return Easing::Apply(window.easing, LocalProgress(window, globalProgress));
}

glm::vec3 Lerp(const glm::vec3& a, const glm::vec3& b, float t) {
    return a + (b - a) * t;
}

glm::vec3 Interpolate(const PartDescriptor& part, float globalProgress) {
    const float t = EasedProgress(part.window, globalProgress);

    // Exact endpoints, independent of rounding in the lerp
    if (t <= 0.0f) {
        return part.explodedPosition;
    }
    if (t >= 1.0f) {
        return part.assembledPosition;
    }
    // Each axis stays between its exploded and assembled value
    const glm::vec3 lo = glm::min(part.explodedPosition, part.assembledPosition);
    const glm::vec3 hi = glm::max(part.explodedPosition, part.assembledPosition);
    return glm::clamp(Lerp(part.explodedPosition, part.assembledPosition, t), lo, hi);
}

std::vector<glm::vec3> InterpolateAll(std::span<const PartDescriptor> parts, float globalProgress) {
    std::vector<glm::vec3> positions;
    positions.reserve(parts.size());
    for (const auto& part : parts) {
        positions.push_back(Interpolate(part, globalProgress));
    }
    return positions;
}

glm::mat4 ComputeModelMatrix(const PartDescriptor& part, float globalProgress, bool includeScale) {
    return ComputeModelMatrix(part, Interpolate(part, globalProgress), includeScale);
}

glm::mat4 ComputeModelMatrix(const PartDescriptor& part, const glm::vec3& position, bool includeScale) {
    glm::mat4 model = glm::translate(glm::mat4(1.0f), position);
    if (part.rotation) {
        model *= glm::mat4_cast(glm::quat(*part.rotation));
    }
    if (includeScale) {
        model = glm::scale(model, part.dimensions);
    }
    return model;
}

} // namespace Interpolator

} // namespace Unfold
