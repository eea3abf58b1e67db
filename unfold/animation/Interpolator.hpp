#pragma once

#include "assembly/PartDescriptor.hpp"

#include <span>
#include <vector>
#include <glm/glm.hpp>

namespace Unfold {

/**
 * @brief Per-part interpolation from global progress to a position
 *
 * All functions are pure. Global progress 0 is fully exploded, 1 fully
 * assembled; each part only moves inside its own animation window.
 */
namespace Interpolator {
    /**
     * @brief Part-local progress: (global - startOffset) / span, clamped to [0,1]
     *
     * NaN global progress is treated as 0.
     */
    float LocalProgress(const AnimationWindow& window, float globalProgress);

    /**
     * @brief Local progress after the window's easing curve
     */
    float EasedProgress(const AnimationWindow& window, float globalProgress);

    glm::vec3 Lerp(const glm::vec3& a, const glm::vec3& b, float t);

    /**
     * @brief Part center at the given global progress
     */
    glm::vec3 Interpolate(const PartDescriptor& part, float globalProgress);

    /**
     * @brief Positions of all parts for one progress snapshot, in part order
     */
    std::vector<glm::vec3> InterpolateAll(std::span<const PartDescriptor> parts, float globalProgress);

    /**
     * @brief Model matrix: translate(position) * rotate(fixed Euler rotation)
     * @param includeScale Also scale a unit cube to the part's dimensions
     */
    glm::mat4 ComputeModelMatrix(const PartDescriptor& part, float globalProgress,
                                 bool includeScale = false);

    /**
     * @brief Model matrix for a position already interpolated for this part
     */
    glm::mat4 ComputeModelMatrix(const PartDescriptor& part, const glm::vec3& position,
                                 bool includeScale = false);
}

} // namespace Unfold
