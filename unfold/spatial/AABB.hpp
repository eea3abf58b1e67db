#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace Unfold {

/**
 * @brief Coordinate axis index (matches glm component order)
 */
enum class Axis : int {
    X = 0,
    Y = 1,
    Z = 2
};

[[nodiscard]] const char* AxisToString(Axis axis) noexcept;

/**
 * @brief Axis-Aligned Bounding Box
 *
 * Every part of an assembly is an axis-aligned rectangular volume, so the
 * assembled layout is fully described by one AABB per part.
 */
struct AABB {
    glm::vec3 min{std::numeric_limits<float>::max()};
    glm::vec3 max{std::numeric_limits<float>::lowest()};

    constexpr AABB() noexcept = default;

    constexpr AABB(const glm::vec3& minPoint, const glm::vec3& maxPoint) noexcept
        : min(minPoint), max(maxPoint) {}

    /**
     * @brief Create AABB from center and full size
     */
    [[nodiscard]] static constexpr AABB FromCenterSize(
        const glm::vec3& center, const glm::vec3& size) noexcept {
        return AABB(center - size * 0.5f, center + size * 0.5f);
    }

    [[nodiscard]] constexpr glm::vec3 GetCenter() const noexcept {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] constexpr glm::vec3 GetSize() const noexcept {
        return max - min;
    }

    [[nodiscard]] constexpr float GetVolume() const noexcept {
        glm::vec3 size = GetSize();
        return size.x * size.y * size.z;
    }

    /**
     * @brief Check if AABB is valid (min <= max in all dimensions)
     */
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    [[nodiscard]] float Min(Axis axis) const noexcept { return min[static_cast<int>(axis)]; }
    [[nodiscard]] float Max(Axis axis) const noexcept { return max[static_cast<int>(axis)]; }

    /**
     * @brief Expand AABB to include another AABB
     */
    void Expand(const AABB& other) noexcept {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    /**
     * @brief Length of the overlap of both boxes along one axis (negative = gap)
     */
    [[nodiscard]] static float OverlapAlong(const AABB& a, const AABB& b, Axis axis) noexcept;

    /**
     * @brief Volume shared by both boxes (0 when they only touch or are apart)
     */
    [[nodiscard]] static float IntersectionVolume(const AABB& a, const AABB& b) noexcept;
};

} // namespace Unfold
