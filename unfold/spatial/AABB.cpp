#include "spatial/AABB.hpp"
#include <algorithm>

namespace Unfold {

const char* AxisToString(Axis axis) noexcept {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "Unknown";
}

float AABB::OverlapAlong(const AABB& a, const AABB& b, Axis axis) noexcept {
    return std::min(a.Max(axis), b.Max(axis)) - std::max(a.Min(axis), b.Min(axis));
}

float AABB::IntersectionVolume(const AABB& a, const AABB& b) noexcept {
    float volume = 1.0f;
    for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
        const float overlap = OverlapAlong(a, b, axis);
        if (overlap <= 0.0f) {
            return 0.0f;
        }
        volume *= overlap;
    }
    return volume;
}

} // namespace Unfold
