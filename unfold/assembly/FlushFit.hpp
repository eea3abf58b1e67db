#pragma once

#include "spatial/AABB.hpp"

#include <string>
#include <vector>

namespace Unfold {

class Assembly;

/**
 * @brief Which bound(s) of an interval must coincide
 */
enum class Bound : unsigned char {
    Min,
    Max,
    Both
};

/**
 * @brief Requirement that two parts share a bound on another axis
 *
 * Bound::Both means both parts span the same interval; Min/Max means the
 * corresponding faces are coplanar (e.g. a lining flush with a member's
 * inner face).
 */
struct AlignedFace {
    Axis axis = Axis::X;
    Bound bound = Bound::Both;
};

/**
 * @brief A designed face-to-face contact between two parts at full assembly
 *
 * `lower`'s max face on `axis` must coincide with `upper`'s min face, and the
 * two faces must actually share area.
 */
struct FlushContact {
    std::string lower;
    std::string upper;
    Axis axis = Axis::X;
    std::vector<AlignedFace> aligned;
};

enum class FlushViolationKind {
    Gap,            // faces apart along the contact axis
    Overlap,        // faces pushed into each other along the contact axis
    NoSharedFace,   // faces coplanar but not touching
    ExtentMismatch  // an aligned bound differs
};

[[nodiscard]] const char* FlushViolationKindToString(FlushViolationKind kind) noexcept;

struct FlushViolation {
    std::string lower;
    std::string upper;
    Axis axis = Axis::X;
    FlushViolationKind kind = FlushViolationKind::Gap;
    float amount = 0.0f;

    [[nodiscard]] std::string ToString() const;
};

/**
 * @brief Two parts whose assembled boxes share volume
 */
struct Interpenetration {
    std::string first;
    std::string second;
    float volume = 0.0f;
};

struct FlushFitReport {
    std::vector<FlushViolation> violations;
    std::vector<Interpenetration> interpenetrations;

    [[nodiscard]] bool IsFlush() const { return violations.empty() && interpenetrations.empty(); }
    [[nodiscard]] std::string GetSummary() const;
};

namespace FlushFit {
    /// Absolute tolerance for coinciding faces (single-precision geometry)
    inline constexpr float kTolerance = 1e-5f;

    /**
     * @brief Check one contact between two assembled boxes
     * @return true if the contact holds; otherwise appends to `out`
     */
    bool CheckContact(const FlushContact& contact, const AABB& lower, const AABB& upper,
                      std::vector<FlushViolation>& out, float tolerance = kTolerance);

    /**
     * @brief Verify every designed contact of the assembly and look for any
     *        pair of parts whose assembled boxes interpenetrate
     */
    [[nodiscard]] FlushFitReport Verify(const Assembly& assembly, float tolerance = kTolerance);
}

} // namespace Unfold
