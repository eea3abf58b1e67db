#include "assembly/FlushFit.hpp"
#include "assembly/Assembly.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace Unfold {

const char* FlushViolationKindToString(FlushViolationKind kind) noexcept {
    switch (kind) {
        case FlushViolationKind::Gap:            return "gap";
        case FlushViolationKind::Overlap:        return "overlap";
        case FlushViolationKind::NoSharedFace:   return "no shared face";
        case FlushViolationKind::ExtentMismatch: return "extent mismatch";
    }
    return "unknown";
}

std::string FlushViolation::ToString() const {
    std::ostringstream ss;
    ss << lower << " | " << upper << " along " << AxisToString(axis)
       << ": " << FlushViolationKindToString(kind) << " of " << amount;
    return ss.str();
}

std::string FlushFitReport::GetSummary() const {
    if (IsFlush()) {
        return "flush";
    }

    std::ostringstream ss;
    ss << violations.size() << " contact violation(s), "
       << interpenetrations.size() << " interpenetration(s)";
    for (const auto& v : violations) {
        ss << "\n  " << v.ToString();
    }
    for (const auto& i : interpenetrations) {
        ss << "\n  " << i.first << " / " << i.second << " share volume " << i.volume;
    }
    return ss.str();
}

namespace FlushFit {

bool CheckContact(const FlushContact& contact, const AABB& lower, const AABB& upper,
                  std::vector<FlushViolation>& out, float tolerance) {
    const std::size_t before = out.size();

    const float separation = upper.Min(contact.axis) - lower.Max(contact.axis);
    if (separation > tolerance) {
        out.push_back({contact.lower, contact.upper, contact.axis, FlushViolationKind::Gap, separation});
    } else if (separation < -tolerance) {
        out.push_back({contact.lower, contact.upper, contact.axis, FlushViolationKind::Overlap, -separation});
    }

    for (Axis other : {Axis::X, Axis::Y, Axis::Z}) {
        if (other == contact.axis) {
            continue;
        }
        const float shared = AABB::OverlapAlong(lower, upper, other);
        if (shared <= tolerance) {
            out.push_back({contact.lower, contact.upper, other, FlushViolationKind::NoSharedFace, shared});
        }
    }

    for (const AlignedFace& face : contact.aligned) {
        float deviation = 0.0f;
        if (face.bound != Bound::Max) {
            deviation = std::max(deviation, std::abs(lower.Min(face.axis) - upper.Min(face.axis)));
        }
        if (face.bound != Bound::Min) {
            deviation = std::max(deviation, std::abs(lower.Max(face.axis) - upper.Max(face.axis)));
        }
        if (deviation > tolerance) {
            out.push_back({contact.lower, contact.upper, face.axis, FlushViolationKind::ExtentMismatch, deviation});
        }
    }

    return out.size() == before;
}

FlushFitReport Verify(const Assembly& assembly, float tolerance) {
    FlushFitReport report;

    for (const auto& contact : assembly.GetContacts()) {
        const PartDescriptor* lower = assembly.Find(contact.lower);
        const PartDescriptor* upper = assembly.Find(contact.upper);
        if (!lower || !upper) {
            // Assembly::Create rejects contacts with unknown ids
            continue;
        }
        CheckContact(contact, lower->GetAssembledBounds(), upper->GetAssembledBounds(),
                     report.violations, tolerance);
    }

    const auto& parts = assembly.GetParts();
    const float volumeTolerance = tolerance * tolerance * tolerance;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const AABB a = parts[i].GetAssembledBounds();
        for (std::size_t j = i + 1; j < parts.size(); ++j) {
            const AABB b = parts[j].GetAssembledBounds();

            // Touching faces produce near-zero overlaps on one axis; only a
            // real penetration on all three axes counts.
            bool penetrates = true;
            for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
                if (AABB::OverlapAlong(a, b, axis) <= tolerance) {
                    penetrates = false;
                    break;
                }
            }
            if (!penetrates) {
                continue;
            }

            const float volume = AABB::IntersectionVolume(a, b);
            if (volume > volumeTolerance) {
                report.interpenetrations.push_back({parts[i].id, parts[j].id, volume});
            }
        }
    }

    return report;
}

} // namespace FlushFit

} // namespace Unfold
