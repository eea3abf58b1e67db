#include "assembly/LayoutGenerator.hpp"
#include "core/Logger.hpp"

#include <array>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace Unfold {

namespace {

struct NamedField {
    const char* key;
    float StructuralParameters::* member;
};

constexpr std::array<NamedField, 15> kFields{{
    {"width", &StructuralParameters::width},
    {"height", &StructuralParameters::height},
    {"depth", &StructuralParameters::depth},
    {"member_thickness", &StructuralParameters::memberThickness},
    {"explode_depth", &StructuralParameters::explodeDepth},
    {"explode_lateral", &StructuralParameters::explodeLateral},
    {"rail_overhang", &StructuralParameters::railOverhang},
    {"rail_depth", &StructuralParameters::railDepth},
    {"lining_thickness", &StructuralParameters::liningThickness},
    {"cladding_thickness", &StructuralParameters::claddingThickness},
    {"frame_thickness", &StructuralParameters::frameThickness},
    {"frame_depth", &StructuralParameters::frameDepth},
    {"frame_recess", &StructuralParameters::frameRecess},
    {"frame_clearance", &StructuralParameters::frameClearance},
    {"glass_thickness", &StructuralParameters::glassThickness},
}};

// Animation windows. Foundational tiers settle first; every window ends at or
// before progress 1 so the whole unit is flush when the timeline completes.
constexpr AnimationWindow kRailWindow{0.0f, 0.1f};
constexpr AnimationWindow kMemberWindow{0.1f, 0.4f};
constexpr AnimationWindow kLiningWindow{0.3f, 0.5f};
constexpr AnimationWindow kLiningSideWindow{0.35f, 0.5f};
constexpr AnimationWindow kFrameWindow{0.45f, 0.5f};
constexpr AnimationWindow kFrameSideWindow{0.5f, 0.5f};
constexpr AnimationWindow kGlassWindow{0.55f, 0.45f};
constexpr AnimationWindow kCladdingWindow{0.6f, 0.4f};
constexpr AnimationWindow kCladdingSideWindow{0.65f, 0.35f};

LayoutError InvalidParameter(std::string message) {
    return LayoutError{LayoutErrorCode::InvalidParameter, std::move(message)};
}

/**
 * @brief Collects parts and contacts for one Generate() call
 */
class PartList {
public:
    explicit PartList(const LayoutGenerator& generator)
        : m_generator(generator) {}

    void Add(std::string id, std::string name, ConstructionTier tier, Side side,
             const glm::vec3& size, const glm::vec3& center,
             const AnimationWindow& window, VisualHints hints) {
        PartDescriptor part;
        part.id = std::move(id);
        part.displayName = std::move(name);
        part.tier = tier;
        part.side = side;
        part.dimensions = size;
        part.assembledPosition = center;
        part.explodedPosition = m_generator.ComputeExplodedPosition(center, tier, side);
        part.window = window;
        part.window.easing = m_generator.GetParameters().easing;
        part.hints = hints;
        m_parts.push_back(std::move(part));
    }

    void Touch(std::string lower, std::string upper, Axis axis,
               std::vector<AlignedFace> aligned = {}) {
        m_contacts.push_back({std::move(lower), std::move(upper), axis, std::move(aligned)});
    }

    std::vector<PartDescriptor> TakeParts() { return std::move(m_parts); }
    std::vector<FlushContact> TakeContacts() { return std::move(m_contacts); }

private:
    const LayoutGenerator& m_generator;
    std::vector<PartDescriptor> m_parts;
    std::vector<FlushContact> m_contacts;
};

VisualHints Solid(std::uint32_t color) {
    VisualHints hints;
    hints.color = color;
    return hints;
}

} // namespace

// ============================================================================
// StructuralParameters
// ============================================================================

nlohmann::json StructuralParameters::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& field : kFields) {
        j[field.key] = this->*field.member;
    }
    j["easing"] = EasingKindToString(easing);
    return j;
}

bool StructuralParameters::ApplyJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return false;
    }
    for (const auto& field : kFields) {
        auto it = j.find(field.key);
        if (it == j.end()) {
            continue;
        }
        if (!it->is_number()) {
            return false;
        }
        this->*field.member = it->get<float>();
    }
    if (auto it = j.find("easing"); it != j.end()) {
        if (!it->is_string()) {
            return false;
        }
        auto kind = EasingKindFromString(it->get<std::string>());
        if (!kind) {
            return false;
        }
        easing = *kind;
    }
    return true;
}

// ============================================================================
// LayoutGenerator
// ============================================================================

LayoutGenerator::LayoutGenerator(StructuralParameters params)
    : m_params(params)
{}

std::expected<void, LayoutError> LayoutGenerator::Validate(const StructuralParameters& p) {
    for (const auto& field : kFields) {
        const float value = p.*field.member;
        if (!std::isfinite(value) || value <= 0.0f) {
            return std::unexpected(InvalidParameter(
                std::string(field.key) + " must be positive (got " + std::to_string(value) + ")"));
        }
    }

    const float innerW = p.width - 2.0f * p.memberThickness;
    const float innerH = p.height - 2.0f * p.memberThickness;
    if (innerW <= 0.0f || innerH <= 0.0f) {
        return std::unexpected(InvalidParameter(
            "width and height must exceed twice the member thickness"));
    }
    if (p.liningThickness > p.memberThickness) {
        return std::unexpected(InvalidParameter(
            "lining_thickness must not exceed member_thickness"));
    }
    if (innerW - p.frameClearance <= 2.0f * p.frameThickness ||
        innerH - p.frameClearance <= 2.0f * p.frameThickness) {
        return std::unexpected(InvalidParameter(
            "frame does not fit the opening (clearance and frame thickness too large)"));
    }
    if (p.frameRecess - p.frameDepth * 0.5f < 0.0f ||
        p.frameRecess + p.frameDepth * 0.5f > p.depth) {
        return std::unexpected(InvalidParameter(
            "frame_recess and frame_depth must keep the frame inside the box depth"));
    }
    if (p.glassThickness > p.frameDepth) {
        return std::unexpected(InvalidParameter(
            "glass_thickness must not exceed frame_depth"));
    }
    return {};
}

ExplosionProfile LayoutGenerator::GetExplosionProfile(ConstructionTier tier) noexcept {
    switch (tier) {
        case ConstructionTier::WallRail: return {0.0f, 0.0f};   // fixed to the wall
        case ConstructionTier::Structure: return {0.0f, 0.2f};
        case ConstructionTier::Infill: return {0.5f, 0.5f};
        case ConstructionTier::Frame: return {0.0f, 0.8f};
        case ConstructionTier::Glazing: return {0.0f, 0.9f};
        case ConstructionTier::Cladding: return {1.0f, 1.0f};
    }
    return {};
}

glm::vec3 LayoutGenerator::ComputeExplodedPosition(const glm::vec3& assembled,
                                                   ConstructionTier tier, Side side) const {
    const ExplosionProfile profile = GetExplosionProfile(tier);
    return assembled
         + SideNormal(side) * (profile.lateral * m_params.explodeLateral)
         + glm::vec3(0.0f, 0.0f, profile.depth * m_params.explodeDepth);
}

std::expected<Assembly, LayoutError> LayoutGenerator::Generate() const {
    if (auto valid = Validate(m_params); !valid) {
        UNFOLD_LOG_ERROR("Layout rejected: {}", valid.error().message);
        return std::unexpected(valid.error());
    }

    const StructuralParameters& p = m_params;
    const float t = p.memberThickness;
    const float halfW = p.width * 0.5f;
    const float halfH = p.height * 0.5f;
    const float midZ = p.depth * 0.5f;

    // Member centers and the faces of the opening they enclose
    const float memberX = halfW - t * 0.5f;
    const float memberY = halfH - t * 0.5f;
    const float innerHalfW = halfW - t;
    const float innerHalfH = halfH - t;

    PartList list(*this);

    // --- Wall rails: vertical tracks on the wall, front face flush with the members' backs
    const glm::vec3 railSize(t, p.height + p.railOverhang, p.railDepth);
    list.Add("rail-left", "Wall Rail Left", ConstructionTier::WallRail, Side::Left,
             railSize, {-memberX, 0.0f, -p.railDepth * 0.5f}, kRailWindow, Solid(Palette::kSteel));
    list.Add("rail-right", "Wall Rail Right", ConstructionTier::WallRail, Side::Right,
             railSize, {memberX, 0.0f, -p.railDepth * 0.5f}, kRailWindow, Solid(Palette::kSteel));

    // --- Corner members: cantilevered from the wall along the box depth
    const glm::vec3 memberSize(t, t, p.depth);
    list.Add("beam-tl", "Steel Beam Top Left", ConstructionTier::Structure, Side::Center,
             memberSize, {-memberX, memberY, midZ}, kMemberWindow, Solid(Palette::kSteel));
    list.Add("beam-tr", "Steel Beam Top Right", ConstructionTier::Structure, Side::Center,
             memberSize, {memberX, memberY, midZ}, kMemberWindow, Solid(Palette::kSteel));
    list.Add("beam-bl", "Steel Beam Bottom Left", ConstructionTier::Structure, Side::Center,
             memberSize, {-memberX, -memberY, midZ}, kMemberWindow, Solid(Palette::kSteel));
    list.Add("beam-br", "Steel Beam Bottom Right", ConstructionTier::Structure, Side::Center,
             memberSize, {memberX, -memberY, midZ}, kMemberWindow, Solid(Palette::kSteel));

    const AlignedFace sameDepth{Axis::Z, Bound::Both};
    list.Touch("rail-left", "beam-tl", Axis::Z, {{Axis::X, Bound::Both}});
    list.Touch("rail-left", "beam-bl", Axis::Z, {{Axis::X, Bound::Both}});
    list.Touch("rail-right", "beam-tr", Axis::Z, {{Axis::X, Bound::Both}});
    list.Touch("rail-right", "beam-br", Axis::Z, {{Axis::X, Bound::Both}});

    // --- Infill: lining between the members, flush with their inner faces.
    // The sill takes the full member section.
    const float lining = p.liningThickness;
    list.Add("infill-top", "Insulation Top", ConstructionTier::Infill, Side::Top,
             {2.0f * innerHalfW, lining, p.depth}, {0.0f, innerHalfH + lining * 0.5f, midZ},
             kLiningWindow, Solid(Palette::kInsulation));
    list.Add("infill-sill", "Insulation Sill", ConstructionTier::Infill, Side::Bottom,
             {2.0f * innerHalfW, t, p.depth}, {0.0f, -memberY, midZ},
             kLiningWindow, Solid(Palette::kInsulation));
    list.Add("infill-left", "Insulation Left", ConstructionTier::Infill, Side::Left,
             {lining, 2.0f * innerHalfH, p.depth}, {-(innerHalfW + lining * 0.5f), 0.0f, midZ},
             kLiningSideWindow, Solid(Palette::kInsulation));
    list.Add("infill-right", "Insulation Right", ConstructionTier::Infill, Side::Right,
             {lining, 2.0f * innerHalfH, p.depth}, {innerHalfW + lining * 0.5f, 0.0f, midZ},
             kLiningSideWindow, Solid(Palette::kInsulation));

    list.Touch("beam-tl", "infill-top", Axis::X, {sameDepth, {Axis::Y, Bound::Min}});
    list.Touch("infill-top", "beam-tr", Axis::X, {sameDepth, {Axis::Y, Bound::Min}});
    list.Touch("beam-bl", "infill-sill", Axis::X, {sameDepth, {Axis::Y, Bound::Both}});
    list.Touch("infill-sill", "beam-br", Axis::X, {sameDepth, {Axis::Y, Bound::Both}});
    list.Touch("beam-bl", "infill-left", Axis::Y, {sameDepth, {Axis::X, Bound::Max}});
    list.Touch("infill-left", "beam-tl", Axis::Y, {sameDepth, {Axis::X, Bound::Max}});
    list.Touch("beam-br", "infill-right", Axis::Y, {sameDepth, {Axis::X, Bound::Min}});
    list.Touch("infill-right", "beam-tr", Axis::Y, {sameDepth, {Axis::X, Bound::Min}});

    // --- Cladding: outer skin over the members; the sides also cap the ends
    // of the top and bottom sheets.
    const float clad = p.claddingThickness;
    list.Add("clad-top", "Cladding Top", ConstructionTier::Cladding, Side::Top,
             {p.width, clad, p.depth}, {0.0f, halfH + clad * 0.5f, midZ},
             kCladdingWindow, Solid(Palette::kCladding));
    list.Add("clad-bottom", "Cladding Bottom", ConstructionTier::Cladding, Side::Bottom,
             {p.width, clad, p.depth}, {0.0f, -(halfH + clad * 0.5f), midZ},
             kCladdingWindow, Solid(Palette::kCladding));
    list.Add("clad-left", "Cladding Left", ConstructionTier::Cladding, Side::Left,
             {clad, p.height + 2.0f * clad, p.depth}, {-(halfW + clad * 0.5f), 0.0f, midZ},
             kCladdingSideWindow, Solid(Palette::kCladding));
    list.Add("clad-right", "Cladding Right", ConstructionTier::Cladding, Side::Right,
             {clad, p.height + 2.0f * clad, p.depth}, {halfW + clad * 0.5f, 0.0f, midZ},
             kCladdingSideWindow, Solid(Palette::kCladding));

    list.Touch("beam-tl", "clad-top", Axis::Y, {sameDepth});
    list.Touch("beam-tr", "clad-top", Axis::Y, {sameDepth});
    list.Touch("clad-bottom", "beam-bl", Axis::Y, {sameDepth});
    list.Touch("clad-bottom", "beam-br", Axis::Y, {sameDepth});
    list.Touch("clad-left", "beam-tl", Axis::X, {sameDepth});
    list.Touch("clad-left", "beam-bl", Axis::X, {sameDepth});
    list.Touch("beam-tr", "clad-right", Axis::X, {sameDepth});
    list.Touch("beam-br", "clad-right", Axis::X, {sameDepth});
    list.Touch("clad-left", "clad-top", Axis::X, {sameDepth, {Axis::Y, Bound::Max}});
    list.Touch("clad-left", "clad-bottom", Axis::X, {sameDepth, {Axis::Y, Bound::Min}});
    list.Touch("clad-top", "clad-right", Axis::X, {sameDepth, {Axis::Y, Bound::Max}});
    list.Touch("clad-bottom", "clad-right", Axis::X, {sameDepth, {Axis::Y, Bound::Min}});

    // --- Timber frame: inset in the opening with an even fitting gap.
    // Top and bottom run full width; the sides fit between them.
    const float ft = p.frameThickness;
    const float frameHalfW = innerHalfW - p.frameClearance * 0.5f;
    const float frameHalfH = innerHalfH - p.frameClearance * 0.5f;
    const float frameZ = p.frameRecess;
    const AlignedFace frameDepth{Axis::Z, Bound::Both};

    list.Add("frame-top", "Window Frame Top", ConstructionTier::Frame, Side::Top,
             {2.0f * frameHalfW, ft, p.frameDepth}, {0.0f, frameHalfH - ft * 0.5f, frameZ},
             kFrameWindow, Solid(Palette::kTimber));
    list.Add("frame-bottom", "Window Frame Bottom", ConstructionTier::Frame, Side::Bottom,
             {2.0f * frameHalfW, ft, p.frameDepth}, {0.0f, -(frameHalfH - ft * 0.5f), frameZ},
             kFrameWindow, Solid(Palette::kTimber));
    list.Add("frame-left", "Window Frame Left", ConstructionTier::Frame, Side::Left,
             {ft, 2.0f * (frameHalfH - ft), p.frameDepth}, {-(frameHalfW - ft * 0.5f), 0.0f, frameZ},
             kFrameSideWindow, Solid(Palette::kTimber));
    list.Add("frame-right", "Window Frame Right", ConstructionTier::Frame, Side::Right,
             {ft, 2.0f * (frameHalfH - ft), p.frameDepth}, {frameHalfW - ft * 0.5f, 0.0f, frameZ},
             kFrameSideWindow, Solid(Palette::kTimber));

    list.Touch("frame-left", "frame-top", Axis::Y, {frameDepth, {Axis::X, Bound::Min}});
    list.Touch("frame-bottom", "frame-left", Axis::Y, {frameDepth, {Axis::X, Bound::Min}});
    list.Touch("frame-right", "frame-top", Axis::Y, {frameDepth, {Axis::X, Bound::Max}});
    list.Touch("frame-bottom", "frame-right", Axis::Y, {frameDepth, {Axis::X, Bound::Max}});

    // --- Glass: fills the frame opening edge to edge
    VisualHints glass = Solid(Palette::kGlass);
    glass.opacity = 0.3f;
    glass.metalness = 0.9f;
    glass.roughness = 0.05f;
    list.Add("glass", "Glass", ConstructionTier::Glazing, Side::Center,
             {2.0f * (frameHalfW - ft), 2.0f * (frameHalfH - ft), p.glassThickness},
             {0.0f, 0.0f, frameZ}, kGlassWindow, glass);

    list.Touch("frame-left", "glass", Axis::X, {{Axis::Y, Bound::Both}});
    list.Touch("glass", "frame-right", Axis::X, {{Axis::Y, Bound::Both}});
    list.Touch("frame-bottom", "glass", Axis::Y);
    list.Touch("glass", "frame-top", Axis::Y);

    auto assembly = Assembly::Create(list.TakeParts(), list.TakeContacts());
    if (!assembly) {
        UNFOLD_LOG_ERROR("Assembly rejected: {}", assembly.error().ToString());
        return assembly;
    }

    const FlushFitReport report = FlushFit::Verify(*assembly);
    if (!report.IsFlush()) {
        UNFOLD_LOG_ERROR("Generated layout is not flush: {}", report.GetSummary());
        const LayoutErrorCode code = report.violations.empty()
            ? LayoutErrorCode::Interpenetration
            : LayoutErrorCode::FlushFitViolation;
        return std::unexpected(LayoutError{code, report.GetSummary()});
    }

    UNFOLD_LOG_INFO("Generated window unit {:.2f} x {:.2f} x {:.2f}: {} parts, {} flush contacts",
                    p.width, p.height, p.depth, assembly->GetPartCount(), assembly->GetContacts().size());
    return assembly;
}

} // namespace Unfold
