#include "assembly/PartDescriptor.hpp"
#include <cmath>
#include <cstdio>

namespace Unfold {

namespace {

bool IsPositiveFinite(float value) {
    return std::isfinite(value) && value > 0.0f;
}

bool IsFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

nlohmann::json Vec3ToJson(const glm::vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

} // namespace

const char* ConstructionTierToString(ConstructionTier tier) noexcept {
    switch (tier) {
        case ConstructionTier::WallRail: return "wall_rail";
        case ConstructionTier::Structure: return "structure";
        case ConstructionTier::Infill: return "infill";
        case ConstructionTier::Frame: return "frame";
        case ConstructionTier::Glazing: return "glazing";
        case ConstructionTier::Cladding: return "cladding";
    }
    return "unknown";
}

const char* SideToString(Side side) noexcept {
    switch (side) {
        case Side::Center: return "center";
        case Side::Top: return "top";
        case Side::Bottom: return "bottom";
        case Side::Left: return "left";
        case Side::Right: return "right";
    }
    return "unknown";
}

glm::vec3 SideNormal(Side side) noexcept {
    switch (side) {
        case Side::Top: return {0.0f, 1.0f, 0.0f};
        case Side::Bottom: return {0.0f, -1.0f, 0.0f};
        case Side::Left: return {-1.0f, 0.0f, 0.0f};
        case Side::Right: return {1.0f, 0.0f, 0.0f};
        case Side::Center: break;
    }
    return glm::vec3(0.0f);
}

glm::vec3 VisualHints::GetColorRGB() const {
    return glm::vec3(
        static_cast<float>((color >> 16) & 0xFF) / 255.0f,
        static_cast<float>((color >> 8) & 0xFF) / 255.0f,
        static_cast<float>(color & 0xFF) / 255.0f
    );
}

nlohmann::json VisualHints::ToJson() const {
    return {
        {"color", ColorToHex(color)},
        {"rgb", Vec3ToJson(GetColorRGB())},
        {"opacity", GetOpacity()},
        {"metalness", GetMetalness()},
        {"roughness", GetRoughness()}
    };
}

std::string ColorToHex(std::uint32_t color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%06x", static_cast<unsigned>(color & 0xFFFFFF));
    return buffer;
}

nlohmann::json PartDescriptor::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = displayName;
    j["tier"] = ConstructionTierToString(tier);
    j["side"] = SideToString(side);
    j["dimensions"] = Vec3ToJson(dimensions);
    j["assembled_position"] = Vec3ToJson(assembledPosition);
    j["exploded_position"] = Vec3ToJson(explodedPosition);
    if (rotation) {
        j["rotation"] = Vec3ToJson(*rotation);
    }
    j["window"] = {
        {"start_offset", window.startOffset},
        {"span", window.span},
        {"easing", EasingKindToString(window.easing)}
    };
    j["material"] = hints.ToJson();
    return j;
}

const char* LayoutErrorCodeToString(LayoutErrorCode code) noexcept {
    switch (code) {
        case LayoutErrorCode::InvalidParameter:   return "Invalid parameter";
        case LayoutErrorCode::EmptyId:            return "Empty part id";
        case LayoutErrorCode::DuplicateId:        return "Duplicate part id";
        case LayoutErrorCode::InvalidDimensions:  return "Invalid dimensions";
        case LayoutErrorCode::InvalidWindow:      return "Invalid animation window";
        case LayoutErrorCode::UnknownContactPart: return "Contact names an unknown part";
        case LayoutErrorCode::FlushFitViolation:  return "Flush-fit violation";
        case LayoutErrorCode::Interpenetration:   return "Parts interpenetrate";
    }
    return "Unknown error";
}

std::string LayoutError::ToString() const {
    return std::string(LayoutErrorCodeToString(code)) + ": " + message;
}

std::expected<void, LayoutError> ValidatePart(const PartDescriptor& part) {
    if (part.id.empty()) {
        return std::unexpected(LayoutError{LayoutErrorCode::EmptyId,
            "part '" + part.displayName + "' has no id"});
    }

    const glm::vec3& d = part.dimensions;
    if (!IsPositiveFinite(d.x) || !IsPositiveFinite(d.y) || !IsPositiveFinite(d.z)) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidDimensions,
            "part '" + part.id + "' must have positive width, height and depth"});
    }

    if (!IsFinite(part.assembledPosition) || !IsFinite(part.explodedPosition)) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidDimensions,
            "part '" + part.id + "' has a non-finite position"});
    }

    const AnimationWindow& w = part.window;
    if (!std::isfinite(w.startOffset) || w.startOffset < 0.0f || w.startOffset >= 1.0f) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidWindow,
            "part '" + part.id + "' start offset must lie in [0, 1)"});
    }
    if (!IsPositiveFinite(w.span)) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidWindow,
            "part '" + part.id + "' span must be positive"});
    }

    return {};
}

} // namespace Unfold
