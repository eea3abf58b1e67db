#include "assembly/Backdrop.hpp"

#include <array>
#include <cmath>
#include <string>

namespace Unfold {

namespace {

struct NamedField {
    const char* key;
    float BackdropParameters::* member;
};

constexpr std::array<NamedField, 11> kFields{{
    {"wall_width", &BackdropParameters::wallWidth},
    {"wall_height", &BackdropParameters::wallHeight},
    {"wall_front_z", &BackdropParameters::wallFrontZ},
    {"opening_proud", &BackdropParameters::openingProud},
    {"plank_width", &BackdropParameters::plankWidth},
    {"plank_gap", &BackdropParameters::plankGap},
    {"plank_depth", &BackdropParameters::plankDepth},
    {"strip_depth", &BackdropParameters::stripDepth},
    {"opening_width", &BackdropParameters::openingWidth},
    {"opening_height", &BackdropParameters::openingHeight},
    {"opening_depth", &BackdropParameters::openingDepth},
}};

nlohmann::json Vec3ToJson(const glm::vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

} // namespace

nlohmann::json BackdropParameters::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& field : kFields) {
        j[field.key] = this->*field.member;
    }
    return j;
}

bool BackdropParameters::ApplyJson(const nlohmann::json& j) {
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
    return true;
}

nlohmann::json StaticPart::ToJson() const {
    return {
        {"id", id},
        {"dimensions", Vec3ToJson(dimensions)},
        {"position", Vec3ToJson(position)},
        {"material", hints.ToJson()}
    };
}

std::expected<std::vector<StaticPart>, LayoutError> GenerateBackdrop(const BackdropParameters& p) {
    const float sizes[] = {
        p.wallWidth, p.wallHeight, p.plankWidth, p.plankDepth,
        p.stripDepth, p.openingWidth, p.openingHeight, p.openingDepth
    };
    for (float size : sizes) {
        if (!std::isfinite(size) || size <= 0.0f) {
            return std::unexpected(LayoutError{LayoutErrorCode::InvalidParameter,
                "backdrop sizes must be positive"});
        }
    }
    if (!std::isfinite(p.plankGap) || p.plankGap < 0.0f ||
        !std::isfinite(p.openingProud) || p.openingProud < 0.0f || !std::isfinite(p.wallFrontZ)) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidParameter,
            "backdrop plank gap and opening offset must be non-negative"});
    }

    const float pitch = p.plankWidth + p.plankGap;
    const double planks = std::ceil(static_cast<double>(p.wallWidth) / pitch);
    if (planks > static_cast<double>(kMaxBackdropPlanks)) {
        return std::unexpected(LayoutError{LayoutErrorCode::InvalidParameter,
            "backdrop needs " + std::to_string(planks) + " planks (limit " +
            std::to_string(kMaxBackdropPlanks) + ")"});
    }
    const std::size_t count = static_cast<std::size_t>(planks);
    const float plankZ = p.wallFrontZ - p.plankDepth * 0.5f;
    const float stripZ = p.wallFrontZ - p.plankDepth + p.stripDepth * 0.5f;

    std::vector<StaticPart> parts;
    parts.reserve(count * 2 + 1);

    for (std::size_t i = 0; i < count; ++i) {
        const float left = -p.wallWidth * 0.5f + static_cast<float>(i) * pitch;

        StaticPart plank;
        plank.id = "siding-" + std::to_string(i);
        plank.dimensions = {p.plankWidth, p.wallHeight, p.plankDepth};
        plank.position = {left + p.plankWidth * 0.5f, 0.0f, plankZ};
        plank.hints.color = (i % 2 == 0) ? BackdropColors::kSiding : BackdropColors::kSidingAlt;
        plank.hints.roughness = 0.9f;
        parts.push_back(std::move(plank));

        if (p.plankGap > 0.0f) {
            StaticPart strip;
            strip.id = "siding-gap-" + std::to_string(i);
            strip.dimensions = {p.plankGap, p.wallHeight, p.stripDepth};
            strip.position = {left + p.plankWidth + p.plankGap * 0.5f, 0.0f, stripZ};
            strip.hints.color = BackdropColors::kStrip;
            parts.push_back(std::move(strip));
        }
    }

    // Dark recess behind the window unit, standing slightly proud of the siding
    StaticPart opening;
    opening.id = "wall-opening";
    opening.dimensions = {p.openingWidth, p.openingHeight, p.openingDepth};
    opening.position = {0.0f, 0.0f, p.wallFrontZ + p.openingProud - p.openingDepth * 0.5f};
    opening.hints.color = BackdropColors::kOpening;
    parts.push_back(std::move(opening));

    return parts;
}

} // namespace Unfold
