#pragma once

#include "animation/Easing.hpp"
#include "spatial/AABB.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Construction tier, listed in the order the tiers settle
 *
 * Foundational tiers settle first, the outer cosmetic skin last.
 */
enum class ConstructionTier : unsigned char {
    WallRail,
    Structure,
    Infill,
    Frame,
    Glazing,
    Cladding
};

/**
 * @brief Which face of the assembly a part belongs to
 */
enum class Side : unsigned char {
    Center,
    Top,
    Bottom,
    Left,
    Right
};

[[nodiscard]] const char* ConstructionTierToString(ConstructionTier tier) noexcept;
[[nodiscard]] const char* SideToString(Side side) noexcept;

/**
 * @brief Unit vector pointing away from the assembly for a side (zero for Center)
 */
[[nodiscard]] glm::vec3 SideNormal(Side side) noexcept;

/**
 * @brief Sub-interval of global progress during which a part moves
 *
 * The part is pinned to its exploded position before startOffset and to its
 * assembled position after startOffset + span.
 */
struct AnimationWindow {
    float startOffset = 0.0f;
    float span = 1.0f;
    EasingKind easing = EasingKind::CubicInOut;

    [[nodiscard]] float End() const noexcept { return startOffset + span; }

    /**
     * @brief True if progress 1 lands at or after the end of the window
     */
    [[nodiscard]] bool ReachesEnd() const noexcept { return End() <= 1.0f; }
};

/**
 * @brief Cosmetic surface parameters; no effect on layout or timing
 */
struct VisualHints {
    static constexpr float kDefaultOpacity = 1.0f;
    static constexpr float kDefaultMetalness = 0.2f;
    static constexpr float kDefaultRoughness = 0.8f;

    std::uint32_t color = 0xFFFFFF;     // 0xRRGGBB
    std::optional<float> opacity;
    std::optional<float> metalness;
    std::optional<float> roughness;

    [[nodiscard]] float GetOpacity() const { return opacity.value_or(kDefaultOpacity); }
    [[nodiscard]] float GetMetalness() const { return metalness.value_or(kDefaultMetalness); }
    [[nodiscard]] float GetRoughness() const { return roughness.value_or(kDefaultRoughness); }
    [[nodiscard]] bool IsTransparent() const { return GetOpacity() < 1.0f; }

    /**
     * @brief Color as normalized RGB
     */
    [[nodiscard]] glm::vec3 GetColorRGB() const;

    /**
     * @brief Material block: hex color, normalized rgb and resolved surface values
     */
    [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief One rigid rectangular component of an assembly
 */
struct PartDescriptor {
    std::string id;
    std::string displayName;
    ConstructionTier tier = ConstructionTier::Structure;
    Side side = Side::Center;

    glm::vec3 dimensions{1.0f};         // width, height, depth
    glm::vec3 assembledPosition{0.0f};  // center at progress 1
    glm::vec3 explodedPosition{0.0f};   // center at progress 0
    std::optional<glm::vec3> rotation;  // Euler XYZ radians, fixed for the whole animation

    AnimationWindow window;
    VisualHints hints;

    /**
     * @brief Box occupied at full assembly (rotation is not applied)
     */
    [[nodiscard]] AABB GetAssembledBounds() const {
        return AABB::FromCenterSize(assembledPosition, dimensions);
    }

    [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Configuration error categories for layouts and assemblies
 */
enum class LayoutErrorCode {
    InvalidParameter,
    EmptyId,
    DuplicateId,
    InvalidDimensions,
    InvalidWindow,
    UnknownContactPart,
    FlushFitViolation,
    Interpenetration
};

[[nodiscard]] const char* LayoutErrorCodeToString(LayoutErrorCode code) noexcept;

struct LayoutError {
    LayoutErrorCode code = LayoutErrorCode::InvalidParameter;
    std::string message;

    [[nodiscard]] std::string ToString() const;
};

/**
 * @brief Validate one descriptor: non-empty id, positive finite dimensions,
 *        startOffset in [0,1) and span > 0
 */
[[nodiscard]] std::expected<void, LayoutError> ValidatePart(const PartDescriptor& part);

/**
 * @brief Format a color as "#rrggbb"
 */
[[nodiscard]] std::string ColorToHex(std::uint32_t color);

} // namespace Unfold
