#pragma once

#include "assembly/Assembly.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Structural dimensions of the window unit (meters)
 *
 * The unit is a rectangular box protruding from a wall along +Z. The first
 * six values are the primary structure; the rest size secondary members.
 * Every value must be positive.
 */
struct StructuralParameters {
    float width = 2.8f;             // overall box width
    float height = 1.9f;            // overall box height
    float depth = 0.8f;             // protrusion from the wall
    float memberThickness = 0.14f;  // square section of the corner members
    float explodeDepth = 5.0f;      // forward explosion distance
    float explodeLateral = 2.5f;    // sideways explosion distance

    float railOverhang = 0.6f;      // wall rails extend past the box (total)
    float railDepth = 0.1f;
    float liningThickness = 0.05f;  // infill lining on top and sides
    float claddingThickness = 0.03f;
    float frameThickness = 0.12f;   // timber frame member section
    float frameDepth = 0.15f;
    float frameRecess = 0.3f;       // frame center, measured from the wall
    float frameClearance = 0.1f;    // total fitting gap around the frame
    float glassThickness = 0.02f;

    EasingKind easing = EasingKind::CubicInOut;   // shared by every part's window

    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Overwrite fields present in the JSON object
     * @return false if a present field has the wrong type or names an
     *         unknown easing
     */
    bool ApplyJson(const nlohmann::json& j);
};

/**
 * @brief How far a tier moves away from its assembled position when exploded
 *
 * Offset = side normal * lateral * explodeLateral + Z * depth * explodeDepth
 */
struct ExplosionProfile {
    float lateral = 0.0f;
    float depth = 0.0f;
};

/**
 * @brief Default part colors, 0xRRGGBB
 */
namespace Palette {
    inline constexpr std::uint32_t kSteel = 0x71717a;
    inline constexpr std::uint32_t kInsulation = 0xfde047;
    inline constexpr std::uint32_t kTimber = 0x9a3412;
    inline constexpr std::uint32_t kCladding = 0x18181b;
    inline constexpr std::uint32_t kGlass = 0xa5f3fc;
}

/**
 * @brief Parametric generator for the window-unit assembly
 *
 * Every part's final geometry is computed in a single pass from the flush-fit
 * rule: panels between members are sized to the span between the members'
 * inner faces and placed so their faces coincide with them. The generated
 * assembly is verified with FlushFit::Verify before it is returned.
 */
class LayoutGenerator {
public:
    explicit LayoutGenerator(StructuralParameters params = {});

    /**
     * @brief Check every parameter is positive and the parts fit together
     */
    [[nodiscard]] static std::expected<void, LayoutError> Validate(const StructuralParameters& params);

    /**
     * @brief Build the assembly; fails without partial output on bad input
     */
    [[nodiscard]] std::expected<Assembly, LayoutError> Generate() const;

    [[nodiscard]] const StructuralParameters& GetParameters() const { return m_params; }

    [[nodiscard]] static ExplosionProfile GetExplosionProfile(ConstructionTier tier) noexcept;

    /**
     * @brief Exploded position for a part of the given tier and side
     */
    [[nodiscard]] glm::vec3 ComputeExplodedPosition(const glm::vec3& assembled,
                                                    ConstructionTier tier, Side side) const;

private:
    StructuralParameters m_params;
};

} // namespace Unfold
