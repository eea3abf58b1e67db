#pragma once

#include "assembly/PartDescriptor.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Wall the window unit is mounted on (static scenery)
 */
struct BackdropParameters {
    float wallWidth = 16.0f;
    float wallHeight = 16.0f;
    float wallFrontZ = -0.11f;      // front face of the siding
    float openingProud = 0.01f;     // opening mask stands this far in front of the siding
    float plankWidth = 0.4f;
    float plankGap = 0.02f;
    float plankDepth = 0.2f;
    float stripDepth = 0.1f;        // dark strip visible through each gap
    float openingWidth = 3.2f;
    float openingHeight = 2.4f;
    float openingDepth = 0.1f;

    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Overwrite fields present in the JSON object
     * @return false if a present field has the wrong type
     */
    bool ApplyJson(const nlohmann::json& j);
};

/**
 * @brief A box that never moves
 */
struct StaticPart {
    std::string id;
    glm::vec3 dimensions{1.0f};
    glm::vec3 position{0.0f};
    VisualHints hints;

    [[nodiscard]] nlohmann::json ToJson() const;
};

namespace BackdropColors {
    inline constexpr std::uint32_t kSiding = 0x606060;
    inline constexpr std::uint32_t kSidingAlt = 0x555555;
    inline constexpr std::uint32_t kStrip = 0x202020;
    inline constexpr std::uint32_t kOpening = 0x101010;
}

/// Upper bound on siding planks in one wall
inline constexpr std::size_t kMaxBackdropPlanks = 10000;

/**
 * @brief Build the siding planks, gap strips and the dark opening mask
 *
 * Planks alternate between two shades. Fails on any non-positive size and
 * on walls that would need more than kMaxBackdropPlanks planks.
 */
[[nodiscard]] std::expected<std::vector<StaticPart>, LayoutError> GenerateBackdrop(
    const BackdropParameters& params = {});

} // namespace Unfold
