/**
 * @file test_backdrop.cpp
 * @brief Unit tests for the static wall backdrop
 */

#include <gtest/gtest.h>

#include "assembly/Backdrop.hpp"

#include "utils/TestHelpers.hpp"

#include <algorithm>
#include <string>

using namespace Unfold;
using namespace Unfold::Test;

TEST(BackdropTest, DefaultWall) {
    auto parts = GenerateBackdrop();
    ASSERT_TRUE(parts.has_value()) << parts.error().ToString();

    // 16 m wall at a 0.42 m pitch: 39 planks, each followed by a gap strip
    const auto planks = std::count_if(parts->begin(), parts->end(), [](const StaticPart& p) {
        return p.id.rfind("siding-", 0) == 0 && p.id.rfind("siding-gap-", 0) != 0;
    });
    EXPECT_EQ(39, planks);
    EXPECT_EQ(39u * 2u + 1u, parts->size());
    EXPECT_EQ("wall-opening", parts->back().id);
}

TEST(BackdropTest, PlanksAlternateShades) {
    BackdropParameters params;
    params.plankGap = 0.0f;
    params.plankWidth = 0.5f;
    auto parts = GenerateBackdrop(params);
    ASSERT_TRUE(parts.has_value());

    ASSERT_GE(parts->size(), 3u);
    EXPECT_EQ(BackdropColors::kSiding, (*parts)[0].hints.color);
    EXPECT_EQ(BackdropColors::kSidingAlt, (*parts)[1].hints.color);
    EXPECT_EQ(BackdropColors::kSiding, (*parts)[2].hints.color);
    EXPECT_FLOAT_EQ(0.9f, (*parts)[0].hints.GetRoughness());

    // No gap strips without a gap
    EXPECT_EQ(32u + 1u, parts->size());
}

TEST(BackdropTest, PlanksCoverWallFromLeftEdge) {
    auto parts = GenerateBackdrop();
    ASSERT_TRUE(parts.has_value());

    const StaticPart& first = (*parts)[0];
    EXPECT_EQ("siding-0", first.id);
    EXPECT_NEAR(-8.0f, first.position.x - first.dimensions.x * 0.5f, 1e-5f);
    EXPECT_NEAR(-0.21f, first.position.z, 1e-5f);

    const StaticPart& gap = (*parts)[1];
    EXPECT_EQ("siding-gap-0", gap.id);
    EXPECT_EQ(BackdropColors::kStrip, gap.hints.color);
    EXPECT_NEAR(first.position.x + 0.21f, gap.position.x, 1e-5f);
}

TEST(BackdropTest, OpeningMaskStopsAtWallRails) {
    auto parts = GenerateBackdrop();
    ASSERT_TRUE(parts.has_value());

    const StaticPart& opening = parts->back();
    const AABB box = AABB::FromCenterSize(opening.position, opening.dimensions);

    // Front face meets the back face of the wall rails
    EXPECT_NEAR(-0.1f, box.Max(Axis::Z), 1e-5f);
    EXPECT_EQ(BackdropColors::kOpening, opening.hints.color);
}

TEST(BackdropTest, RejectsInvalidSizes) {
    BackdropParameters noWidth;
    noWidth.wallWidth = 0.0f;
    auto result = GenerateBackdrop(noWidth);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(LayoutErrorCode::InvalidParameter, result.error().code);

    BackdropParameters negativeGap;
    negativeGap.plankGap = -0.01f;
    EXPECT_FALSE(GenerateBackdrop(negativeGap).has_value());
}

TEST(BackdropTest, RejectsWallsNeedingTooManyPlanks) {
    BackdropParameters hugeWall;
    hugeWall.wallWidth = 1.0e12f;
    auto result = GenerateBackdrop(hugeWall);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(LayoutErrorCode::InvalidParameter, result.error().code);

    BackdropParameters thinPlanks;
    thinPlanks.plankWidth = 1.0e-7f;
    thinPlanks.plankGap = 0.0f;
    result = GenerateBackdrop(thinPlanks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(LayoutErrorCode::InvalidParameter, result.error().code);
}

TEST(BackdropTest, AcceptsPlankCountAtLimit) {
    BackdropParameters params;
    params.wallWidth = static_cast<float>(kMaxBackdropPlanks);
    params.plankWidth = 1.0f;
    params.plankGap = 0.0f;
    auto parts = GenerateBackdrop(params);
    ASSERT_TRUE(parts.has_value()) << parts.error().ToString();
    EXPECT_EQ(kMaxBackdropPlanks + 1, parts->size());
}

// =============================================================================
// JSON
// =============================================================================

TEST(BackdropTest, StaticPartJson) {
    auto parts = GenerateBackdrop();
    ASSERT_TRUE(parts.has_value());

    const nlohmann::json j = parts->back().ToJson();
    EXPECT_EQ("wall-opening", j.at("id").get<std::string>());
    ASSERT_EQ(3u, j.at("dimensions").size());
    EXPECT_FLOAT_EQ(3.2f, j.at("dimensions")[0].get<float>());
    ASSERT_EQ(3u, j.at("position").size());
    EXPECT_EQ("#101010", j.at("material").at("color").get<std::string>());
    ASSERT_EQ(3u, j.at("material").at("rgb").size());
    EXPECT_NEAR(16.0f / 255.0f, j.at("material").at("rgb")[1].get<float>(), 1e-6f);
}

TEST(BackdropParametersTest, ApplyJson_PartialOverride) {
    BackdropParameters params;
    ASSERT_TRUE(params.ApplyJson(nlohmann::json{{"wall_width", 12.0}, {"plank_gap", 0.0}}));
    EXPECT_FLOAT_EQ(12.0f, params.wallWidth);
    EXPECT_FLOAT_EQ(0.0f, params.plankGap);
    EXPECT_FLOAT_EQ(16.0f, params.wallHeight);

    EXPECT_FALSE(params.ApplyJson(nlohmann::json{{"wall_width", "wide"}}));
    EXPECT_FALSE(params.ApplyJson(nlohmann::json::array()));
}

TEST(BackdropParametersTest, JsonUsesSnakeCaseKeys) {
    const nlohmann::json j = BackdropParameters{}.ToJson();
    EXPECT_EQ(11u, j.size());
    EXPECT_FLOAT_EQ(0.4f, j.at("plank_width").get<float>());
    EXPECT_FLOAT_EQ(-0.11f, j.at("wall_front_z").get<float>());
}
