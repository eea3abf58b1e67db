/**
 * @file test_flush_fit.cpp
 * @brief Unit tests for bounding boxes, assembly validation and flush-fit checks
 */

#include <gtest/gtest.h>

#include "assembly/Assembly.hpp"
#include "assembly/FlushFit.hpp"
#include "spatial/AABB.hpp"

#include "utils/TestHelpers.hpp"

#include <string>
#include <vector>

using namespace Unfold;
using namespace Unfold::Test;

namespace {

PartDescriptor MakePart(const std::string& id, const glm::vec3& size, const glm::vec3& center) {
    PartDescriptor part;
    part.id = id;
    part.displayName = id;
    part.dimensions = size;
    part.assembledPosition = center;
    part.explodedPosition = center + glm::vec3(0.0f, 0.0f, 1.0f);
    part.window = AnimationWindow{0.0f, 1.0f};
    return part;
}

} // namespace

// =============================================================================
// AABB Tests
// =============================================================================

TEST(AABBTest, FromCenterSize) {
    const AABB box = AABB::FromCenterSize(glm::vec3(1.0f, 0.0f, -1.0f), glm::vec3(2.0f, 4.0f, 6.0f));

    EXPECT_VEC3_EQ(glm::vec3(0.0f, -2.0f, -4.0f), box.min);
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 2.0f, 2.0f), box.max);
    EXPECT_VEC3_EQ(glm::vec3(1.0f, 0.0f, -1.0f), box.GetCenter());
    EXPECT_FLOAT_EQ(48.0f, box.GetVolume());
}

TEST(AABBTest, DefaultIsInvalidUntilExpanded) {
    AABB box;
    EXPECT_FALSE(box.IsValid());

    box.Expand(AABB(glm::vec3(0.0f), glm::vec3(1.0f)));
    box.Expand(AABB(glm::vec3(-1.0f), glm::vec3(0.5f)));
    EXPECT_TRUE(box.IsValid());
    EXPECT_VEC3_EQ(glm::vec3(-1.0f), box.min);
    EXPECT_VEC3_EQ(glm::vec3(1.0f), box.max);
}

TEST(AABBTest, OverlapAlong) {
    const AABB a(glm::vec3(0.0f), glm::vec3(2.0f));
    const AABB b(glm::vec3(1.5f, 2.0f, 3.0f), glm::vec3(4.0f));

    EXPECT_FLOAT_EQ(0.5f, AABB::OverlapAlong(a, b, Axis::X));
    EXPECT_FLOAT_EQ(0.0f, AABB::OverlapAlong(a, b, Axis::Y));
    EXPECT_FLOAT_EQ(-1.0f, AABB::OverlapAlong(a, b, Axis::Z));
}

TEST(AABBTest, IntersectionVolume) {
    const AABB a(glm::vec3(0.0f), glm::vec3(2.0f));
    const AABB inside(glm::vec3(1.0f), glm::vec3(3.0f));
    const AABB touching(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(3.0f, 2.0f, 2.0f));

    EXPECT_FLOAT_EQ(1.0f, AABB::IntersectionVolume(a, inside));
    EXPECT_FLOAT_EQ(0.0f, AABB::IntersectionVolume(a, touching));
}

// =============================================================================
// Assembly Validation
// =============================================================================

TEST(AssemblyTest, CreateAndFind) {
    auto assembly = Assembly::Create({
        MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f)),
        MakePart("b", glm::vec3(1.0f), glm::vec3(1.0f, 0.0f, 0.0f))
    });
    ASSERT_TRUE(assembly.has_value()) << assembly.error().ToString();

    EXPECT_EQ(2u, assembly->GetPartCount());
    ASSERT_NE(nullptr, assembly->Find("b"));
    EXPECT_EQ("b", assembly->Find("b")->id);
    EXPECT_EQ(nullptr, assembly->Find("missing"));

    const nlohmann::json j = assembly->ToJson();
    ASSERT_EQ(2u, j.at("parts").size());
    EXPECT_EQ("a", j["parts"][0]["id"].get<std::string>());
    EXPECT_EQ("#ffffff", j["parts"][0]["material"]["color"].get<std::string>());
}

TEST(AssemblyTest, RejectsEmptyId) {
    auto assembly = Assembly::Create({MakePart("", glm::vec3(1.0f), glm::vec3(0.0f))});
    ASSERT_FALSE(assembly.has_value());
    EXPECT_EQ(LayoutErrorCode::EmptyId, assembly.error().code);
}

TEST(AssemblyTest, RejectsDuplicateId) {
    auto assembly = Assembly::Create({
        MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f)),
        MakePart("a", glm::vec3(1.0f), glm::vec3(5.0f))
    });
    ASSERT_FALSE(assembly.has_value());
    EXPECT_EQ(LayoutErrorCode::DuplicateId, assembly.error().code);
}

TEST(AssemblyTest, RejectsNonPositiveDimensions) {
    auto assembly = Assembly::Create({MakePart("flat", glm::vec3(1.0f, 0.0f, 1.0f), glm::vec3(0.0f))});
    ASSERT_FALSE(assembly.has_value());
    EXPECT_EQ(LayoutErrorCode::InvalidDimensions, assembly.error().code);
}

TEST(AssemblyTest, RejectsInvalidWindows) {
    PartDescriptor lateStart = MakePart("late", glm::vec3(1.0f), glm::vec3(0.0f));
    lateStart.window.startOffset = 1.0f;
    EXPECT_EQ(LayoutErrorCode::InvalidWindow, Assembly::Create({lateStart}).error().code);

    PartDescriptor noSpan = MakePart("instant", glm::vec3(1.0f), glm::vec3(0.0f));
    noSpan.window.span = 0.0f;
    EXPECT_EQ(LayoutErrorCode::InvalidWindow, Assembly::Create({noSpan}).error().code);
}

TEST(AssemblyTest, AcceptsWindowEndingPastOne) {
    PartDescriptor part = MakePart("slow", glm::vec3(1.0f), glm::vec3(0.0f));
    part.window = AnimationWindow{0.6f, 0.6f};
    EXPECT_FALSE(part.window.ReachesEnd());
    EXPECT_TRUE(Assembly::Create({part}).has_value());
}

TEST(AssemblyTest, RejectsContactWithUnknownPart) {
    auto assembly = Assembly::Create(
        {MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f))},
        {FlushContact{"a", "ghost", Axis::X, {}}});
    ASSERT_FALSE(assembly.has_value());
    EXPECT_EQ(LayoutErrorCode::UnknownContactPart, assembly.error().code);
}

// =============================================================================
// Flush Contacts
// =============================================================================

class FlushContactTest : public ::testing::Test {
protected:
    // Two unit cubes side by side along X
    AABB left = AABB::FromCenterSize(glm::vec3(-0.5f, 0.0f, 0.0f), glm::vec3(1.0f));
    AABB right = AABB::FromCenterSize(glm::vec3(0.5f, 0.0f, 0.0f), glm::vec3(1.0f));
    FlushContact contact{"left", "right", Axis::X, {{Axis::Y, Bound::Both}, {Axis::Z, Bound::Both}}};
    std::vector<FlushViolation> violations;
};

TEST_F(FlushContactTest, TouchingFacesPass) {
    EXPECT_TRUE(FlushFit::CheckContact(contact, left, right, violations));
    EXPECT_TRUE(violations.empty());
}

TEST_F(FlushContactTest, DetectsGap) {
    right = AABB::FromCenterSize(glm::vec3(0.51f, 0.0f, 0.0f), glm::vec3(1.0f));
    EXPECT_FALSE(FlushFit::CheckContact(contact, left, right, violations));
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(FlushViolationKind::Gap, violations[0].kind);
    EXPECT_NEAR(0.01f, violations[0].amount, 1e-5f);
}

TEST_F(FlushContactTest, DetectsOverlap) {
    right = AABB::FromCenterSize(glm::vec3(0.4f, 0.0f, 0.0f), glm::vec3(1.0f));
    EXPECT_FALSE(FlushFit::CheckContact(contact, left, right, violations));
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(FlushViolationKind::Overlap, violations[0].kind);
}

TEST_F(FlushContactTest, DetectsFacesThatDoNotMeet) {
    right = AABB::FromCenterSize(glm::vec3(0.5f, 2.0f, 0.0f), glm::vec3(1.0f));
    contact.aligned.clear();
    EXPECT_FALSE(FlushFit::CheckContact(contact, left, right, violations));
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(FlushViolationKind::NoSharedFace, violations[0].kind);
    EXPECT_EQ(Axis::Y, violations[0].axis);
}

TEST_F(FlushContactTest, DetectsExtentMismatch) {
    right = AABB::FromCenterSize(glm::vec3(0.5f, 0.0f, 0.0f), glm::vec3(1.0f, 0.8f, 1.0f));
    EXPECT_FALSE(FlushFit::CheckContact(contact, left, right, violations));
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(FlushViolationKind::ExtentMismatch, violations[0].kind);
    EXPECT_NEAR(0.1f, violations[0].amount, 1e-5f);
}

TEST_F(FlushContactTest, SingleBoundAlignment) {
    // Shorter right cube sharing only the bottom face plane
    right = AABB(glm::vec3(0.0f, -0.5f, -0.5f), glm::vec3(1.0f, 0.2f, 0.5f));
    contact.aligned = {{Axis::Y, Bound::Min}, {Axis::Z, Bound::Both}};
    EXPECT_TRUE(FlushFit::CheckContact(contact, left, right, violations));

    contact.aligned = {{Axis::Y, Bound::Max}};
    EXPECT_FALSE(FlushFit::CheckContact(contact, left, right, violations));
}

TEST_F(FlushContactTest, ToleranceAbsorbsRounding) {
    right = AABB::FromCenterSize(glm::vec3(0.5f + 2e-6f, 0.0f, 0.0f), glm::vec3(1.0f));
    EXPECT_TRUE(FlushFit::CheckContact(contact, left, right, violations));
}

// =============================================================================
// Whole-Assembly Verification
// =============================================================================

TEST(FlushFitVerifyTest, ReportsInterpenetration) {
    auto assembly = Assembly::Create({
        MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f)),
        MakePart("b", glm::vec3(1.0f), glm::vec3(0.5f, 0.0f, 0.0f)),
        MakePart("c", glm::vec3(1.0f), glm::vec3(5.0f, 0.0f, 0.0f))
    });
    ASSERT_TRUE(assembly.has_value());

    const FlushFitReport report = FlushFit::Verify(*assembly);
    EXPECT_FALSE(report.IsFlush());
    ASSERT_EQ(1u, report.interpenetrations.size());
    EXPECT_EQ("a", report.interpenetrations[0].first);
    EXPECT_EQ("b", report.interpenetrations[0].second);
    EXPECT_NEAR(0.5f, report.interpenetrations[0].volume, 1e-5f);
}

TEST(FlushFitVerifyTest, TouchingPartsAreFlush) {
    auto assembly = Assembly::Create(
        {MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f)),
         MakePart("b", glm::vec3(1.0f), glm::vec3(1.0f, 0.0f, 0.0f))},
        {FlushContact{"a", "b", Axis::X, {{Axis::Y, Bound::Both}}}});
    ASSERT_TRUE(assembly.has_value());

    const FlushFitReport report = FlushFit::Verify(*assembly);
    EXPECT_TRUE(report.IsFlush()) << report.GetSummary();
    EXPECT_EQ("flush", report.GetSummary());
}

TEST(FlushFitVerifyTest, ReportsBrokenContact) {
    auto assembly = Assembly::Create(
        {MakePart("a", glm::vec3(1.0f), glm::vec3(0.0f)),
         MakePart("b", glm::vec3(1.0f), glm::vec3(1.5f, 0.0f, 0.0f))},
        {FlushContact{"a", "b", Axis::X, {}}});
    ASSERT_TRUE(assembly.has_value());

    const FlushFitReport report = FlushFit::Verify(*assembly);
    ASSERT_EQ(1u, report.violations.size());
    EXPECT_EQ(FlushViolationKind::Gap, report.violations[0].kind);
    EXPECT_NE(std::string::npos, report.GetSummary().find("a | b along X: gap"));
}
