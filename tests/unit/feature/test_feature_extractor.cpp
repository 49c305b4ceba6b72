/**
 * @file test_feature_extractor.cpp
 * @brief Unit tests for shape feature extraction and complexity
 */

#include <KanaReco/Feature/FeatureExtractor.h>
#include <KanaReco/Core/Constants.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace Kana::Reco;
using namespace Kana::Reco::Feature;

namespace {

// Stroke through the given unit-space points
Stroke Path(std::initializer_list<std::pair<double, double>> pts) {
    Stroke stroke;
    for (const auto& p : pts) {
        stroke.emplace_back(p.first, p.second);
    }
    return stroke;
}

} // anonymous namespace

// =============================================================================
// ShapeFeatures Tests
// =============================================================================

TEST(ShapeFeaturesTest, MatchCount) {
    ShapeFeatures a{true, false, true};
    ShapeFeatures b{true, true, false};

    EXPECT_EQ(a.MatchCount(a), 3);
    EXPECT_EQ(a.MatchCount(b), 1);
    EXPECT_EQ(b.MatchCount(ShapeFeatures{}), 1);
    EXPECT_TRUE(a == ShapeFeatures(a));
    EXPECT_TRUE(a != b);
}

// =============================================================================
// Line Detection
// =============================================================================

TEST(ExtractFeaturesTest, HorizontalSegment) {
    ShapeFeatures f = ExtractFeatures({Path({{0.0, 0.5}, {0.2, 0.5}})});
    EXPECT_TRUE(f.hasHorizontalLine);
    EXPECT_FALSE(f.hasVerticalLine);
    EXPECT_FALSE(f.hasCurve);
}

TEST(ExtractFeaturesTest, VerticalSegment) {
    ShapeFeatures f = ExtractFeatures({Path({{0.5, 0.0}, {0.52, 0.3}})});
    EXPECT_FALSE(f.hasHorizontalLine);
    EXPECT_TRUE(f.hasVerticalLine);
}

TEST(ExtractFeaturesTest, SlantedSegmentIsNeitherLine) {
    ShapeFeatures f = ExtractFeatures({Path({{0.0, 0.5}, {0.2, 0.56}})});
    EXPECT_FALSE(f.hasHorizontalLine);
    EXPECT_FALSE(f.hasVerticalLine);
}

TEST(ExtractFeaturesTest, ShortSegmentIsIgnored) {
    ShapeFeatures f = ExtractFeatures({Path({{0.0, 0.0}, {0.08, 0.0}, {0.16, 0.0}})});
    EXPECT_FALSE(f.hasHorizontalLine);
}

// =============================================================================
// Curve Detection
// =============================================================================

TEST(ExtractFeaturesTest, SharpTurnIsCurve) {
    ShapeFeatures f = ExtractFeatures({Path({{0.0, 0.0}, {0.4, 0.0}, {0.4, 0.4}})});
    EXPECT_TRUE(f.hasCurve);
}

TEST(ExtractFeaturesTest, GentleTurnIsNotCurve) {
    // 30 degree heading change
    const double c = std::cos(PI / 6.0) * 0.4;
    const double s = std::sin(PI / 6.0) * 0.4;
    ShapeFeatures f = ExtractFeatures({Path({{0.0, 0.0}, {0.4, 0.0}, {0.4 + c, s}})});
    EXPECT_FALSE(f.hasCurve);
}

TEST(ExtractFeaturesTest, TurnAcrossAngleSeamIsMeasuredCorrectly) {
    // West then north-west: headings near +PI and -PI differ by a small angle
    ShapeFeatures f = ExtractFeatures({Path({{0.8, 0.5}, {0.4, 0.501}, {0.0, 0.49}})});
    EXPECT_FALSE(f.hasCurve);
}

TEST(ExtractFeaturesTest, EmptyInput) {
    ShapeFeatures f = ExtractFeatures({});
    EXPECT_FALSE(f.hasHorizontalLine);
    EXPECT_FALSE(f.hasVerticalLine);
    EXPECT_FALSE(f.hasCurve);
}

// =============================================================================
// Complexity
// =============================================================================

TEST(ComplexityTest, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(CalculateComplexity({}), 0.0);
}

TEST(ComplexityTest, StraightLine) {
    // Length 1 of 4, no direction changes
    double c = CalculateComplexity({Path({{0.0, 0.0}, {0.5, 0.0}, {1.0, 0.0}})});
    EXPECT_NEAR(c, 0.125, 1e-12);
}

TEST(ComplexityTest, SaturatesAtOne) {
    Stroke zigzag;
    for (int32_t i = 0; i < 24; ++i) {
        zigzag.emplace_back(i * 0.04, (i % 2 == 0) ? 0.0 : 1.0);
    }
    double c = CalculateComplexity({zigzag});
    EXPECT_DOUBLE_EQ(c, 1.0);
}

TEST(ComplexityTest, CountsDirectionChanges) {
    // Square outline: length 4, three 90 degree corners
    double c = CalculateComplexity({Path({{0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0}})});
    EXPECT_NEAR(c, (1.0 + 0.3) / 2.0, 1e-12);
}
