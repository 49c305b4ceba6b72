/**
 * @file test_scoring.cpp
 * @brief Unit tests for scoring sub-metrics and calibration policies
 */

#include <KanaReco/Scoring/Metrics.h>
#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Scoring/ScoringTypes.h>
#include <KanaReco/Template/TemplateRegistry.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>

using namespace Kana::Reco;
using namespace Kana::Reco::Scoring;
using Kana::Reco::Feature::ShapeFeatures;
using Kana::Reco::Preprocess::PreprocessedDrawing;
using Kana::Reco::Template::CharacterTemplate;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

PreprocessedDrawing MakeDrawing(int32_t strokes, int32_t points, ShapeFeatures features,
                                double complexity, Rect2d box) {
    PreprocessedDrawing d;
    d.strokeCount = strokes;
    d.totalPoints = points;
    d.features = features;
    d.complexity = complexity;
    d.boundingBox = box;
    return d;
}

CharacterTemplate MakeTemplate(int32_t strokes, ShapeFeatures features, double complexity) {
    CharacterTemplate t;
    t.strokeCount = strokes;
    t.features = features;
    t.complexity = complexity;
    return t;
}

} // anonymous namespace

// =============================================================================
// Stroke Count
// =============================================================================

TEST(StrokeCountSimilarityTest, Strict) {
    EXPECT_DOUBLE_EQ(StrokeCountSimilarity(3, 3), 1.0);
    EXPECT_NEAR(StrokeCountSimilarity(2, 3), 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(StrokeCountSimilarity(6, 3), 0.5);
    EXPECT_DOUBLE_EQ(StrokeCountSimilarity(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(StrokeCountSimilarity(2, 0), 0.0);
}

TEST(StrokeCountSimilarityTest, LenientSteps) {
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(3, 3), 1.0);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(2, 3), 0.8);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(5, 3), 0.6);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(1, 4), 0.4);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(10, 3), 0.2);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(LenientStrokeCountSimilarity(2, 0), 0.5);
}

// =============================================================================
// Shape Features
// =============================================================================

TEST(FeatureSimilarityTest, Strict) {
    EXPECT_DOUBLE_EQ(FeatureSimilarity({true, true, true}, {true, true, true}), 1.0);
    EXPECT_NEAR(FeatureSimilarity({true, true, true}, {true, false, false}), 1.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(FeatureSimilarity({false, false, false}, {true, true, true}), 0.0);
}

TEST(FeatureSimilarityTest, PartialMatches) {
    // A drawn line earns partial credit, a missing one does not
    EXPECT_TRUE(IsPartialFeatureMatch(ShapeFeature::HorizontalLine, true, false));
    EXPECT_FALSE(IsPartialFeatureMatch(ShapeFeature::HorizontalLine, false, true));
    EXPECT_TRUE(IsPartialFeatureMatch(ShapeFeature::VerticalLine, true, false));
    EXPECT_FALSE(IsPartialFeatureMatch(ShapeFeature::VerticalLine, false, true));

    EXPECT_TRUE(IsPartialFeatureMatch(ShapeFeature::Curve, false, true));
    EXPECT_TRUE(IsPartialFeatureMatch(ShapeFeature::Curve, true, false));

    // Exact matches are not partial
    EXPECT_FALSE(IsPartialFeatureMatch(ShapeFeature::Curve, true, true));
}

TEST(FeatureSimilarityTest, Lenient) {
    EXPECT_DOUBLE_EQ(LenientFeatureSimilarity({true, false, true}, {true, false, true}), 1.0);

    // Only the curve mismatch is partial: 0.5 / 3 + 0.2
    EXPECT_NEAR(LenientFeatureSimilarity({false, false, false}, {true, true, true}),
                0.5 / 3.0 + 0.2, 1e-12);

    // Three partial matches: 0.5 + 0.2
    EXPECT_NEAR(LenientFeatureSimilarity({true, true, false}, {false, false, true}), 0.7, 1e-12);

    // One exact, one partial line, one missing line: 1/3 + 0.5/3 + 0.2
    EXPECT_NEAR(LenientFeatureSimilarity({true, false, true}, {false, true, true}),
                1.0 / 3.0 + 0.5 / 3.0 + 0.2, 1e-12);
}

TEST(FeatureSimilarityTest, BasicShapeMatch) {
    EXPECT_TRUE(HasBasicShapeMatch({true, true, false}, {true, true, true}));
    EXPECT_TRUE(HasBasicShapeMatch({true, true, true}, {true, true, true}));
    EXPECT_FALSE(HasBasicShapeMatch({true, false, false}, {true, true, true}));
}

// =============================================================================
// Complexity
// =============================================================================

TEST(ComplexitySimilarityTest, Strict) {
    EXPECT_NEAR(ComplexitySimilarity(0.5, 0.7), 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(ComplexitySimilarity(0.0, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(ComplexitySimilarity(0.5, kNaN), 0.5);
    EXPECT_DOUBLE_EQ(ComplexitySimilarity(kInf, 0.5), 0.5);
}

TEST(ComplexitySimilarityTest, LenientBands) {
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.5, 0.45), 1.0);
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.55, 0.2), 0.8);
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.9, 0.4), 0.6);
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.0, 0.9), 0.4);
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.0, -7.0), 0.4);
    EXPECT_DOUBLE_EQ(LenientComplexitySimilarity(0.5, kNaN), 0.6);
}

// =============================================================================
// Drawing Quality
// =============================================================================

TEST(DrawingQualityTest, Speed) {
    EXPECT_DOUBLE_EQ(DrawingSpeed({}), 0.0);

    // No timestamps: neutral
    EXPECT_DOUBLE_EQ(DrawingSpeed({{StrokePoint(0, 0), StrokePoint(1, 0)}}), 0.5);

    // 1 unit in 200 ms: 0.005 / 0.01
    EXPECT_NEAR(DrawingSpeed({{StrokePoint(0, 0, 1000), StrokePoint(1, 0, 1200)}}), 0.5, 1e-12);

    // 1 unit in 25 ms
    EXPECT_NEAR(DrawingSpeed({{StrokePoint(0, 0, 0), StrokePoint(0.5, 0, 10),
                               StrokePoint(1, 0, 25)}}), 1.0, 1e-12);

    // 0.5 units in 250 ms
    EXPECT_NEAR(DrawingSpeed({{StrokePoint(0, 0, 0), StrokePoint(0, 0.5, 250)}}), 0.2, 1e-12);
}

TEST(DrawingQualityTest, Smoothness) {
    EXPECT_DOUBLE_EQ(Smoothness({}), 0.0);
    EXPECT_DOUBLE_EQ(Smoothness({{StrokePoint(0, 0), StrokePoint(1, 1)}}), 0.0);

    EXPECT_NEAR(Smoothness({{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)}}), 1.0, 1e-12);
    EXPECT_NEAR(Smoothness({{StrokePoint(0, 0), StrokePoint(1, 0), StrokePoint(1, 1)}}), 0.5, 1e-12);

    // Averaged per stroke, two-point strokes ignored
    EXPECT_NEAR(Smoothness({{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)},
                            {StrokePoint(0, 0), StrokePoint(1, 0), StrokePoint(1, 1)},
                            {StrokePoint(0, 0), StrokePoint(1, 1)}}), 0.75, 1e-12);
}

TEST(DrawingQualityTest, EffortScore) {
    PreprocessedDrawing d = MakeDrawing(1, 10, {true, false, false}, 0.2, Rect2d{0, 0, 100, 10});
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)}};

    // Stroke, 10 points, neutral speed 0.5, smoothness 1.0
    EXPECT_DOUBLE_EQ(EffortScore(d), 1.0);

    d.totalPoints = 3;
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(1, 0)}};
    // Stroke and neutral speed only
    EXPECT_NEAR(EffortScore(d), 0.5, 1e-12);

    PreprocessedDrawing empty;
    EXPECT_DOUBLE_EQ(EffortScore(empty), 0.0);
}

TEST(DrawingQualityTest, ChildFriendlyBonus) {
    CharacterTemplate ku = MakeTemplate(1, {false, false, true}, 0.2);

    PreprocessedDrawing d = MakeDrawing(1, 3, {}, 0.25, Rect2d{0, 0, 50, 50});
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)}};
    // Complexity close, smooth, neutral speed 0.5
    EXPECT_NEAR(ChildFriendlyBonus(d, ku), 0.2, 1e-12);

    d.complexity = 0.9;
    d.normalizedStrokes = {{StrokePoint(0, 0, 0), StrokePoint(1, 0, 10)}};
    EXPECT_DOUBLE_EQ(ChildFriendlyBonus(d, ku), 0.0);
}

TEST(DrawingQualityTest, ReasonableSize) {
    EXPECT_TRUE(IsReasonableSize(Rect2d{0, 0, 50, 10}));
    EXPECT_FALSE(IsReasonableSize(Rect2d{0, 0, 49, 10}));
    EXPECT_TRUE(IsReasonableSize(Rect2d{0, 0, 1000, 100}));
    EXPECT_FALSE(IsReasonableSize(Rect2d{0, 0, 1000, 101}));
}

// =============================================================================
// Encouragement
// =============================================================================

TEST(EncouragementTest, Levels) {
    EXPECT_EQ(GetEncouragementLevel(0.9), EncouragementLevel::Excellent);
    EXPECT_EQ(GetEncouragementLevel(0.5), EncouragementLevel::Excellent);
    EXPECT_EQ(GetEncouragementLevel(0.49), EncouragementLevel::Fair);
    EXPECT_EQ(GetEncouragementLevel(0.2), EncouragementLevel::Fair);
    EXPECT_EQ(GetEncouragementLevel(0.19), EncouragementLevel::Poor);
    EXPECT_EQ(GetEncouragementLevel(0.0), EncouragementLevel::Poor);

    EXPECT_EQ(GetEncouragementLevel(0.45, 0.4, 0.1), EncouragementLevel::Excellent);

    EXPECT_EQ(std::string(ToString(EncouragementLevel::Fair)), "fair");
    EXPECT_EQ(std::string(ToString(RecognitionMode::Lenient)), "lenient");
}

// =============================================================================
// Strict Policy
// =============================================================================

class StrictPolicyTest : public ::testing::Test {
protected:
    StrictPolicy policy_;
    CharacterTemplate a_ = *Template::FindRegisteredTemplate("あ");
};

TEST_F(StrictPolicyTest, WeightedSimilarity) {
    PreprocessedDrawing exact = MakeDrawing(3, 20, {true, true, true}, 0.7, Rect2d{0, 0, 100, 100});
    EXPECT_NEAR(policy_.Similarity(exact, a_), 1.0, 1e-12);

    // stroke 2/3, feature 1/3, complexity 0.8
    PreprocessedDrawing partial = MakeDrawing(2, 20, {true, false, false}, 0.5, Rect2d{0, 0, 100, 100});
    EXPECT_NEAR(policy_.Similarity(partial, a_),
                (2.0 / 3.0) * 0.3 + (1.0 / 3.0) * 0.5 + 0.8 * 0.2, 1e-12);
}

TEST_F(StrictPolicyTest, ConfidencePenalties) {
    PreprocessedDrawing d = MakeDrawing(3, 20, {}, 0.7, Rect2d{0, 0, 100, 100});
    EXPECT_NEAR(policy_.Confidence(0.8, d, a_), 0.8, 1e-12);

    d.totalPoints = 5;
    EXPECT_NEAR(policy_.Confidence(0.8, d, a_), 0.4, 1e-12);

    d.boundingBox = Rect2d{0, 0, 5, 10};
    EXPECT_NEAR(policy_.Confidence(0.8, d, a_), 0.28, 1e-12);

    d.totalPoints = 2000;
    d.boundingBox = Rect2d{0, 0, 300, 200};
    EXPECT_NEAR(policy_.Confidence(0.8, d, a_), 0.8 * 0.8 * 0.8, 1e-12);

    d.strokeCount = 0;
    EXPECT_DOUBLE_EQ(policy_.Confidence(0.8, d, a_), 0.0);
}

TEST_F(StrictPolicyTest, RecognitionThresholdIsExclusive) {
    EXPECT_FALSE(policy_.IsRecognized(0.3));
    EXPECT_TRUE(policy_.IsRecognized(0.31));
    EXPECT_EQ(policy_.Mode(), RecognitionMode::Strict);

    StrictPolicy custom(0.6);
    EXPECT_FALSE(custom.IsRecognized(0.55));
}

// =============================================================================
// Lenient Policy
// =============================================================================

class LenientPolicyTest : public ::testing::Test {
protected:
    LenientPolicy policy_;
    CharacterTemplate ku_ = *Template::FindRegisteredTemplate("く");
};

TEST_F(LenientPolicyTest, WeightedSimilarity) {
    PreprocessedDrawing d = MakeDrawing(1, 10, {false, false, true}, 0.2, Rect2d{0, 0, 60, 60});
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)}};

    // stroke 1.0, feature min(1, 1.2), complexity 1.0, effort 1.0
    EXPECT_NEAR(policy_.Similarity(d, ku_), 1.0, 1e-12);

    d.strokeCount = 2;
    d.features = {true, false, false};
    // stroke 0.8, feature 1 exact + 2 partial (drawn line, curve) + 0.2,
    // complexity 1.0, effort 1.0
    double expected = 0.8 * 0.2 + (1.0 / 3.0 + (2.0 / 3.0) * 0.5 + 0.2) * 0.4 + 0.15 + 0.25;
    EXPECT_NEAR(policy_.Similarity(d, ku_), expected, 1e-12);
}

TEST_F(LenientPolicyTest, ConfidenceFloorAndBonuses) {
    PreprocessedDrawing d = MakeDrawing(1, 3, {true, true, false}, 0.9, Rect2d{0, 0, 10, 10});
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(1, 1)}};

    // Floor 0.25, speed bonus 0.05, stroke ratio bonus 0.1
    EXPECT_NEAR(policy_.Confidence(0.0, d, ku_), 0.4, 1e-12);

    // Matching shape and reasonable size add 0.15 and 0.05
    d.features = {false, false, true};
    d.boundingBox = Rect2d{0, 0, 40, 40};
    EXPECT_NEAR(policy_.Confidence(0.0, d, ku_), 0.6, 1e-12);
}

TEST_F(LenientPolicyTest, ConfidenceClampedToOne) {
    PreprocessedDrawing d = MakeDrawing(1, 30, {false, false, true}, 0.2, Rect2d{0, 0, 60, 60});
    d.normalizedStrokes = {{StrokePoint(0, 0), StrokePoint(0.5, 0), StrokePoint(1, 0)}};
    EXPECT_DOUBLE_EQ(policy_.Confidence(0.95, d, ku_), 1.0);
}

TEST_F(LenientPolicyTest, RecognitionThresholdIsInclusive) {
    EXPECT_TRUE(policy_.IsRecognized(0.2));
    EXPECT_FALSE(policy_.IsRecognized(0.19));
    EXPECT_EQ(policy_.Mode(), RecognitionMode::Lenient);
}

// =============================================================================
// Shared Properties
// =============================================================================

TEST(ScoringPolicyTest, ValuesStayInUnitRangeForAdversarialTemplates) {
    std::unique_ptr<ScoringPolicy> policies[] = {
        CreateScoringPolicy(RecognitionMode::Strict),
        CreateScoringPolicy(RecognitionMode::Lenient),
    };
    const CharacterTemplate templates[] = {
        MakeTemplate(3, {true, true, true}, 50.0),
        MakeTemplate(1, {false, false, true}, -50.0),
        MakeTemplate(0, {false, false, false}, 0.0),
        MakeTemplate(40, {true, false, true}, 1e9),
        MakeTemplate(2, {false, true, false}, kNaN),
    };
    const PreprocessedDrawing drawings[] = {
        MakeDrawing(1, 2, {}, 0.0, Rect2d{0, 0, 1, 1}),
        MakeDrawing(3, 20, {true, true, true}, 0.7, Rect2d{0, 0, 100, 100}),
        MakeDrawing(25, 5000, {true, true, true}, 1.0, Rect2d{0, 0, 1000, 1000}),
    };

    for (const auto& policy : policies) {
        for (const auto& tmpl : templates) {
            for (const auto& d : drawings) {
                double sim = policy->Similarity(d, tmpl);
                double conf = policy->Confidence(sim, d, tmpl);
                EXPECT_GE(sim, 0.0);
                EXPECT_LE(sim, 1.0);
                EXPECT_GE(conf, 0.0);
                EXPECT_LE(conf, 1.0);
            }
        }
    }
}

TEST(ScoringPolicyTest, FactoryHonorsThreshold) {
    auto lenient = CreateScoringPolicy(RecognitionMode::Lenient, 0.5);
    EXPECT_EQ(lenient->Mode(), RecognitionMode::Lenient);
    EXPECT_FALSE(lenient->IsRecognized(0.4));
    EXPECT_TRUE(lenient->IsRecognized(0.5));

    auto strict = CreateScoringPolicy(RecognitionMode::Strict);
    EXPECT_EQ(strict->Mode(), RecognitionMode::Strict);
}
