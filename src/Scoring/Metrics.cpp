/**
 * @file Metrics.cpp
 * @brief Sub-metrics shared by the strict and lenient scoring policies
 */

#include <KanaReco/Scoring/Metrics.h>
#include <KanaReco/Internal/Geometry.h>
#include <KanaReco/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace Kana::Reco::Scoring {

namespace {

// Lenient stroke count steps
constexpr double STROKE_EXACT = 1.0;
constexpr double STROKE_OFF_BY_ONE = 0.8;
constexpr double STROKE_OFF_BY_TWO = 0.6;
constexpr double STROKE_WITHIN_EXPECTED = 0.4;
constexpr double STROKE_FAR_OFF = 0.2;
constexpr double STROKE_UNEXPECTED = 0.5;

// Lenient feature similarity
constexpr double PARTIAL_FEATURE_WEIGHT = 0.5;
constexpr double FEATURE_BASE_SCORE = 0.2;

// Effort thresholds
constexpr int32_t EFFORT_MIN_POINTS = 10;
constexpr double EFFORT_MIN_SPEED = 0.1;
constexpr double EFFORT_MAX_SPEED = 0.9;
constexpr double EFFORT_MIN_SMOOTHNESS = 0.3;

// Child-friendly bonus thresholds
constexpr double BONUS_COMPLEXITY_DIFF = 0.3;
constexpr double BONUS_MIN_SMOOTHNESS = 0.6;
constexpr double BONUS_MIN_SPEED = 0.3;
constexpr double BONUS_MAX_SPEED = 0.8;

// Reasonable size range (input pixels squared)
constexpr double MIN_REASONABLE_AREA = 500.0;
constexpr double MAX_REASONABLE_AREA = 100000.0;

} // anonymous namespace

// =============================================================================
// Stroke Count
// =============================================================================

double StrokeCountSimilarity(int32_t actual, int32_t expected) {
    if (expected == 0) {
        return actual == 0 ? 1.0 : 0.0;
    }
    const int32_t diff = std::abs(actual - expected);
    const int32_t maxCount = std::max(actual, expected);
    return std::max(0.0, 1.0 - static_cast<double>(diff) / maxCount);
}

double LenientStrokeCountSimilarity(int32_t actual, int32_t expected) {
    if (expected == 0) {
        return actual == 0 ? STROKE_EXACT : STROKE_UNEXPECTED;
    }

    const int32_t diff = std::abs(actual - expected);
    if (diff == 0) return STROKE_EXACT;
    if (diff == 1) return STROKE_OFF_BY_ONE;
    if (diff == 2) return STROKE_OFF_BY_TWO;
    if (diff <= expected) return STROKE_WITHIN_EXPECTED;
    return STROKE_FAR_OFF;
}

// =============================================================================
// Shape Features
// =============================================================================

double FeatureSimilarity(const Feature::ShapeFeatures& actual,
                         const Feature::ShapeFeatures& expected) {
    return static_cast<double>(actual.MatchCount(expected)) / Feature::SHAPE_FEATURE_COUNT;
}

bool IsPartialFeatureMatch(ShapeFeature feature, bool actual, bool expected) {
    if (actual == expected) {
        return false;
    }
    switch (feature) {
        case ShapeFeature::HorizontalLine:
        case ShapeFeature::VerticalLine:
            return actual;
        case ShapeFeature::Curve:
            return true;
    }
    return false;
}

double LenientFeatureSimilarity(const Feature::ShapeFeatures& actual,
                                const Feature::ShapeFeatures& expected) {
    struct Pair {
        ShapeFeature feature;
        bool actual;
        bool expected;
    };
    const Pair pairs[] = {
        {ShapeFeature::HorizontalLine, actual.hasHorizontalLine, expected.hasHorizontalLine},
        {ShapeFeature::VerticalLine,   actual.hasVerticalLine,   expected.hasVerticalLine},
        {ShapeFeature::Curve,          actual.hasCurve,          expected.hasCurve},
    };

    int32_t matches = 0;
    int32_t partial = 0;
    for (const auto& p : pairs) {
        if (p.actual == p.expected) {
            ++matches;
        } else if (IsPartialFeatureMatch(p.feature, p.actual, p.expected)) {
            ++partial;
        }
    }

    const double n = static_cast<double>(Feature::SHAPE_FEATURE_COUNT);
    const double score = matches / n + (partial / n) * PARTIAL_FEATURE_WEIGHT + FEATURE_BASE_SCORE;
    return std::min(1.0, score);
}

bool HasBasicShapeMatch(const Feature::ShapeFeatures& actual,
                        const Feature::ShapeFeatures& expected) {
    return actual.MatchCount(expected) * 2 >= Feature::SHAPE_FEATURE_COUNT;
}

// =============================================================================
// Complexity
// =============================================================================

double ComplexitySimilarity(double actual, double expected) {
    if (!std::isfinite(actual) || !std::isfinite(expected)) {
        return 0.5;
    }
    return std::max(0.0, 1.0 - std::abs(actual - expected));
}

double LenientComplexitySimilarity(double actual, double expected) {
    if (!std::isfinite(actual) || !std::isfinite(expected)) {
        return 0.6;
    }
    const double diff = std::abs(actual - expected);
    if (diff < 0.2) return 1.0;
    if (diff < 0.4) return 0.8;
    if (diff < 0.6) return 0.6;
    return 0.4;
}

// =============================================================================
// Drawing Quality
// =============================================================================

double DrawingSpeed(const StrokeArray& strokes) {
    if (strokes.empty()) {
        return 0.0;
    }

    double totalDistance = 0.0;
    double totalTime = 0.0;
    for (const auto& stroke : strokes) {
        for (size_t i = 1; i < stroke.size(); ++i) {
            const StrokePoint& prev = stroke[i - 1];
            const StrokePoint& curr = stroke[i];
            totalDistance += Internal::Distance(prev, curr);
            if (prev.timestamp && curr.timestamp) {
                totalTime += static_cast<double>(*curr.timestamp - *prev.timestamp);
            }
        }
    }

    if (totalTime <= 0.0) {
        return 0.5;
    }
    return ClampUnit((totalDistance / totalTime) / REFERENCE_DRAWING_SPEED);
}

double Smoothness(const StrokeArray& strokes) {
    double sum = 0.0;
    int32_t counted = 0;

    for (const auto& stroke : strokes) {
        if (stroke.size() < 3) {
            continue;
        }
        std::vector<double> turns = Internal::TurnAngles(stroke);
        if (turns.empty()) {
            continue;
        }
        double strokeSum = 0.0;
        for (double turn : turns) {
            strokeSum += 1.0 - turn / PI;
        }
        sum += strokeSum / static_cast<double>(turns.size());
        ++counted;
    }

    return counted > 0 ? ClampUnit(sum / counted) : 0.0;
}

double EffortScore(const PreprocessedDrawing& drawing) {
    double score = 0.0;

    if (drawing.strokeCount > 0) {
        score += 0.3;
    }
    if (drawing.totalPoints >= EFFORT_MIN_POINTS) {
        score += 0.2;
    }

    const double speed = DrawingSpeed(drawing.normalizedStrokes);
    if (speed > EFFORT_MIN_SPEED && speed < EFFORT_MAX_SPEED) {
        score += 0.2;
    }
    if (Smoothness(drawing.normalizedStrokes) > EFFORT_MIN_SMOOTHNESS) {
        score += 0.3;
    }

    return std::min(1.0, score);
}

double ChildFriendlyBonus(const PreprocessedDrawing& drawing, const CharacterTemplate& tmpl) {
    double bonus = 0.0;

    if (std::abs(drawing.complexity - tmpl.complexity) < BONUS_COMPLEXITY_DIFF) {
        bonus += 0.1;
    }
    if (Smoothness(drawing.normalizedStrokes) > BONUS_MIN_SMOOTHNESS) {
        bonus += 0.05;
    }

    const double speed = DrawingSpeed(drawing.normalizedStrokes);
    if (speed > BONUS_MIN_SPEED && speed < BONUS_MAX_SPEED) {
        bonus += 0.05;
    }
    return bonus;
}

bool IsReasonableSize(const Rect2d& box) {
    const double area = box.Area();
    return area >= MIN_REASONABLE_AREA && area <= MAX_REASONABLE_AREA;
}

} // namespace Kana::Reco::Scoring
