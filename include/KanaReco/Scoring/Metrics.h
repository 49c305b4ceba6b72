#pragma once

/**
 * @file Metrics.h
 * @brief Sub-metrics shared by the strict and lenient scoring policies
 *
 * Provides:
 * - Stroke count, feature and complexity similarity (strict and lenient forms)
 * - Drawing quality signals: speed, smoothness, effort
 * - Lenient confidence helpers: child-friendly bonus, basic shape match, size check
 *
 * Every function returns a value in [0, 1] unless stated otherwise.
 */

#include <KanaReco/Core/Types.h>
#include <KanaReco/Feature/FeatureExtractor.h>
#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Template/CharacterTemplate.h>

#include <cstdint>

namespace Kana::Reco::Scoring {

using Preprocess::PreprocessedDrawing;
using Template::CharacterTemplate;

// =============================================================================
// Stroke Count
// =============================================================================

/**
 * @brief 1 - |actual - expected| / max(actual, expected)
 *
 * 1 if both are 0, 0 if only expected is 0.
 */
double StrokeCountSimilarity(int32_t actual, int32_t expected);

/**
 * @brief Step function on the stroke count difference
 *
 * diff 0 -> 1.0, 1 -> 0.8, 2 -> 0.6, <= expected -> 0.4, otherwise 0.2.
 * With expected 0: 1.0 if actual is 0, otherwise 0.5.
 */
double LenientStrokeCountSimilarity(int32_t actual, int32_t expected);

// =============================================================================
// Shape Features
// =============================================================================

/**
 * @brief Fraction of the three boolean descriptors that match exactly
 */
double FeatureSimilarity(const Feature::ShapeFeatures& actual,
                         const Feature::ShapeFeatures& expected);

/**
 * @brief Descriptor identifiers for partial matching
 */
enum class ShapeFeature {
    HorizontalLine,
    VerticalLine,
    Curve
};

/**
 * @brief Whether a mismatched descriptor still earns partial credit
 *
 * A drawn line (horizontal or vertical) counts partially; a curve
 * expectation is always partially satisfied.
 */
bool IsPartialFeatureMatch(ShapeFeature feature, bool actual, bool expected);

/**
 * @brief Exact matches + half credit for partial matches + 0.2 base, capped at 1
 */
double LenientFeatureSimilarity(const Feature::ShapeFeatures& actual,
                                const Feature::ShapeFeatures& expected);

/**
 * @brief True when at least half of the descriptors match (2 of 3)
 */
bool HasBasicShapeMatch(const Feature::ShapeFeatures& actual,
                        const Feature::ShapeFeatures& expected);

// =============================================================================
// Complexity
// =============================================================================

/**
 * @brief 1 - |actual - expected|, floored at 0; 0.5 if either is non-finite
 */
double ComplexitySimilarity(double actual, double expected);

/**
 * @brief Banded: diff < 0.2 -> 1.0, < 0.4 -> 0.8, < 0.6 -> 0.6, else 0.4
 *
 * 0.6 if either value is non-finite.
 */
double LenientComplexitySimilarity(double actual, double expected);

// =============================================================================
// Drawing Quality
// =============================================================================

/// Normalized path length per millisecond that maps to speed 1.0
constexpr double REFERENCE_DRAWING_SPEED = 0.01;

/**
 * @brief Drawing speed in [0, 1]
 *
 * Total path length divided by total elapsed time between timestamped
 * consecutive points, relative to REFERENCE_DRAWING_SPEED and clipped.
 * Returns 0.5 when no elapsed time is available and 0 for no strokes.
 */
double DrawingSpeed(const StrokeArray& strokes);

/**
 * @brief Mean local smoothness in [0, 1]
 *
 * For each stroke with at least 3 points, the mean of 1 - turn / PI over
 * its vertices; averaged over those strokes. 0 if there are none.
 */
double Smoothness(const StrokeArray& strokes);

/**
 * @brief Effort score in [0, 1]
 *
 * +0.3 any stroke, +0.2 at least 10 points, +0.2 speed in (0.1, 0.9),
 * +0.3 smoothness above 0.3.
 */
double EffortScore(const PreprocessedDrawing& drawing);

/**
 * @brief Bonus for child drawing characteristics (0 to 0.2)
 *
 * +0.1 complexity within 0.3 of the template, +0.05 smoothness above 0.6,
 * +0.05 speed in (0.3, 0.8).
 */
double ChildFriendlyBonus(const PreprocessedDrawing& drawing, const CharacterTemplate& tmpl);

/**
 * @brief Bounding box area within [500, 100000]
 */
bool IsReasonableSize(const Rect2d& box);

} // namespace Kana::Reco::Scoring
