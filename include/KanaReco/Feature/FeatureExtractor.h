#pragma once

/**
 * @file FeatureExtractor.h
 * @brief Shape descriptors of normalized strokes
 *
 * Derives three boolean descriptors (horizontal line, vertical line,
 * curve) and a scalar complexity estimate. Thresholds assume unit-box
 * coordinates, i.e. strokes produced by StrokeNormalizer.
 */

#include <KanaReco/Core/Types.h>
#include <KanaReco/Core/Constants.h>

#include <cstdint>

namespace Kana::Reco::Feature {

// =============================================================================
// Thresholds (unit-box space)
// =============================================================================

/// Minimum displacement along the main axis of a line segment
constexpr double LINE_MIN_EXTENT = 0.1;

/// Maximum displacement across the main axis of a line segment
constexpr double LINE_MAX_DEVIATION = 0.05;

/// Turn angle above which a vertex counts as a curve (radians)
constexpr double CURVE_TURN_THRESHOLD = QUARTER_PI;

/// Turn angle above which a vertex counts as a direction change (radians)
constexpr double DIRECTION_CHANGE_THRESHOLD = PI / 6.0;

/// Path length at which length complexity saturates
constexpr double COMPLEXITY_LENGTH_SCALE = 4.0;

/// Direction change count at which change complexity saturates
constexpr double COMPLEXITY_CHANGE_SCALE = 10.0;

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Boolean shape descriptors shared by drawings and templates
 */
struct ShapeFeatures {
    bool hasHorizontalLine = false;
    bool hasVerticalLine = false;
    bool hasCurve = false;

    /// Number of descriptors (0..3) equal in both feature sets
    int32_t MatchCount(const ShapeFeatures& other) const {
        return (hasHorizontalLine == other.hasHorizontalLine ? 1 : 0) +
               (hasVerticalLine == other.hasVerticalLine ? 1 : 0) +
               (hasCurve == other.hasCurve ? 1 : 0);
    }

    bool operator==(const ShapeFeatures& other) const { return MatchCount(other) == 3; }
    bool operator!=(const ShapeFeatures& other) const { return !(*this == other); }
};

/// Number of boolean descriptors in ShapeFeatures
constexpr int32_t SHAPE_FEATURE_COUNT = 3;

// =============================================================================
// Extraction
// =============================================================================

/**
 * @brief Detect line and curve descriptors
 *
 * For every consecutive point pair:
 * - |dx| > 0.1 and |dy| < 0.05 marks a horizontal line
 * - |dy| > 0.1 and |dx| < 0.05 marks a vertical line
 *
 * For every consecutive point triple, a turn angle above PI/4 marks a curve.
 *
 * @param strokes Normalized strokes
 * @return Descriptors, all false for empty input
 */
ShapeFeatures ExtractFeatures(const StrokeArray& strokes);

/**
 * @brief Estimate shape complexity in [0, 1]
 *
 * Mean of:
 * - total path length clipped to [0, 4], divided by 4
 * - number of turns above 30 degrees clipped to [0, 10], divided by 10
 *
 * @param strokes Normalized strokes
 * @return Complexity, 0 for empty input
 */
double CalculateComplexity(const StrokeArray& strokes);

} // namespace Kana::Reco::Feature
