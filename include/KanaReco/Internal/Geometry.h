#pragma once

/**
 * @file Geometry.h
 * @brief Geometric primitives on stroke points
 *
 * Provides:
 * - Euclidean distance
 * - Segment direction angle
 * - Absolute angle difference folded into [0, PI]
 * - Path length and per-vertex turn angles of a stroke
 *
 * All functions are pure and work in whatever coordinate space the
 * points are given in (raw canvas units or the unit box).
 */

#include <KanaReco/Core/Types.h>
#include <KanaReco/Core/Constants.h>

#include <cmath>
#include <vector>

namespace Kana::Reco::Internal {

// =============================================================================
// Point Primitives
// =============================================================================

inline double Distance(double x1, double y1, double x2, double y2) {
    return std::sqrt(Square(x2 - x1) + Square(y2 - y1));
}

/**
 * @brief Euclidean distance between two stroke points
 */
inline double Distance(const StrokePoint& a, const StrokePoint& b) {
    return Distance(a.x, a.y, b.x, b.y);
}

inline double Distance(const Point2d& a, const Point2d& b) {
    return Distance(a.x, a.y, b.x, b.y);
}

/**
 * @brief Direction of the segment from a to b
 * @return Angle in radians in (-PI, PI]
 */
inline double SegmentAngle(const StrokePoint& a, const StrokePoint& b) {
    return std::atan2(b.y - a.y, b.x - a.x);
}

/**
 * @brief Absolute difference of two angles, folded into [0, PI]
 *
 * Inputs are expected in (-PI, PI] (as returned by atan2), so a single
 * fold is sufficient.
 */
double AngleDifference(double angle1, double angle2);

/**
 * @brief Check whether two directions agree within a tolerance
 * @param actualAngle Measured angle (radians)
 * @param expectedAngle Reference angle (radians)
 * @param tolerance Maximum allowed difference (radians), default 30 degrees
 */
bool IsAngleWithinTolerance(double actualAngle, double expectedAngle,
                            double tolerance = PI / 6.0);

/**
 * @brief True if both coordinates are finite
 */
inline bool IsFinite(const StrokePoint& pt) {
    return std::isfinite(pt.x) && std::isfinite(pt.y);
}

// =============================================================================
// Stroke Primitives
// =============================================================================

/**
 * @brief Sum of segment lengths of a stroke
 */
double PathLength(const Stroke& stroke);

/**
 * @brief Turn angle at every interior vertex
 *
 * Element i is the folded angle difference between segment (i, i+1) and
 * segment (i+1, i+2). Strokes with fewer than 3 points yield nothing.
 */
std::vector<double> TurnAngles(const Stroke& stroke);

} // namespace Kana::Reco::Internal
