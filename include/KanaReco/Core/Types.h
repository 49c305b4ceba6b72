#pragma once

/**
 * @file Types.h
 * @brief Basic geometric types shared by all KanaReco modules
 */

#include <cstdint>
#include <optional>
#include <vector>

namespace Kana::Reco {

// =============================================================================
// Points
// =============================================================================

/**
 * @brief Plain 2D point (no time information)
 */
struct Point2d {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief One sampled pointer position of a stroke
 *
 * The timestamp is optional: some capture sources do not provide one.
 * Two points of the same stroke may share a timestamp.
 */
struct StrokePoint {
    double x = 0.0;
    double y = 0.0;
    std::optional<int64_t> timestamp;   ///< Capture time in milliseconds

    StrokePoint() = default;
    StrokePoint(double x_, double y_) : x(x_), y(y_) {}
    StrokePoint(double x_, double y_, int64_t t) : x(x_), y(y_), timestamp(t) {}

    Point2d ToPoint() const { return Point2d{x, y}; }
};

/// One continuous pointer-down to pointer-up gesture, in drawing order
using Stroke = std::vector<StrokePoint>;

/// Ordered set of strokes
using StrokeArray = std::vector<Stroke>;

// =============================================================================
// Rectangle
// =============================================================================

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct Rect2d {
    double x = 0.0;         ///< Left
    double y = 0.0;         ///< Top
    double width = 0.0;
    double height = 0.0;

    double Area() const { return width * height; }
    double CenterX() const { return x + width / 2.0; }
    double CenterY() const { return y + height / 2.0; }
    Point2d Center() const { return Point2d{CenterX(), CenterY()}; }

    /// Zero width or zero height
    bool IsDegenerate() const { return width == 0.0 || height == 0.0; }

    bool operator==(const Rect2d& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

} // namespace Kana::Reco
