#pragma once

/**
 * @file Drawing.h
 * @brief Captured handwriting: strokes plus their bounding box
 *
 * A Drawing is the input of one recognition attempt. The bounding box is
 * derived from the points and kept in sync on every mutation, so it always
 * covers all points of all strokes. An empty drawing has no bounding box
 * and cannot be recognized.
 */

#include <KanaReco/Core/Types.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace Kana::Reco {

/**
 * @brief Summary of a drawing for diagnostics
 */
struct DrawingSummary {
    int32_t strokeCount = 0;
    int32_t pointCount = 0;
    double complexity = 0.0;
    std::optional<Rect2d> boundingBox;
    int64_t timestamp = 0;
    bool isEmpty = true;
};

/**
 * @brief Ordered strokes of one character attempt
 *
 * Usage:
 * @code
 * Drawing drawing;
 * drawing.AddStroke({{10, 10, 0}, {60, 12, 40}, {110, 11, 80}});
 * auto box = drawing.BoundingBox();   // {10, 10, 100, 2}
 * @endcode
 */
class Drawing {
public:
    /// Empty drawing stamped with the current time
    Drawing();

    /// Drawing from already captured strokes; empty strokes are skipped
    explicit Drawing(const StrokeArray& strokes, std::optional<int64_t> timestamp = std::nullopt);

    /**
     * @brief Append a stroke
     * @return false if the stroke has no points (drawing left unchanged)
     */
    bool AddStroke(const Stroke& points);

    /// Remove all strokes
    void Clear();

    bool IsEmpty() const { return strokes_.empty(); }
    const StrokeArray& Strokes() const { return strokes_; }
    int32_t StrokeCount() const { return static_cast<int32_t>(strokes_.size()); }
    int32_t TotalPoints() const;

    /// Bounding box over all points, empty for an empty drawing
    const std::optional<Rect2d>& BoundingBox() const { return boundingBox_; }

    /// Capture time in milliseconds since epoch
    int64_t Timestamp() const { return timestamp_; }

    /**
     * @brief Capture-side complexity estimate in [0, 1]
     *
     * Mean of stroke count / 10, point count / 100 and box area / 10000,
     * each clipped to 1. Not to be confused with the path-based complexity
     * computed by the feature extractor.
     */
    double GetComplexity() const;

    DrawingSummary GetSummary() const;

private:
    void UpdateBoundingBox();

    StrokeArray strokes_;
    std::optional<Rect2d> boundingBox_;
    int64_t timestamp_ = 0;
};

/**
 * @brief Compute the bounding box of a set of strokes
 * @return Empty optional if there are no points
 */
std::optional<Rect2d> ComputeBoundingBox(const StrokeArray& strokes);

} // namespace Kana::Reco
