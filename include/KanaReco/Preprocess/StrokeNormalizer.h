#pragma once

/**
 * @file StrokeNormalizer.h
 * @brief Tolerant stroke preprocessing for child handwriting
 *
 * Pipeline (each stage works on a copy of the full stroke set):
 * 1. Tremor smoothing: 3-point moving average of interior points
 * 2. Gap completion: linear interpolation across long segments
 * 3. Position tolerance: clamp deviation from the box center to +/-50%
 * 4. Size normalization: rescale into [60, 140] around a standard size of 100
 * 5. Unit-box normalization: map coordinates into [0, 1] x [0, 1]
 *
 * Stroke and point counts reported in the result are those of the input
 * drawing; points added by gap completion only exist in the working copy.
 *
 * @see FeatureExtractor.h for the descriptors computed on the output
 */

#include <KanaReco/Core/Drawing.h>
#include <KanaReco/Core/Types.h>
#include <KanaReco/Feature/FeatureExtractor.h>

#include <cstdint>
#include <optional>

namespace Kana::Reco::Preprocess {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Tolerance parameters of the normalization pipeline
 */
struct NormalizeParams {
    // Tremor smoothing
    bool smoothTremor = true;
    double tremorDistance = 2.0;        ///< Smoothed points closer than this to their predecessor are pulled back

    // Gap completion
    bool completeGaps = true;
    double gapThreshold = 20.0;         ///< Segments longer than this are interpolated
    double gapStep = 10.0;              ///< Spacing of interpolated points
    int32_t maxGapPoints = 1000;        ///< Upper bound on points inserted into one segment

    // Position tolerance
    double positionTolerance = 0.5;     ///< Allowed deviation from center as fraction of box size

    // Size tolerance
    double standardSize = 100.0;        ///< Reference character size
    double sizeTolerance = 0.4;         ///< Allowed relative deviation from standardSize

    // Builder pattern
    NormalizeParams& SetSmoothTremor(bool v) { smoothTremor = v; return *this; }
    NormalizeParams& SetTremorDistance(double v) { tremorDistance = v; return *this; }
    NormalizeParams& SetCompleteGaps(bool v) { completeGaps = v; return *this; }
    NormalizeParams& SetGapThreshold(double v) { gapThreshold = v; return *this; }
    NormalizeParams& SetGapStep(double v) { gapStep = v; return *this; }
    NormalizeParams& SetMaxGapPoints(int32_t v) { maxGapPoints = v; return *this; }
    NormalizeParams& SetPositionTolerance(double v) { positionTolerance = v; return *this; }
    NormalizeParams& SetStandardSize(double v) { standardSize = v; return *this; }
    NormalizeParams& SetSizeTolerance(double v) { sizeTolerance = v; return *this; }

    double MinSize() const { return standardSize * (1.0 - sizeTolerance); }
    double MaxSize() const { return standardSize * (1.0 + sizeTolerance); }
};

// =============================================================================
// Result
// =============================================================================

/**
 * @brief Normalized drawing with extracted descriptors
 *
 * Owned by the recognition call that produced it.
 */
struct PreprocessedDrawing {
    StrokeArray normalizedStrokes;          ///< Unit-box strokes (working copy)
    std::optional<Rect2d> boundingBox;      ///< Bounding box of the input drawing
    int32_t strokeCount = 0;                ///< Input stroke count
    int32_t totalPoints = 0;                ///< Input point count
    Feature::ShapeFeatures features;
    double complexity = 0.0;
};

// =============================================================================
// Pipeline Stages
// =============================================================================

/**
 * @brief Stage 1: suppress jitter with a 3-point moving average
 *
 * Endpoints are kept. If a smoothed point lands within tremorDistance of
 * the previous input point it is moved halfway towards that point.
 * Strokes with fewer than 3 points are copied unchanged.
 */
StrokeArray SmoothTremor(const StrokeArray& strokes, double tremorDistance = 2.0);

/**
 * @brief Stage 2: fill long segments with interpolated points
 *
 * A segment of length d > gapThreshold receives ceil(d / gapStep) - 1
 * evenly spaced points, inserted between its endpoints. Timestamps are
 * interpolated when both endpoints carry one. At most maxGapPoints points
 * are inserted into one segment; longer segments get a wider spacing.
 */
StrokeArray CompleteGaps(const StrokeArray& strokes,
                         double gapThreshold = 20.0, double gapStep = 10.0,
                         int32_t maxGapPoints = 1000);

/**
 * @brief Stage 3: clamp every point to center +/- tolerance * box size
 */
StrokeArray ClampToPositionTolerance(const StrokeArray& strokes, const Rect2d& box,
                                     double tolerance = 0.5);

/**
 * @brief Scale factor that brings max(width, height) into [minSize, maxSize]
 * @return 1.0 if already inside the range or if the box is degenerate
 */
double ComputeSizeScale(const Rect2d& box, double minSize, double maxSize);

/**
 * @brief Stage 4: scale all points about the box center
 */
StrokeArray ScaleAboutCenter(const StrokeArray& strokes, const Rect2d& box, double factor);

/**
 * @brief Stage 5: map points into the unit box of the reference box
 *
 * Results are clamped to [0, 1]. A degenerate box leaves the strokes
 * unchanged.
 */
StrokeArray NormalizeToUnitBox(const StrokeArray& strokes, const Rect2d& box);

// =============================================================================
// StrokeNormalizer Class
// =============================================================================

/**
 * @brief Runs the full preprocessing pipeline and feature extraction
 *
 * Usage:
 * @code
 * StrokeNormalizer normalizer(NormalizeParams().SetPositionTolerance(0.4));
 * auto pre = normalizer.Normalize(drawing);
 * if (pre) {
 *     bool curved = pre->features.hasCurve;
 * }
 * @endcode
 */
class StrokeNormalizer {
public:
    StrokeNormalizer() = default;
    explicit StrokeNormalizer(const NormalizeParams& params) : params_(params) {}

    /**
     * @brief Normalize a drawing
     * @return Empty optional for a drawing without strokes
     * @throws InvalidArgumentException if a point has non-finite coordinates
     */
    std::optional<PreprocessedDrawing> Normalize(const Drawing& drawing) const;

    /**
     * @brief Stages 1-5 only, without feature extraction
     */
    StrokeArray NormalizeStrokes(const StrokeArray& strokes, const Rect2d& box) const;

    const NormalizeParams& GetParams() const { return params_; }
    void SetParams(const NormalizeParams& params) { params_ = params; }

private:
    NormalizeParams params_;
};

} // namespace Kana::Reco::Preprocess
