/**
 * @file StrokeNormalizer.cpp
 * @brief Tolerant stroke preprocessing pipeline
 */

#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Internal/Geometry.h>
#include <KanaReco/Core/Constants.h>
#include <KanaReco/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace Kana::Reco::Preprocess {

using Internal::Distance;

namespace {

void ValidatePoints(const StrokeArray& strokes) {
    for (size_t s = 0; s < strokes.size(); ++s) {
        for (size_t i = 0; i < strokes[s].size(); ++i) {
            if (!Internal::IsFinite(strokes[s][i])) {
                throw InvalidArgumentException("StrokeNormalizer: non-finite coordinate in stroke " +
                                               std::to_string(s) + ", point " + std::to_string(i));
            }
        }
    }
}

Rect2d ScaleBox(const Rect2d& box, double factor) {
    double w = box.width * factor;
    double h = box.height * factor;
    return Rect2d{box.CenterX() - w / 2.0, box.CenterY() - h / 2.0, w, h};
}

} // anonymous namespace

// =============================================================================
// Pipeline Stages
// =============================================================================

StrokeArray SmoothTremor(const StrokeArray& strokes, double tremorDistance) {
    StrokeArray result;
    result.reserve(strokes.size());

    for (const auto& stroke : strokes) {
        if (stroke.size() < 3) {
            result.push_back(stroke);
            continue;
        }

        Stroke smoothed;
        smoothed.reserve(stroke.size());
        smoothed.push_back(stroke.front());

        for (size_t i = 1; i + 1 < stroke.size(); ++i) {
            const StrokePoint& prev = stroke[i - 1];
            const StrokePoint& curr = stroke[i];
            const StrokePoint& next = stroke[i + 1];

            StrokePoint pt = curr;
            pt.x = (prev.x + curr.x + next.x) / 3.0;
            pt.y = (prev.y + curr.y + next.y) / 3.0;

            // Jitter: keep tiny movements close to where the pen was
            if (Distance(pt, prev) < tremorDistance) {
                pt.x = (prev.x + pt.x) / 2.0;
                pt.y = (prev.y + pt.y) / 2.0;
            }
            smoothed.push_back(pt);
        }

        smoothed.push_back(stroke.back());
        result.push_back(std::move(smoothed));
    }

    return result;
}

StrokeArray CompleteGaps(const StrokeArray& strokes, double gapThreshold, double gapStep,
                         int32_t maxGapPoints) {
    StrokeArray result;
    result.reserve(strokes.size());

    for (const auto& stroke : strokes) {
        if (stroke.size() < 2 || gapStep <= 0.0) {
            result.push_back(stroke);
            continue;
        }

        Stroke completed;
        completed.reserve(stroke.size());
        completed.push_back(stroke.front());

        for (size_t i = 1; i < stroke.size(); ++i) {
            const StrokePoint& prev = stroke[i - 1];
            const StrokePoint& curr = stroke[i];

            double d = Distance(prev, curr);
            if (d > gapThreshold) {
                // Step count is capped while still a double, before the int conversion
                double maxSteps = static_cast<double>(std::max(maxGapPoints, 0)) + 1.0;
                int32_t steps = static_cast<int32_t>(std::min(std::ceil(d / gapStep), maxSteps));
                bool timed = prev.timestamp.has_value() && curr.timestamp.has_value();

                for (int32_t j = 1; j < steps; ++j) {
                    double t = static_cast<double>(j) / steps;
                    StrokePoint pt(prev.x + (curr.x - prev.x) * t,
                                   prev.y + (curr.y - prev.y) * t);
                    if (timed) {
                        double dt = static_cast<double>(*curr.timestamp - *prev.timestamp) * t;
                        pt.timestamp = *prev.timestamp + static_cast<int64_t>(std::llround(dt));
                    }
                    completed.push_back(pt);
                }
            }
            completed.push_back(curr);
        }

        result.push_back(std::move(completed));
    }

    return result;
}

StrokeArray ClampToPositionTolerance(const StrokeArray& strokes, const Rect2d& box,
                                     double tolerance) {
    const double cx = box.CenterX();
    const double cy = box.CenterY();
    const double tolX = box.width * tolerance;
    const double tolY = box.height * tolerance;

    StrokeArray result = strokes;
    for (auto& stroke : result) {
        for (auto& pt : stroke) {
            pt.x = cx + Clamp(pt.x - cx, -tolX, tolX);
            pt.y = cy + Clamp(pt.y - cy, -tolY, tolY);
        }
    }
    return result;
}

double ComputeSizeScale(const Rect2d& box, double minSize, double maxSize) {
    if (box.IsDegenerate()) {
        return 1.0;
    }

    double currentSize = std::max(box.width, box.height);
    if (currentSize < minSize) {
        return minSize / currentSize;
    }
    if (currentSize > maxSize) {
        return maxSize / currentSize;
    }
    return 1.0;
}

StrokeArray ScaleAboutCenter(const StrokeArray& strokes, const Rect2d& box, double factor) {
    if (factor == 1.0) {
        return strokes;
    }

    const double cx = box.CenterX();
    const double cy = box.CenterY();

    StrokeArray result = strokes;
    for (auto& stroke : result) {
        for (auto& pt : stroke) {
            pt.x = cx + (pt.x - cx) * factor;
            pt.y = cy + (pt.y - cy) * factor;
        }
    }
    return result;
}

StrokeArray NormalizeToUnitBox(const StrokeArray& strokes, const Rect2d& box) {
    if (box.IsDegenerate()) {
        return strokes;
    }

    StrokeArray result = strokes;
    for (auto& stroke : result) {
        for (auto& pt : stroke) {
            pt.x = ClampUnit((pt.x - box.x) / box.width);
            pt.y = ClampUnit((pt.y - box.y) / box.height);
        }
    }
    return result;
}

// =============================================================================
// StrokeNormalizer
// =============================================================================

StrokeArray StrokeNormalizer::NormalizeStrokes(const StrokeArray& strokes, const Rect2d& box) const {
    StrokeArray work = params_.smoothTremor
        ? SmoothTremor(strokes, params_.tremorDistance)
        : strokes;

    if (params_.completeGaps) {
        work = CompleteGaps(work, params_.gapThreshold, params_.gapStep, params_.maxGapPoints);
    }

    work = ClampToPositionTolerance(work, box, params_.positionTolerance);

    double scale = ComputeSizeScale(box, params_.MinSize(), params_.MaxSize());
    work = ScaleAboutCenter(work, box, scale);

#ifdef KANARECO_DEBUG
    if (scale != 1.0) {
        fprintf(stderr, "[StrokeNormalizer] size %.1f outside [%.1f, %.1f], scale=%.3f\n",
                std::max(box.width, box.height), params_.MinSize(), params_.MaxSize(), scale);
    }
#endif

    // Points now live in the scaled box; map that box onto the unit square
    return NormalizeToUnitBox(work, ScaleBox(box, scale));
}

std::optional<PreprocessedDrawing> StrokeNormalizer::Normalize(const Drawing& drawing) const {
    if (drawing.IsEmpty() || !drawing.BoundingBox()) {
        return std::nullopt;
    }

    const StrokeArray& strokes = drawing.Strokes();
    ValidatePoints(strokes);

    PreprocessedDrawing result;
    result.boundingBox = drawing.BoundingBox();
    result.strokeCount = drawing.StrokeCount();
    result.totalPoints = drawing.TotalPoints();

    result.normalizedStrokes = NormalizeStrokes(strokes, *drawing.BoundingBox());
    result.features = Feature::ExtractFeatures(result.normalizedStrokes);
    result.complexity = Feature::CalculateComplexity(result.normalizedStrokes);

    return result;
}

} // namespace Kana::Reco::Preprocess
