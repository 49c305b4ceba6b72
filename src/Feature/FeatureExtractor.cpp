/**
 * @file FeatureExtractor.cpp
 * @brief Shape descriptor extraction
 */

#include <KanaReco/Feature/FeatureExtractor.h>
#include <KanaReco/Internal/Geometry.h>

#include <algorithm>
#include <cmath>

namespace Kana::Reco::Feature {

using Internal::PathLength;
using Internal::TurnAngles;

ShapeFeatures ExtractFeatures(const StrokeArray& strokes) {
    ShapeFeatures features;

    for (const auto& stroke : strokes) {
        for (size_t i = 1; i < stroke.size(); ++i) {
            double dx = std::abs(stroke[i].x - stroke[i - 1].x);
            double dy = std::abs(stroke[i].y - stroke[i - 1].y);

            if (dx > LINE_MIN_EXTENT && dy < LINE_MAX_DEVIATION) {
                features.hasHorizontalLine = true;
            }
            if (dy > LINE_MIN_EXTENT && dx < LINE_MAX_DEVIATION) {
                features.hasVerticalLine = true;
            }
        }

        if (!features.hasCurve) {
            for (double turn : TurnAngles(stroke)) {
                if (turn > CURVE_TURN_THRESHOLD) {
                    features.hasCurve = true;
                    break;
                }
            }
        }
    }

    return features;
}

double CalculateComplexity(const StrokeArray& strokes) {
    if (strokes.empty()) {
        return 0.0;
    }

    double totalLength = 0.0;
    int32_t directionChanges = 0;

    for (const auto& stroke : strokes) {
        totalLength += PathLength(stroke);
        for (double turn : TurnAngles(stroke)) {
            if (turn > DIRECTION_CHANGE_THRESHOLD) {
                ++directionChanges;
            }
        }
    }

    double lengthComplexity = std::min(1.0, totalLength / COMPLEXITY_LENGTH_SCALE);
    double changeComplexity = std::min(1.0, directionChanges / COMPLEXITY_CHANGE_SCALE);

    return (lengthComplexity + changeComplexity) / 2.0;
}

} // namespace Kana::Reco::Feature
