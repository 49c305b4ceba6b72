/**
 * @file Geometry.cpp
 * @brief Geometric primitives on stroke points
 */

#include <KanaReco/Internal/Geometry.h>

namespace Kana::Reco::Internal {

double AngleDifference(double angle1, double angle2) {
    double diff = std::abs(angle1 - angle2);
    if (diff > PI) {
        diff = TWO_PI - diff;
    }
    return diff;
}

bool IsAngleWithinTolerance(double actualAngle, double expectedAngle, double tolerance) {
    return AngleDifference(actualAngle, expectedAngle) <= tolerance;
}

double PathLength(const Stroke& stroke) {
    double length = 0.0;
    for (size_t i = 1; i < stroke.size(); ++i) {
        length += Distance(stroke[i - 1], stroke[i]);
    }
    return length;
}

std::vector<double> TurnAngles(const Stroke& stroke) {
    std::vector<double> turns;
    if (stroke.size() < 3) {
        return turns;
    }

    turns.reserve(stroke.size() - 2);
    for (size_t i = 2; i < stroke.size(); ++i) {
        double a1 = SegmentAngle(stroke[i - 2], stroke[i - 1]);
        double a2 = SegmentAngle(stroke[i - 1], stroke[i]);
        turns.push_back(AngleDifference(a1, a2));
    }
    return turns;
}

} // namespace Kana::Reco::Internal
