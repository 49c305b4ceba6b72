/**
 * @file LenientPolicy.cpp
 * @brief Child-friendly similarity and confidence calibration
 */

#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Scoring/Metrics.h>
#include <KanaReco/Core/Constants.h>

#include <algorithm>

namespace Kana::Reco::Scoring {

namespace {

constexpr double STROKE_RATIO_FOR_BONUS = 0.5;
constexpr double STROKE_RATIO_BONUS = 0.1;
constexpr double BASIC_SHAPE_BONUS = 0.15;
constexpr double REASONABLE_SIZE_BONUS = 0.05;

} // anonymous namespace

double LenientPolicy::Similarity(const Preprocess::PreprocessedDrawing& drawing,
                                 const Template::CharacterTemplate& tmpl) const {
    const double strokeSim = LenientStrokeCountSimilarity(drawing.strokeCount, tmpl.strokeCount);
    const double featureSim = LenientFeatureSimilarity(drawing.features, tmpl.features);
    const double complexitySim = LenientComplexitySimilarity(drawing.complexity, tmpl.complexity);
    const double effort = EffortScore(drawing);

    return ClampUnit(strokeSim * STROKE_WEIGHT +
                     featureSim * FEATURE_WEIGHT +
                     complexitySim * COMPLEXITY_WEIGHT +
                     effort * EFFORT_WEIGHT);
}

double LenientPolicy::Confidence(double similarity,
                                 const Preprocess::PreprocessedDrawing& drawing,
                                 const Template::CharacterTemplate& tmpl) const {
    double confidence = similarity;

    if (drawing.strokeCount > 0) {
        confidence = std::max(confidence, STROKE_FLOOR);
    }

    confidence += ChildFriendlyBonus(drawing, tmpl);

    if (drawing.strokeCount >= tmpl.strokeCount * STROKE_RATIO_FOR_BONUS) {
        confidence += STROKE_RATIO_BONUS;
    }

    if (HasBasicShapeMatch(drawing.features, tmpl.features)) {
        confidence += BASIC_SHAPE_BONUS;
    }

    if (drawing.boundingBox && IsReasonableSize(*drawing.boundingBox)) {
        confidence += REASONABLE_SIZE_BONUS;
    }

    if (drawing.strokeCount > 0 && drawing.totalPoints > MIN_POINTS_FOR_FLOOR) {
        confidence = std::max(confidence, EFFORT_FLOOR);
    }

    return ClampUnit(confidence);
}

} // namespace Kana::Reco::Scoring
