/**
 * @file StrictPolicy.cpp
 * @brief Baseline similarity and confidence calibration
 */

#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Scoring/Metrics.h>
#include <KanaReco/Core/Constants.h>

namespace Kana::Reco::Scoring {

namespace {

constexpr int32_t MIN_POINTS = 10;
constexpr int32_t MAX_POINTS = 1000;
constexpr double FEW_POINTS_PENALTY = 0.5;
constexpr double MANY_POINTS_PENALTY = 0.8;

constexpr double MIN_AREA = 100.0;
constexpr double MAX_AREA = 50000.0;
constexpr double SMALL_AREA_PENALTY = 0.7;
constexpr double LARGE_AREA_PENALTY = 0.8;

} // anonymous namespace

double StrictPolicy::Similarity(const Preprocess::PreprocessedDrawing& drawing,
                                const Template::CharacterTemplate& tmpl) const {
    const double strokeSim = StrokeCountSimilarity(drawing.strokeCount, tmpl.strokeCount);
    const double featureSim = FeatureSimilarity(drawing.features, tmpl.features);
    const double complexitySim = ComplexitySimilarity(drawing.complexity, tmpl.complexity);

    return ClampUnit(strokeSim * STROKE_WEIGHT +
                     featureSim * FEATURE_WEIGHT +
                     complexitySim * COMPLEXITY_WEIGHT);
}

double StrictPolicy::Confidence(double similarity,
                                const Preprocess::PreprocessedDrawing& drawing,
                                const Template::CharacterTemplate& /*tmpl*/) const {
    if (drawing.strokeCount == 0) {
        return 0.0;
    }

    double confidence = similarity;

    if (drawing.totalPoints < MIN_POINTS) {
        confidence *= FEW_POINTS_PENALTY;
    } else if (drawing.totalPoints > MAX_POINTS) {
        confidence *= MANY_POINTS_PENALTY;
    }

    if (drawing.boundingBox) {
        const double area = drawing.boundingBox->Area();
        if (area < MIN_AREA) {
            confidence *= SMALL_AREA_PENALTY;
        } else if (area > MAX_AREA) {
            confidence *= LARGE_AREA_PENALTY;
        }
    }

    return ClampUnit(confidence);
}

} // namespace Kana::Reco::Scoring
