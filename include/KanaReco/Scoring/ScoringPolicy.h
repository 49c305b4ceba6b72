#pragma once

/**
 * @file ScoringPolicy.h
 * @brief Similarity and confidence calibration policies
 *
 * Both policies combine the same sub-metrics (see Metrics.h) with different
 * weights and calibration rules:
 *
 * Strict:
 *   similarity = stroke * 0.30 + feature * 0.50 + complexity * 0.20
 *   confidence = similarity with penalties for too few/many points and too
 *                small/large drawings; recognized if confidence > 0.3
 *
 * Lenient:
 *   similarity = stroke * 0.20 + feature * 0.40 + complexity * 0.15 + effort * 0.25
 *   confidence = similarity floored and boosted to reward effort;
 *                recognized if confidence >= 0.2
 */

#include <KanaReco/Scoring/ScoringTypes.h>
#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Template/CharacterTemplate.h>

#include <memory>

namespace Kana::Reco::Scoring {

// =============================================================================
// Interface
// =============================================================================

/**
 * @brief Scores a preprocessed drawing against a template
 */
class ScoringPolicy {
public:
    virtual ~ScoringPolicy() = default;

    virtual RecognitionMode Mode() const = 0;

    /**
     * @brief Weighted similarity in [0, 1]
     */
    virtual double Similarity(const Preprocess::PreprocessedDrawing& drawing,
                              const Template::CharacterTemplate& tmpl) const = 0;

    /**
     * @brief Calibrated confidence in [0, 1]
     */
    virtual double Confidence(double similarity,
                              const Preprocess::PreprocessedDrawing& drawing,
                              const Template::CharacterTemplate& tmpl) const = 0;

    virtual bool IsRecognized(double confidence) const = 0;
};

// =============================================================================
// Strict
// =============================================================================

/// Default strict recognition threshold (exclusive)
constexpr double STRICT_RECOGNITION_THRESHOLD = 0.3;

class StrictPolicy final : public ScoringPolicy {
public:
    static constexpr double STROKE_WEIGHT = 0.30;
    static constexpr double FEATURE_WEIGHT = 0.50;
    static constexpr double COMPLEXITY_WEIGHT = 0.20;

    explicit StrictPolicy(double recognitionThreshold = STRICT_RECOGNITION_THRESHOLD)
        : threshold_(recognitionThreshold) {}

    RecognitionMode Mode() const override { return RecognitionMode::Strict; }

    double Similarity(const Preprocess::PreprocessedDrawing& drawing,
                      const Template::CharacterTemplate& tmpl) const override;

    double Confidence(double similarity,
                      const Preprocess::PreprocessedDrawing& drawing,
                      const Template::CharacterTemplate& tmpl) const override;

    bool IsRecognized(double confidence) const override { return confidence > threshold_; }

    double Threshold() const { return threshold_; }

private:
    double threshold_;
};

// =============================================================================
// Lenient
// =============================================================================

/// Default lenient recognition threshold (inclusive)
constexpr double LENIENT_RECOGNITION_THRESHOLD = 0.2;

class LenientPolicy final : public ScoringPolicy {
public:
    static constexpr double STROKE_WEIGHT = 0.20;
    static constexpr double FEATURE_WEIGHT = 0.40;
    static constexpr double COMPLEXITY_WEIGHT = 0.15;
    static constexpr double EFFORT_WEIGHT = 0.25;

    /// Confidence floor for any drawing with strokes
    static constexpr double STROKE_FLOOR = 0.25;

    /// Confidence floor for drawings with strokes and more than MIN_POINTS_FOR_FLOOR points
    static constexpr double EFFORT_FLOOR = 0.2;
    static constexpr int32_t MIN_POINTS_FOR_FLOOR = 5;

    explicit LenientPolicy(double recognitionThreshold = LENIENT_RECOGNITION_THRESHOLD)
        : threshold_(recognitionThreshold) {}

    RecognitionMode Mode() const override { return RecognitionMode::Lenient; }

    double Similarity(const Preprocess::PreprocessedDrawing& drawing,
                      const Template::CharacterTemplate& tmpl) const override;

    double Confidence(double similarity,
                      const Preprocess::PreprocessedDrawing& drawing,
                      const Template::CharacterTemplate& tmpl) const override;

    bool IsRecognized(double confidence) const override { return confidence >= threshold_; }

    double Threshold() const { return threshold_; }

private:
    double threshold_;
};

// =============================================================================
// Factory
// =============================================================================

/**
 * @brief Create the policy for a mode with its default threshold
 */
std::unique_ptr<ScoringPolicy> CreateScoringPolicy(RecognitionMode mode);

/**
 * @brief Create the policy for a mode with an explicit threshold
 */
std::unique_ptr<ScoringPolicy> CreateScoringPolicy(RecognitionMode mode, double recognitionThreshold);

} // namespace Kana::Reco::Scoring
