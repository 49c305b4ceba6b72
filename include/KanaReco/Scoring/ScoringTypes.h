#pragma once

/**
 * @file ScoringTypes.h
 * @brief Enumerations shared by scoring and recognition
 */

namespace Kana::Reco::Scoring {

/**
 * @brief Calibration policy
 */
enum class RecognitionMode {
    Strict,         ///< Baseline matching, penalizes poor drawing quality
    Lenient         ///< Child-friendly: rewards effort, floors confidence
};

/**
 * @brief Coarse encouragement bucket derived from confidence
 */
enum class EncouragementLevel {
    Poor,           ///< confidence < 0.2
    Fair,           ///< 0.2 <= confidence < 0.5
    Excellent       ///< confidence >= 0.5
};

/// Confidence at or above which the level is Excellent
constexpr double EXCELLENT_CONFIDENCE = 0.5;

/// Confidence at or above which the level is Fair
constexpr double FAIR_CONFIDENCE = 0.2;

/**
 * @brief Bucket a confidence value with explicit thresholds
 */
inline EncouragementLevel GetEncouragementLevel(double confidence, double excellentThreshold,
                                                double fairThreshold) {
    if (confidence >= excellentThreshold) {
        return EncouragementLevel::Excellent;
    }
    if (confidence >= fairThreshold) {
        return EncouragementLevel::Fair;
    }
    return EncouragementLevel::Poor;
}

inline EncouragementLevel GetEncouragementLevel(double confidence) {
    return GetEncouragementLevel(confidence, EXCELLENT_CONFIDENCE, FAIR_CONFIDENCE);
}

inline const char* ToString(EncouragementLevel level) {
    switch (level) {
        case EncouragementLevel::Excellent: return "excellent";
        case EncouragementLevel::Fair:      return "fair";
        case EncouragementLevel::Poor:
        default:                            return "poor";
    }
}

inline const char* ToString(RecognitionMode mode) {
    return mode == RecognitionMode::Lenient ? "lenient" : "strict";
}

} // namespace Kana::Reco::Scoring
