#pragma once

/**
 * @file RecognitionTypes.h
 * @brief Parameters and result types for Recognizer
 */

#include <KanaReco/Core/Constants.h>
#include <KanaReco/Feature/FeatureExtractor.h>
#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Scoring/ScoringTypes.h>
#include <KanaReco/Template/TemplateStore.h>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Kana::Reco::Recognition {

using Scoring::RecognitionMode;
using Scoring::EncouragementLevel;

// =============================================================================
// Timing Structures
// =============================================================================

/**
 * @brief Detailed timing for Recognizer::Recognize()
 */
struct RecognitionTiming {
    double totalMs = 0.0;
    double normalizeMs = 0.0;       ///< Stroke normalization and feature extraction
    double templateMs = 0.0;        ///< Template lookup (including a lazy load)
    double scoringMs = 0.0;         ///< Similarity and confidence

    void Print() const {
        const double total = totalMs > 0.0 ? totalMs : 1.0;
        std::fprintf(stderr, "[Recognizer Timing] Total: %.3fms\n", totalMs);
        std::fprintf(stderr, "  Normalize: %6.3fms (%4.1f%%)\n", normalizeMs, 100.0 * normalizeMs / total);
        std::fprintf(stderr, "  Template:  %6.3fms (%4.1f%%)\n", templateMs, 100.0 * templateMs / total);
        std::fprintf(stderr, "  Scoring:   %6.3fms (%4.1f%%)\n", scoringMs, 100.0 * scoringMs / total);
    }
};

/**
 * @brief Parameters for enabling timing in Recognizer
 */
struct RecognitionTimingParams {
    bool enableTiming = false;          ///< Attach RecognitionTiming to each scored result
    bool printTiming = false;           ///< Print timing to stderr after each recognition

    RecognitionTimingParams& SetEnableTiming(bool v) { enableTiming = v; return *this; }
    RecognitionTimingParams& SetPrintTiming(bool v) { printTiming = v; return *this; }
};

// =============================================================================
// Parameters
// =============================================================================

/// Default angular tolerance for IsAngleWithinTolerance (30 degrees)
constexpr double DEFAULT_ANGLE_TOLERANCE = PI / 6.0;

/**
 * @brief Recognizer configuration
 *
 * Usage:
 * @code
 * RecognizerParams params = RecognizerParams()
 *     .SetLenientThreshold(0.25)
 *     .SetVerbose(true);
 * @endcode
 */
struct RecognizerParams {
    Preprocess::NormalizeParams normalize;      ///< Stroke normalizer settings
    Template::TemplateStoreParams store;        ///< Template cache settings

    // Recognition thresholds
    double strictThreshold = Scoring::STRICT_RECOGNITION_THRESHOLD;     ///< Recognized if confidence > this
    double lenientThreshold = Scoring::LENIENT_RECOGNITION_THRESHOLD;   ///< Recognized if confidence >= this

    // Encouragement thresholds
    double excellentThreshold = Scoring::EXCELLENT_CONFIDENCE;
    double fairThreshold = Scoring::FAIR_CONFIDENCE;

    double angleTolerance = DEFAULT_ANGLE_TOLERANCE;    ///< Radians
    int32_t maxStrokes = MAX_EXPECTED_STROKES;          ///< Validate() limit

    bool verbose = false;                       ///< Log warnings to stderr
    RecognitionTimingParams timing;

    // Builder pattern
    RecognizerParams& SetNormalizeParams(const Preprocess::NormalizeParams& v) { normalize = v; return *this; }
    RecognizerParams& SetStoreParams(const Template::TemplateStoreParams& v) { store = v; return *this; }
    RecognizerParams& SetStrictThreshold(double v) { strictThreshold = v; return *this; }
    RecognizerParams& SetLenientThreshold(double v) { lenientThreshold = v; return *this; }
    RecognizerParams& SetEncouragementThresholds(double excellent, double fair) {
        excellentThreshold = excellent;
        fairThreshold = fair;
        return *this;
    }
    RecognizerParams& SetAngleTolerance(double v) { angleTolerance = v; return *this; }
    RecognizerParams& SetAngleToleranceDeg(double deg) { angleTolerance = DegToRad(deg); return *this; }
    RecognizerParams& SetMaxStrokes(int32_t v) { maxStrokes = v; return *this; }
    RecognizerParams& SetVerbose(bool v) { verbose = v; return *this; }
    RecognizerParams& SetTiming(const RecognitionTimingParams& v) { timing = v; return *this; }
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief How a result was produced
 */
enum class RecognitionStatus {
    Scored,             ///< Full pipeline ran
    EmptyDrawing,       ///< Drawing had no strokes
    PreprocessFailed,   ///< Normalizer produced nothing
    Fallback            ///< Internal failure converted into a graceful result
};

inline const char* ToString(RecognitionStatus status) {
    switch (status) {
        case RecognitionStatus::Scored:           return "scored";
        case RecognitionStatus::EmptyDrawing:     return "empty-drawing";
        case RecognitionStatus::PreprocessFailed: return "preprocess-failed";
        case RecognitionStatus::Fallback:
        default:                                  return "fallback";
    }
}

/**
 * @brief Diagnostic details attached to a result
 */
struct RecognitionDetails {
    double similarity = 0.0;
    int32_t strokeCount = 0;                    ///< Input stroke count
    int32_t totalPoints = 0;                    ///< Input point count
    std::optional<int32_t> expectedStrokes;     ///< Empty when unknown
    Feature::ShapeFeatures features;
    bool fallback = false;
    std::string message;
    std::string error;                          ///< Failure text for fallback results

    // Lenient mode only
    std::optional<EncouragementLevel> encouragementLevel;
    std::optional<double> childFriendlyScore;
    bool normalizedForChild = false;

    std::optional<RecognitionTiming> timing;
};

/**
 * @brief Outcome of one recognition attempt
 */
struct RecognitionResult {
    std::optional<std::string> character;   ///< Target character, empty for unrecognizable drawings
    double confidence = 0.0;                ///< [0, 1]
    bool recognized = false;
    RecognitionStatus status = RecognitionStatus::Scored;
    RecognitionMode mode = RecognitionMode::Strict;
    RecognitionDetails details;
};

// =============================================================================
// Validation and Errors
// =============================================================================

/**
 * @brief Pre-flight check of recognition input
 */
struct ValidationReport {
    bool valid = true;
    std::vector<std::string> issues;
};

/**
 * @brief Error event emitted on every graceful fallback
 */
struct RecognitionError {
    std::string type;                   ///< "recognition" or "child-recognition"
    std::string message;
    std::string target;
    bool handledGracefully = true;
};

using ErrorCallback = std::function<void(const RecognitionError&)>;

} // namespace Kana::Reco::Recognition
