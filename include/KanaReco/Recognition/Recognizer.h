#pragma once

/**
 * @file Recognizer.h
 * @brief Drawing recognition against reference character templates
 *
 * Recognizer runs the full pipeline:
 *   Drawing -> StrokeNormalizer -> feature extraction -> TemplateStore lookup
 *           -> ScoringPolicy (similarity, confidence) -> RecognitionResult
 *
 * Recognition always produces a usable result. Empty drawings score 0;
 * failures inside the pipeline are logged, reported through the error
 * callback and converted into a mode-specific fallback result.
 */

#include <KanaReco/Recognition/RecognitionTypes.h>
#include <KanaReco/Core/Drawing.h>
#include <KanaReco/Template/TemplateStore.h>

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace Kana::Reco::Recognition {

// Forward declarations
namespace Internal {
class RecognizerImpl;
}

// =============================================================================
// Recognizer Class
// =============================================================================

/**
 * @brief Scores drawings against a target character
 *
 * Usage:
 * @code
 * Recognizer recognizer;
 *
 * Drawing drawing;
 * drawing.AddStroke({{10, 20}, {90, 20}});
 * drawing.AddStroke({{50, 0}, {50, 100}});
 *
 * auto result = recognizer.Recognize(drawing, "あ", RecognitionMode::Lenient);
 * if (result.recognized) {
 *     std::printf("confidence=%.2f\n", result.confidence);
 * }
 * @endcode
 *
 * Thread safety: Recognize, RecognizeAsync and RecognizeBatch may be called
 * concurrently. The template cache is shared; everything else is per call.
 */
class Recognizer {
public:
    Recognizer();
    explicit Recognizer(const RecognizerParams& params);

    /**
     * @brief Recognizer with a custom template source
     */
    Recognizer(const RecognizerParams& params, Template::TemplateLoader loader);

    ~Recognizer();
    Recognizer(Recognizer&& other) noexcept;
    Recognizer& operator=(Recognizer&& other) noexcept;

    Recognizer(const Recognizer&) = delete;
    Recognizer& operator=(const Recognizer&) = delete;

    // =========================================================================
    // Recognition
    // =========================================================================

    /**
     * @brief Score a drawing against a target character
     * @param drawing Captured strokes (may be empty)
     * @param target Target character (UTF-8)
     * @param mode Strict or lenient calibration
     * @return Result; never throws for malformed drawings
     *
     * Blocks while the target template is loaded on first use.
     */
    RecognitionResult Recognize(const Drawing& drawing, const std::string& target,
                                RecognitionMode mode = RecognitionMode::Strict) const;

    /**
     * @brief Lenient recognition tuned for children
     */
    RecognitionResult RecognizeForChild(const Drawing& drawing, const std::string& target) const {
        return Recognize(drawing, target, RecognitionMode::Lenient);
    }

    /**
     * @brief Run Recognize() on a worker thread
     *
     * The drawing is copied. The Recognizer must outlive the returned future.
     */
    std::future<RecognitionResult> RecognizeAsync(const Drawing& drawing, const std::string& target,
                                                  RecognitionMode mode = RecognitionMode::Strict) const;

    /**
     * @brief Score several drawings against one target
     *
     * The template is resolved once. Runs in parallel when built with OpenMP.
     * @return One result per drawing, in input order
     */
    std::vector<RecognitionResult> RecognizeBatch(const std::vector<Drawing>& drawings,
                                                  const std::string& target,
                                                  RecognitionMode mode = RecognitionMode::Strict) const;

    /**
     * @brief Check input before recognition
     *
     * Reports missing strokes, too many strokes, an empty target and an
     * unsupported target. Recognize() does not require a valid report.
     */
    ValidationReport Validate(const Drawing& drawing, const std::string& target) const;

    /**
     * @brief Callback invoked for every graceful fallback
     */
    void SetErrorCallback(ErrorCallback callback);

    // =========================================================================
    // Settings
    // =========================================================================

    const RecognizerParams& GetParams() const;

    /**
     * @brief Whether two angles (radians) differ by at most the angle tolerance
     */
    bool IsAngleWithinTolerance(double actualAngle, double expectedAngle) const;

    // =========================================================================
    // Template Cache
    // =========================================================================

    /**
     * @brief Evict non-basic templates down to the configured limit
     * @return Number of evicted templates
     */
    size_t CleanupTemplateCache();
    size_t CleanupTemplateCache(size_t maxCacheSize);

    /**
     * @brief Drop all cached templates and reload the basic set
     */
    void ClearTemplateCache();

    Template::TemplateCacheStats GetMemoryUsage() const;

    std::vector<Template::TemplateInfo> GetAllTemplateInfo() const;

    Template::TemplateStore& GetTemplateStore();

private:
    std::unique_ptr<Internal::RecognizerImpl> impl_;
};

} // namespace Kana::Reco::Recognition
