/**
 * @file RecognizerImpl.h
 * @brief Internal implementation of Recognizer
 */

#pragma once

#include <KanaReco/Recognition/Recognizer.h>
#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Template/TemplateStore.h>

#include <memory>
#include <mutex>
#include <string>

namespace Kana::Reco::Recognition {
namespace Internal {

// =============================================================================
// RecognizerImpl
// =============================================================================

class RecognizerImpl {
public:
    RecognizerImpl(const RecognizerParams& params, Template::TemplateLoader loader);

    /**
     * @brief Pipeline entry point
     * @param tmpl Pre-resolved template, or nullptr to look it up
     */
    RecognitionResult Recognize(const Drawing& drawing, const std::string& target,
                                RecognitionMode mode, const Template::CharacterTemplate* tmpl);

    /**
     * @brief Template lookup, falling back instead of throwing
     */
    Template::CharacterTemplate ResolveTemplate(const std::string& target);

    const Scoring::ScoringPolicy& PolicyFor(RecognitionMode mode) const;

    RecognitionResult MakeEmptyResult(RecognitionMode mode, RecognitionStatus status,
                                      const char* message) const;
    RecognitionResult MakeFallbackResult(RecognitionMode mode, const std::string& target,
                                         const std::string& error);

    void ReportError(const RecognitionError& error);

    RecognizerParams params_;
    Preprocess::StrokeNormalizer normalizer_;
    Template::TemplateStore store_;
    std::unique_ptr<Scoring::ScoringPolicy> strictPolicy_;
    std::unique_ptr<Scoring::ScoringPolicy> lenientPolicy_;

    std::mutex callbackMutex_;
    ErrorCallback onError_;
};

} // namespace Internal
} // namespace Kana::Reco::Recognition
