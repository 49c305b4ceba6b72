/**
 * @file Recognizer.cpp
 * @brief Recognition pipeline and graceful fallback handling
 */

#include "RecognizerImpl.h"

#include <KanaReco/Internal/Geometry.h>
#include <KanaReco/Template/TemplateRegistry.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <optional>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Kana::Reco::Recognition {

namespace {

// Confidence reported when the pipeline fails
constexpr double STRICT_FALLBACK_CONFIDENCE = 0.3;
constexpr double LENIENT_FALLBACK_CONFIDENCE = 0.25;

constexpr const char* MSG_NO_DRAWING = "No drawing data";
constexpr const char* MSG_PREPROCESS_FAILED = "Preprocessing failed";
constexpr const char* MSG_UNKNOWN_ERROR = "unknown error";
constexpr const char* MSG_FALLBACK_ENCOURAGING = "Something went wrong, but you tried hard!";

using Clock = std::chrono::high_resolution_clock;

double ElapsedMs(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

namespace Internal {

// =============================================================================
// RecognizerImpl
// =============================================================================

RecognizerImpl::RecognizerImpl(const RecognizerParams& params, Template::TemplateLoader loader)
    : params_(params)
    , normalizer_(params.normalize)
    , store_(params.store, std::move(loader))
    , strictPolicy_(Scoring::CreateScoringPolicy(RecognitionMode::Strict, params.strictThreshold))
    , lenientPolicy_(Scoring::CreateScoringPolicy(RecognitionMode::Lenient, params.lenientThreshold))
{
}

const Scoring::ScoringPolicy& RecognizerImpl::PolicyFor(RecognitionMode mode) const {
    return mode == RecognitionMode::Lenient ? *lenientPolicy_ : *strictPolicy_;
}

Template::CharacterTemplate RecognizerImpl::ResolveTemplate(const std::string& target) {
    if (params_.verbose && !Template::IsCharacterSupported(target)) {
        fprintf(stderr, "[Recognizer] No template for '%s', using fallback template\n", target.c_str());
    }
    return store_.Get(target);
}

RecognitionResult RecognizerImpl::Recognize(const Drawing& drawing, const std::string& target,
                                            RecognitionMode mode,
                                            const Template::CharacterTemplate* tmpl) {
    if (drawing.IsEmpty()) {
        return MakeEmptyResult(mode, RecognitionStatus::EmptyDrawing, MSG_NO_DRAWING);
    }

    try {
        auto t0 = Clock::now();
        std::optional<Preprocess::PreprocessedDrawing> preprocessed = normalizer_.Normalize(drawing);
        auto t1 = Clock::now();

        if (!preprocessed) {
            return MakeEmptyResult(mode, RecognitionStatus::PreprocessFailed, MSG_PREPROCESS_FAILED);
        }

        const Template::CharacterTemplate resolved = tmpl ? *tmpl : ResolveTemplate(target);
        auto t2 = Clock::now();

        const Scoring::ScoringPolicy& policy = PolicyFor(mode);
        const double similarity = policy.Similarity(*preprocessed, resolved);
        const double confidence = policy.Confidence(similarity, *preprocessed, resolved);
        auto t3 = Clock::now();

        RecognitionResult result;
        result.character = target;
        result.confidence = confidence;
        result.recognized = policy.IsRecognized(confidence);
        result.status = RecognitionStatus::Scored;
        result.mode = mode;

        RecognitionDetails& details = result.details;
        details.similarity = similarity;
        details.strokeCount = preprocessed->strokeCount;
        details.totalPoints = preprocessed->totalPoints;
        details.expectedStrokes = resolved.strokeCount;
        details.features = preprocessed->features;

        if (mode == RecognitionMode::Lenient) {
            details.childFriendlyScore = confidence;
            details.encouragementLevel = Scoring::GetEncouragementLevel(
                confidence, params_.excellentThreshold, params_.fairThreshold);
            details.normalizedForChild = true;
        }

        if (params_.timing.enableTiming || params_.timing.printTiming) {
            RecognitionTiming timing;
            timing.normalizeMs = ElapsedMs(t0, t1);
            timing.templateMs = ElapsedMs(t1, t2);
            timing.scoringMs = ElapsedMs(t2, t3);
            timing.totalMs = ElapsedMs(t0, t3);
            if (params_.timing.printTiming) {
                timing.Print();
            }
            if (params_.timing.enableTiming) {
                details.timing = timing;
            }
        }

#ifdef KANARECO_DEBUG
        fprintf(stderr, "[Recognizer] %s '%s': strokes=%d points=%d similarity=%.3f confidence=%.3f recognized=%d\n",
                Scoring::ToString(mode), target.c_str(), details.strokeCount, details.totalPoints,
                similarity, confidence, result.recognized ? 1 : 0);
#endif

        return result;
    } catch (const std::exception& e) {
        return MakeFallbackResult(mode, target, e.what());
    } catch (...) {
        return MakeFallbackResult(mode, target, MSG_UNKNOWN_ERROR);
    }
}

RecognitionResult RecognizerImpl::MakeEmptyResult(RecognitionMode mode, RecognitionStatus status,
                                                  const char* message) const {
    RecognitionResult result;
    result.confidence = 0.0;
    result.recognized = false;
    result.status = status;
    result.mode = mode;
    result.details.message = message;

    if (mode == RecognitionMode::Lenient) {
        result.details.encouragementLevel = EncouragementLevel::Poor;
        result.details.childFriendlyScore = 0.0;
    }
    return result;
}

RecognitionResult RecognizerImpl::MakeFallbackResult(RecognitionMode mode, const std::string& target,
                                                     const std::string& error) {
    const bool lenient = (mode == RecognitionMode::Lenient);
    const double confidence = lenient ? LENIENT_FALLBACK_CONFIDENCE : STRICT_FALLBACK_CONFIDENCE;

    fprintf(stderr, "[Recognizer] %s recognition of '%s' failed: %s (returning fallback)\n",
            Scoring::ToString(mode), target.c_str(), error.c_str());

    RecognitionResult result;
    result.character = target;
    result.confidence = confidence;
    result.recognized = true;
    result.status = RecognitionStatus::Fallback;
    result.mode = mode;

    RecognitionDetails& details = result.details;
    details.error = error;
    details.fallback = true;
    details.similarity = confidence;
    details.strokeCount = 0;

    if (lenient) {
        details.childFriendlyScore = confidence;
        details.encouragementLevel = EncouragementLevel::Fair;
        details.normalizedForChild = true;
        details.message = MSG_FALLBACK_ENCOURAGING;
    }

    RecognitionError event;
    event.type = lenient ? "child-recognition" : "recognition";
    event.message = error;
    event.target = target;
    event.handledGracefully = true;
    ReportError(event);

    return result;
}

void RecognizerImpl::ReportError(const RecognitionError& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = onError_;
    }
    if (!callback) {
        return;
    }

    try {
        callback(error);
    } catch (const std::exception& e) {
        fprintf(stderr, "[Recognizer] Error callback threw: %s\n", e.what());
    } catch (...) {
        fprintf(stderr, "[Recognizer] Error callback threw: %s\n", MSG_UNKNOWN_ERROR);
    }
}

} // namespace Internal

// =============================================================================
// Recognizer Public API
// =============================================================================

Recognizer::Recognizer()
    : Recognizer(RecognizerParams()) {}

Recognizer::Recognizer(const RecognizerParams& params)
    : Recognizer(params, Template::LoadFromRegistry) {}

Recognizer::Recognizer(const RecognizerParams& params, Template::TemplateLoader loader)
    : impl_(std::make_unique<Internal::RecognizerImpl>(params, std::move(loader))) {}

Recognizer::~Recognizer() = default;

Recognizer::Recognizer(Recognizer&& other) noexcept = default;

Recognizer& Recognizer::operator=(Recognizer&& other) noexcept = default;

RecognitionResult Recognizer::Recognize(const Drawing& drawing, const std::string& target,
                                        RecognitionMode mode) const {
    return impl_->Recognize(drawing, target, mode, nullptr);
}

std::future<RecognitionResult> Recognizer::RecognizeAsync(const Drawing& drawing,
                                                          const std::string& target,
                                                          RecognitionMode mode) const {
    Internal::RecognizerImpl* impl = impl_.get();
    return std::async(std::launch::async, [impl, drawing, target, mode]() {
        return impl->Recognize(drawing, target, mode, nullptr);
    });
}

std::vector<RecognitionResult> Recognizer::RecognizeBatch(const std::vector<Drawing>& drawings,
                                                          const std::string& target,
                                                          RecognitionMode mode) const {
    std::vector<RecognitionResult> results(drawings.size());
    if (drawings.empty()) {
        return results;
    }

    // Resolve once; on failure every drawing takes the per-call path and falls back there
    std::optional<Template::CharacterTemplate> tmpl;
    try {
        tmpl = impl_->ResolveTemplate(target);
    } catch (const std::exception& e) {
        fprintf(stderr, "[Recognizer] Template lookup for '%s' failed: %s\n", target.c_str(), e.what());
    } catch (...) {
        fprintf(stderr, "[Recognizer] Template lookup for '%s' failed: %s\n", target.c_str(), MSG_UNKNOWN_ERROR);
    }
    const Template::CharacterTemplate* shared = tmpl ? &*tmpl : nullptr;

    const int32_t count = static_cast<int32_t>(drawings.size());
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int32_t i = 0; i < count; ++i) {
        results[i] = impl_->Recognize(drawings[i], target, mode, shared);
    }

    return results;
}

ValidationReport Recognizer::Validate(const Drawing& drawing, const std::string& target) const {
    ValidationReport report;

    if (drawing.IsEmpty()) {
        report.issues.push_back("Drawing has no strokes");
    }
    if (drawing.StrokeCount() > impl_->params_.maxStrokes) {
        report.issues.push_back("Drawing has too many strokes (" + std::to_string(drawing.StrokeCount()) +
                                " > " + std::to_string(impl_->params_.maxStrokes) + ")");
    }
    if (target.empty()) {
        report.issues.push_back("No target character specified");
    }
    if (!Template::IsCharacterSupported(target)) {
        report.issues.push_back("No template for target character: " + target);
    }

    report.valid = report.issues.empty();
    return report;
}

void Recognizer::SetErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex_);
    impl_->onError_ = std::move(callback);
}

const RecognizerParams& Recognizer::GetParams() const {
    return impl_->params_;
}

bool Recognizer::IsAngleWithinTolerance(double actualAngle, double expectedAngle) const {
    return Kana::Reco::Internal::IsAngleWithinTolerance(actualAngle, expectedAngle,
                                                        impl_->params_.angleTolerance);
}

size_t Recognizer::CleanupTemplateCache() {
    return impl_->store_.Cleanup();
}

size_t Recognizer::CleanupTemplateCache(size_t maxCacheSize) {
    return impl_->store_.Cleanup(maxCacheSize);
}

void Recognizer::ClearTemplateCache() {
    impl_->store_.Clear();
}

Template::TemplateCacheStats Recognizer::GetMemoryUsage() const {
    return impl_->store_.GetStats();
}

std::vector<Template::TemplateInfo> Recognizer::GetAllTemplateInfo() const {
    return impl_->store_.GetAllTemplateInfo();
}

Template::TemplateStore& Recognizer::GetTemplateStore() {
    return impl_->store_;
}

} // namespace Kana::Reco::Recognition
