/**
 * @file ScoringPolicy.cpp
 * @brief Policy factory
 */

#include <KanaReco/Scoring/ScoringPolicy.h>

#include <memory>

namespace Kana::Reco::Scoring {

std::unique_ptr<ScoringPolicy> CreateScoringPolicy(RecognitionMode mode) {
    if (mode == RecognitionMode::Lenient) {
        return std::make_unique<LenientPolicy>();
    }
    return std::make_unique<StrictPolicy>();
}

std::unique_ptr<ScoringPolicy> CreateScoringPolicy(RecognitionMode mode, double recognitionThreshold) {
    if (mode == RecognitionMode::Lenient) {
        return std::make_unique<LenientPolicy>(recognitionThreshold);
    }
    return std::make_unique<StrictPolicy>(recognitionThreshold);
}

} // namespace Kana::Reco::Scoring
