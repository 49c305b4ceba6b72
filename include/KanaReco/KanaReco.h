#pragma once

/**
 * @file KanaReco.h
 * @brief Main header file for KanaReco library
 *
 * KanaReco scores hand-drawn hiragana against reference templates, with a
 * strict policy for baseline matching and a lenient policy for children.
 *
 * @version 0.1.0
 */

// Core types and utilities
#include <KanaReco/Core/Types.h>
#include <KanaReco/Core/Constants.h>
#include <KanaReco/Core/Exception.h>
#include <KanaReco/Core/Drawing.h>

// Pipeline modules
#include <KanaReco/Preprocess/StrokeNormalizer.h>
#include <KanaReco/Feature/FeatureExtractor.h>
#include <KanaReco/Template/CharacterTemplate.h>
#include <KanaReco/Template/TemplateRegistry.h>
#include <KanaReco/Template/TemplateStore.h>
#include <KanaReco/Scoring/ScoringTypes.h>
#include <KanaReco/Scoring/Metrics.h>
#include <KanaReco/Scoring/ScoringPolicy.h>
#include <KanaReco/Recognition/RecognitionTypes.h>
#include <KanaReco/Recognition/Recognizer.h>

namespace Kana::Reco {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return "0.1.0";
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = 0;
    minor = 1;
    patch = 0;
}

} // namespace Kana::Reco
