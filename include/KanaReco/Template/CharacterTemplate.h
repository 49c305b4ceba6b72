#pragma once

/**
 * @file CharacterTemplate.h
 * @brief Reference shape description of one character
 */

#include <KanaReco/Feature/FeatureExtractor.h>

#include <cstdint>
#include <string>

namespace Kana::Reco::Template {

/**
 * @brief Expected stroke count, shape descriptors and complexity
 *
 * Complexity is nominally in [0, 1]. Scoring tolerates values outside
 * that range and non-finite values (treated as unknown).
 */
struct CharacterTemplate {
    int32_t strokeCount = 0;
    Feature::ShapeFeatures features;
    double complexity = 0.0;

    bool operator==(const CharacterTemplate& other) const {
        return strokeCount == other.strokeCount &&
               features == other.features &&
               complexity == other.complexity;
    }
    bool operator!=(const CharacterTemplate& other) const { return !(*this == other); }
};

/**
 * @brief Generic template used for characters without reference data
 *
 * Two strokes, curve only, medium complexity.
 */
inline CharacterTemplate MakeFallbackTemplate() {
    CharacterTemplate tmpl;
    tmpl.strokeCount = 2;
    tmpl.features.hasCurve = true;
    tmpl.complexity = 0.5;
    return tmpl;
}

/**
 * @brief Template together with its cache state
 */
struct TemplateInfo {
    std::string character;
    CharacterTemplate tmpl;
    bool supported = true;      ///< Present in the built-in registry
    bool loaded = false;        ///< Currently resident in the template cache
};

} // namespace Kana::Reco::Template
