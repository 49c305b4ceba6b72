#pragma once

/**
 * @file TemplateRegistry.h
 * @brief Built-in reference templates for the 46 basic hiragana
 *
 * The registry is an immutable table built on first use. Characters are
 * identified by their UTF-8 encoded glyph.
 */

#include <KanaReco/Template/CharacterTemplate.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Kana::Reco::Template {

/**
 * @brief Characters kept resident in every TemplateStore by default
 */
const std::vector<std::string>& DefaultBasicCharacters();

/**
 * @brief Full registry, ordered by character
 */
const std::map<std::string, CharacterTemplate>& GetTemplateRegistry();

/**
 * @brief Look up the reference template of a character
 * @return Empty optional for unregistered characters
 */
std::optional<CharacterTemplate> FindRegisteredTemplate(const std::string& character);

bool IsCharacterSupported(const std::string& character);

/**
 * @brief All registered characters, sorted
 */
std::vector<std::string> GetSupportedCharacters();

/**
 * @brief Registered characters grouped by template complexity
 */
struct ComplexityGroups {
    std::vector<std::string> simple;    ///< complexity < 0.3
    std::vector<std::string> medium;    ///< 0.3 <= complexity < 0.7
    std::vector<std::string> complex;   ///< complexity >= 0.7
};

ComplexityGroups GetCharactersByComplexity();

} // namespace Kana::Reco::Template
