/**
 * @file TemplateRegistry.cpp
 * @brief Built-in hiragana reference data
 */

#include <KanaReco/Template/TemplateRegistry.h>

namespace Kana::Reco::Template {

namespace {

// Stroke count, {horizontal, vertical, curve}, complexity
std::map<std::string, CharacterTemplate> BuildRegistry() {
    return {
        // A-row
        {"あ", {3, {true, true, true}, 0.7}},
        {"い", {2, {false, true, true}, 0.4}},
        {"う", {2, {true, false, true}, 0.3}},
        {"え", {2, {true, false, true}, 0.4}},
        {"お", {3, {true, true, true}, 0.6}},
        // K-row
        {"か", {3, {true, true, false}, 0.6}},
        {"き", {4, {true, true, true}, 0.8}},
        {"く", {1, {false, false, true}, 0.2}},
        {"け", {3, {true, true, true}, 0.7}},
        {"こ", {2, {true, false, false}, 0.3}},
        // S-row
        {"さ", {3, {true, false, true}, 0.5}},
        {"し", {1, {false, false, true}, 0.3}},
        {"す", {2, {false, false, true}, 0.4}},
        {"せ", {3, {true, false, true}, 0.6}},
        {"そ", {1, {false, false, true}, 0.2}},
        // T-row
        {"た", {4, {true, true, false}, 0.7}},
        {"ち", {2, {false, true, true}, 0.5}},
        {"つ", {1, {false, false, true}, 0.3}},
        {"て", {1, {false, false, true}, 0.2}},
        {"と", {2, {false, true, true}, 0.4}},
        // N-row
        {"な", {4, {true, true, true}, 0.8}},
        {"に", {3, {true, true, false}, 0.5}},
        {"ぬ", {2, {false, false, true}, 0.6}},
        {"ね", {2, {false, false, true}, 0.5}},
        {"の", {1, {false, false, true}, 0.2}},
        // H-row
        {"は", {3, {true, true, true}, 0.7}},
        {"ひ", {1, {false, true, false}, 0.2}},
        {"ふ", {4, {true, false, true}, 0.8}},
        {"へ", {1, {false, false, true}, 0.1}},
        {"ほ", {4, {true, true, true}, 0.9}},
        // M-row
        {"ま", {3, {true, false, true}, 0.6}},
        {"み", {2, {false, false, true}, 0.5}},
        {"む", {3, {true, false, true}, 0.7}},
        {"め", {2, {false, false, true}, 0.6}},
        {"も", {3, {true, true, true}, 0.7}},
        // Y-row
        {"や", {3, {true, true, true}, 0.6}},
        {"ゆ", {2, {false, true, true}, 0.5}},
        {"よ", {2, {true, false, true}, 0.4}},
        // R-row
        {"ら", {2, {false, false, true}, 0.5}},
        {"り", {2, {false, true, true}, 0.4}},
        {"る", {1, {false, false, true}, 0.4}},
        {"れ", {1, {false, false, true}, 0.3}},
        {"ろ", {3, {true, false, true}, 0.6}},
        // W-row
        {"わ", {3, {true, false, true}, 0.6}},
        {"を", {3, {true, true, true}, 0.7}},
        {"ん", {1, {false, false, true}, 0.2}},
    };
}

} // anonymous namespace

const std::vector<std::string>& DefaultBasicCharacters() {
    static const std::vector<std::string> basic = {"あ", "い", "う", "え", "お"};
    return basic;
}

const std::map<std::string, CharacterTemplate>& GetTemplateRegistry() {
    static const std::map<std::string, CharacterTemplate> registry = BuildRegistry();
    return registry;
}

std::optional<CharacterTemplate> FindRegisteredTemplate(const std::string& character) {
    const auto& registry = GetTemplateRegistry();
    auto it = registry.find(character);
    if (it == registry.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IsCharacterSupported(const std::string& character) {
    return GetTemplateRegistry().count(character) > 0;
}

std::vector<std::string> GetSupportedCharacters() {
    std::vector<std::string> characters;
    characters.reserve(GetTemplateRegistry().size());
    for (const auto& entry : GetTemplateRegistry()) {
        characters.push_back(entry.first);
    }
    return characters;
}

ComplexityGroups GetCharactersByComplexity() {
    ComplexityGroups groups;
    for (const auto& [character, tmpl] : GetTemplateRegistry()) {
        if (tmpl.complexity < 0.3) {
            groups.simple.push_back(character);
        } else if (tmpl.complexity < 0.7) {
            groups.medium.push_back(character);
        } else {
            groups.complex.push_back(character);
        }
    }
    return groups;
}

} // namespace Kana::Reco::Template
