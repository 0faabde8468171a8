#include "script/script_language.hpp"

#include <algorithm>
#include <cctype>

namespace warden::script {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}  // namespace

const std::vector<LanguageSpec>& language_table() {
    static const std::vector<LanguageSpec> kLanguages = {
        {ScriptLanguage::Python, "python", {"py"}, {"python3"}},
        {ScriptLanguage::Bash, "bash", {"sh", "bash"}, {"bash"}},
        {ScriptLanguage::JavaScript, "javascript", {"js", "mjs"}, {"node"}},
        {ScriptLanguage::KotlinScript, "kotlin_script", {"kts"}, {"kotlin"}},
    };
    return kLanguages;
}

std::optional<ScriptLanguage> language_from_file_name(const std::string& file_name) {
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    const std::string extension = lowercase(file_name.substr(dot + 1));
    for (const auto& spec : language_table()) {
        if (std::find(spec.extensions.begin(), spec.extensions.end(), extension) !=
            spec.extensions.end()) {
            return spec.language;
        }
    }
    return std::nullopt;
}

std::string to_string(const ScriptLanguage language) {
    for (const auto& spec : language_table()) {
        if (spec.language == language) {
            return spec.name;
        }
    }
    return "unknown";
}

std::optional<ScriptLanguage> parse_language(const std::string& name) {
    const std::string wanted = lowercase(name);
    for (const auto& spec : language_table()) {
        if (spec.name == wanted) {
            return spec.language;
        }
    }
    return std::nullopt;
}

LanguageSet all_languages() {
    LanguageSet languages;
    for (const auto& spec : language_table()) {
        languages.insert(spec.language);
    }
    return languages;
}

std::vector<std::string> default_interpreter(const ScriptLanguage language) {
    for (const auto& spec : language_table()) {
        if (spec.language == language) {
            return spec.default_interpreter;
        }
    }
    return {};
}

std::string describe_languages(const LanguageSet& languages) {
    std::string listing;
    for (const auto& spec : language_table()) {
        if (languages.count(spec.language) == 0) {
            continue;
        }
        listing += listing.empty() ? spec.name : ", " + spec.name;
    }
    return listing.empty() ? "none" : listing;
}

}  // namespace warden::script
