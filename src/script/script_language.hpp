#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden::script {

enum class ScriptLanguage {
    Python,
    Bash,
    JavaScript,
    KotlinScript
};

using LanguageSet = std::set<ScriptLanguage>;

// One row per language. Adding a language means adding a row here.
struct LanguageSpec {
    ScriptLanguage language;
    std::string name;
    std::vector<std::string> extensions;
    std::vector<std::string> default_interpreter;
};

const std::vector<LanguageSpec>& language_table();

// Case-insensitive on the extension; std::nullopt when unrecognized.
std::optional<ScriptLanguage> language_from_file_name(const std::string& file_name);

std::string to_string(ScriptLanguage language);
std::optional<ScriptLanguage> parse_language(const std::string& name);

LanguageSet all_languages();
std::vector<std::string> default_interpreter(ScriptLanguage language);

// "python, bash" in table order, "none" when empty.
std::string describe_languages(const LanguageSet& languages);

}  // namespace warden::script
