#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "script/script_language.hpp"

namespace warden::script {

// A script file in a skill's scripts/ directory.
struct Script {
    std::string skill_name;
    std::string file_name;
    // std::nullopt for unrecognized extensions; never executable.
    std::optional<ScriptLanguage> language;
    std::filesystem::path base_path;

    // Detects the language from the file name.
    static Script from_file(std::string skill_name, std::string file_name,
                            std::filesystem::path base_path);

    // base_path/scripts/file_name
    std::filesystem::path script_path() const;

    // skill_name + "_" + file name without its last extension.
    std::string tool_name() const;
};

}  // namespace warden::script
