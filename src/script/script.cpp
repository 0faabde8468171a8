#include "script/script.hpp"

#include <utility>

namespace warden::script {

Script Script::from_file(std::string skill_name, std::string file_name,
                         std::filesystem::path base_path) {
    Script script;
    script.language = language_from_file_name(file_name);
    script.skill_name = std::move(skill_name);
    script.file_name = std::move(file_name);
    script.base_path = std::move(base_path);
    return script;
}

std::filesystem::path Script::script_path() const {
    return base_path / "scripts" / file_name;
}

std::string Script::tool_name() const {
    const auto dot = file_name.find_last_of('.');
    return skill_name + "_" + (dot == std::string::npos ? file_name : file_name.substr(0, dot));
}

}  // namespace warden::script
