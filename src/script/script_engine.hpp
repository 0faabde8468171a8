#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "protocol/execution_result.hpp"
#include "script/script.hpp"
#include "script/script_language.hpp"

namespace warden::script {

// Turns "run this script" into an execution on some sandbox.
class ScriptEngine {
public:
    virtual ~ScriptEngine() = default;

    virtual LanguageSet supported_languages() const = 0;

    // Scripts see INPUT_DIR (copies of input_files) and OUTPUT_DIR.
    virtual protocol::ExecutionResult execute(
        const Script& script, const std::vector<std::string>& args,
        const std::optional<std::string>& stdin_data,
        const std::vector<std::filesystem::path>& input_files) const = 0;

    // Denies scripts whose language is not supported.
    virtual std::optional<protocol::Denied> validate(const Script& script) const;

protected:
    std::optional<protocol::Denied> check_language(const Script& script) const;
};

// Runs nothing. Scripts stay readable as files; only execution is refused.
class NoOpScriptEngine : public ScriptEngine {
public:
    LanguageSet supported_languages() const override;

    protocol::ExecutionResult execute(
        const Script& script, const std::vector<std::string>& args,
        const std::optional<std::string>& stdin_data,
        const std::vector<std::filesystem::path>& input_files) const override;

    std::optional<protocol::Denied> validate(const Script& script) const override;
};

}  // namespace warden::script
