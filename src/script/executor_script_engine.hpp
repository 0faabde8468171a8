#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sandbox/sandboxed_executor.hpp"
#include "script/script_engine.hpp"

namespace warden::script {

using InterpreterMap = std::map<ScriptLanguage, std::vector<std::string>>;

InterpreterMap default_interpreters();

struct ExecutorScriptEngineOptions {
    std::chrono::milliseconds timeout{30000};
    LanguageSet supported_languages = all_languages();
    // Command prefix per language; the script path and args are appended.
    InterpreterMap interpreters = default_interpreters();
    std::map<std::string, std::string> environment;
};

// Runs scripts from their host path through any host-side executor, with the
// skill directory as working directory.
class ExecutorScriptEngine : public ScriptEngine {
public:
    ExecutorScriptEngine(std::shared_ptr<const sandbox::SandboxedExecutor> executor,
                         ExecutorScriptEngineOptions options = {});

    LanguageSet supported_languages() const override;

    protocol::ExecutionResult execute(
        const Script& script, const std::vector<std::string>& args,
        const std::optional<std::string>& stdin_data,
        const std::vector<std::filesystem::path>& input_files) const override;

    // Language, interpreter mapping, and the script file itself.
    std::optional<protocol::Denied> validate(const Script& script) const override;

    // The request execute() would submit.
    protocol::ExecutionRequest build_request(
        const Script& script, const std::vector<std::string>& args,
        const std::optional<std::string>& stdin_data,
        const std::vector<std::filesystem::path>& input_files) const;

private:
    std::shared_ptr<const sandbox::SandboxedExecutor> executor_;
    ExecutorScriptEngineOptions options_;
};

}  // namespace warden::script
