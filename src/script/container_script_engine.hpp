#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sandbox/container_executor.hpp"
#include "script/executor_script_engine.hpp"
#include "script/script_engine.hpp"

namespace warden::script {

struct ContainerScriptEngineOptions {
    std::chrono::milliseconds timeout{60000};
    LanguageSet supported_languages = all_languages();
    // Interpreters as named inside the image.
    InterpreterMap interpreters = default_interpreters();
    std::map<std::string, std::string> environment;
};

// Copies the script into a scratch directory mounted read-only at /script and
// runs it inside a fresh container.
class ContainerScriptEngine : public ScriptEngine {
public:
    ContainerScriptEngine(std::shared_ptr<const sandbox::ContainerExecutor> executor,
                          ContainerScriptEngineOptions options = {});

    LanguageSet supported_languages() const override;

    protocol::ExecutionResult execute(
        const Script& script, const std::vector<std::string>& args,
        const std::optional<std::string>& stdin_data,
        const std::vector<std::filesystem::path>& input_files) const override;

    // Also denies while the container runtime is unreachable.
    std::optional<protocol::Denied> validate(const Script& script) const override;

private:
    std::optional<protocol::Denied> validate_script(const Script& script) const;

    std::shared_ptr<const sandbox::ContainerExecutor> executor_;
    ContainerScriptEngineOptions options_;
};

}  // namespace warden::script
