#include "script/engine_factory.hpp"

#include <stdexcept>
#include "sandbox/container_executor.hpp"
#include "sandbox/executor_factory.hpp"
#include "sandbox/process_executor.hpp"
#include "script/container_script_engine.hpp"

namespace warden::script {

using core::config::ExecutorKind;
using core::errors::ErrorCategory;
using core::errors::SandboxError;

core::errors::Result<LanguageSet> languages_from(const core::config::SandboxConfig& config) {
    if (config.supported_languages.empty()) {
        return all_languages();
    }
    LanguageSet languages;
    for (const auto& name : config.supported_languages) {
        const auto language = parse_language(name);
        if (!language.has_value()) {
            return SandboxError{ErrorCategory::Input, "Unknown script language: " + name,
                                "invalid_config",
                                "Known languages: " + describe_languages(all_languages())};
        }
        languages.insert(language.value());
    }
    return languages;
}

core::errors::Result<InterpreterMap> interpreters_from(
    const core::config::SandboxConfig& config) {
    InterpreterMap interpreters = default_interpreters();
    for (const auto& [name, command] : config.interpreters) {
        const auto language = parse_language(name);
        if (!language.has_value()) {
            return SandboxError{ErrorCategory::Input,
                                "Interpreter configured for unknown language: " + name,
                                "invalid_config"};
        }
        interpreters[language.value()] = command;
    }
    return interpreters;
}

core::errors::Result<std::unique_ptr<ScriptEngine>> make_script_engine(
    const core::config::SandboxConfig& config) {
    if (config.executor == ExecutorKind::None) {
        return std::unique_ptr<ScriptEngine>(std::make_unique<NoOpScriptEngine>());
    }

    auto languages = languages_from(config);
    if (core::errors::is_error(languages)) {
        return core::errors::get_error(languages);
    }
    auto interpreters = interpreters_from(config);
    if (core::errors::is_error(interpreters)) {
        return core::errors::get_error(interpreters);
    }

    try {
        if (config.executor == ExecutorKind::Container) {
            ContainerScriptEngineOptions options;
            options.timeout = config.timeout;
            options.supported_languages = core::errors::get_value(languages);
            options.interpreters = core::errors::get_value(interpreters);
            std::shared_ptr<const sandbox::ContainerExecutor> executor =
                std::make_shared<sandbox::ContainerExecutor>(
                    sandbox::container_options_from(config));
            return std::unique_ptr<ScriptEngine>(
                std::make_unique<ContainerScriptEngine>(std::move(executor), options));
        }

        ExecutorScriptEngineOptions options;
        options.timeout = config.timeout;
        options.supported_languages = core::errors::get_value(languages);
        options.interpreters = core::errors::get_value(interpreters);
        std::shared_ptr<const sandbox::SandboxedExecutor> executor =
            std::make_shared<sandbox::ProcessExecutor>(sandbox::process_options_from(config));
        return std::unique_ptr<ScriptEngine>(
            std::make_unique<ExecutorScriptEngine>(std::move(executor), options));
    } catch (const std::invalid_argument& e) {
        return SandboxError{ErrorCategory::Input,
                            std::string("Invalid script engine configuration: ") + e.what(),
                            "invalid_config"};
    }
}

}  // namespace warden::script
