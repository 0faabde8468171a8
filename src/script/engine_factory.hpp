#pragma once

#include <memory>
#include "core/config/sandbox_config.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "script/executor_script_engine.hpp"
#include "script/script_engine.hpp"

namespace warden::script {

// Language names to languages; empty means every language.
core::errors::Result<LanguageSet> languages_from(const core::config::SandboxConfig& config);

// Defaults overridden by the configured interpreter commands.
core::errors::Result<InterpreterMap> interpreters_from(
    const core::config::SandboxConfig& config);

// ExecutorKind::None yields the NoOpScriptEngine.
core::errors::Result<std::unique_ptr<ScriptEngine>> make_script_engine(
    const core::config::SandboxConfig& config);

}  // namespace warden::script
