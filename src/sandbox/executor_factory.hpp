#pragma once

#include <memory>
#include "core/config/sandbox_config.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "sandbox/container_executor.hpp"
#include "sandbox/process_executor.hpp"
#include "sandbox/sandboxed_executor.hpp"

namespace warden::sandbox {

ProcessExecutorOptions process_options_from(const core::config::SandboxConfig& config);
ContainerExecutorOptions container_options_from(const core::config::SandboxConfig& config);

// Builds the configured strategy. ExecutorKind::None yields the NoOpExecutor.
core::errors::Result<std::unique_ptr<SandboxedExecutor>> make_executor(
    const core::config::SandboxConfig& config);

}  // namespace warden::sandbox
