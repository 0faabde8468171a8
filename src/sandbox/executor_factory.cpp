#include "sandbox/executor_factory.hpp"

#include <stdexcept>
#include "sandbox/noop_executor.hpp"

namespace warden::sandbox {

using core::config::ExecutorKind;
using core::errors::ErrorCategory;
using core::errors::SandboxError;

ProcessExecutorOptions process_options_from(const core::config::SandboxConfig& config) {
    ProcessExecutorOptions options;
    options.allowed_root = config.allowed_root;
    options.base_environment = config.base_environment;
    options.inherit_environment = config.inherit_environment;
    options.command_policy.allowed_programs = config.allowed_programs;
    options.max_output_bytes = config.max_output_bytes;
    options.kill_grace = config.kill_grace;
    options.recursive_artifacts = config.recursive_artifacts;
    return options;
}

ContainerExecutorOptions container_options_from(const core::config::SandboxConfig& config) {
    const auto& container = config.container;
    ContainerExecutorOptions options;
    options.image = container.image;
    options.runtime = container.runtime;
    options.network_enabled = container.network_enabled;
    options.memory_limit = container.memory_limit;
    options.cpu_limit = container.cpu_limit;
    options.read_only_rootfs = container.read_only_rootfs;
    options.user = container.user;
    options.work_dir = container.work_dir;
    options.base_environment = config.base_environment;
    options.allowed_root = config.allowed_root;
    options.command_policy.allowed_programs = config.allowed_programs;
    options.max_output_bytes = config.max_output_bytes;
    options.kill_grace = config.kill_grace;
    options.recursive_artifacts = config.recursive_artifacts;
    return options;
}

core::errors::Result<std::unique_ptr<SandboxedExecutor>> make_executor(
    const core::config::SandboxConfig& config) {
    try {
        switch (config.executor) {
            case ExecutorKind::Process:
                return std::unique_ptr<SandboxedExecutor>(
                    std::make_unique<ProcessExecutor>(process_options_from(config)));
            case ExecutorKind::Container:
                return std::unique_ptr<SandboxedExecutor>(
                    std::make_unique<ContainerExecutor>(container_options_from(config)));
            case ExecutorKind::None:
            default:
                return std::unique_ptr<SandboxedExecutor>(std::make_unique<NoOpExecutor>());
        }
    } catch (const std::invalid_argument& e) {
        return SandboxError{ErrorCategory::Input,
                            std::string("Invalid executor configuration: ") + e.what(),
                            "invalid_config"};
    }
}

}  // namespace warden::sandbox
