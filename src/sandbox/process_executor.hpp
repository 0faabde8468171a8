#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "policy/path_resolver.hpp"
#include "policy/policy_guard.hpp"
#include "sandbox/io_staging.hpp"
#include "sandbox/sandboxed_executor.hpp"

namespace warden::sandbox {

struct ProcessExecutorOptions {
    // Input files must resolve inside this directory.
    std::filesystem::path allowed_root = std::filesystem::current_path();
    // Applied over the minimal base (PATH, HOME, LANG) and under the request's own.
    std::map<std::string, std::string> base_environment;
    // Start from the full host environment instead of the minimal base.
    bool inherit_environment = false;
    policy::CommandPolicy command_policy;
    // Per stream; 0 means unlimited.
    std::size_t max_output_bytes = 0;
    std::chrono::milliseconds kill_grace{2000};
    bool recursive_artifacts = false;
    // Where INPUT_DIR and OUTPUT_DIR are created.
    std::filesystem::path scratch_parent = std::filesystem::temp_directory_path();
};

// Runs the command as a direct child process under a watchdog.
class ProcessExecutor : public SandboxedExecutor {
public:
    explicit ProcessExecutor(ProcessExecutorOptions options = {});

    protocol::ExecutionResult execute(
        const protocol::ExecutionRequest& request) const override;

    // Always available: spawning a process needs nothing external.
    std::optional<std::string> check_availability() const override;

    std::optional<protocol::Denied> validate(
        const protocol::ExecutionRequest& request) const override;

    const ProcessExecutorOptions& options() const { return options_; }

private:
    // Everything that must hold before a scratch directory is created.
    core::errors::Result<std::vector<StagedInput>> preflight(
        const protocol::ExecutionRequest& request) const;

    std::map<std::string, std::string> build_environment(
        const protocol::ExecutionRequest& request, const std::filesystem::path& input_dir,
        const std::filesystem::path& output_dir) const;

    ProcessExecutorOptions options_;
    policy::SecurePathResolver resolver_;
    policy::PolicyGuard guard_;
};

}  // namespace warden::sandbox
