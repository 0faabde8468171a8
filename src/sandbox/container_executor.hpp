#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "policy/path_resolver.hpp"
#include "policy/policy_guard.hpp"
#include "sandbox/child_process.hpp"
#include "sandbox/io_staging.hpp"
#include "sandbox/sandboxed_executor.hpp"

namespace warden::sandbox {

constexpr const char* kDefaultSandboxImage = "warden/sandbox:latest";

struct VolumeMount {
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only = false;

    // host:container:ro|rw
    std::string to_volume_arg() const;
};

struct ContainerExecutorOptions {
    std::string image = kDefaultSandboxImage;
    // Container CLI, resolved on the host PATH.
    std::string runtime = "docker";
    bool network_enabled = true;
    std::optional<std::string> memory_limit = std::string("512m");
    std::optional<std::string> cpu_limit = std::string("1.0");
    std::map<std::string, std::string> base_environment;
    std::optional<std::string> user;
    std::string work_dir = "/workspace";
    std::vector<VolumeMount> mounts;
    bool read_only_rootfs = false;

    std::filesystem::path allowed_root = std::filesystem::current_path();
    policy::CommandPolicy command_policy;
    std::size_t max_output_bytes = 0;
    std::chrono::milliseconds kill_grace{2000};
    bool recursive_artifacts = false;
    std::filesystem::path scratch_parent = std::filesystem::temp_directory_path();
    // Bounds for the runtime calls that are not the command itself.
    std::chrono::milliseconds query_timeout{5000};
    std::chrono::milliseconds create_timeout{120000};

    // No network, 256m memory, half a CPU, read-only root filesystem.
    static ContainerExecutorOptions isolated(std::string image = kDefaultSandboxImage);
    static ContainerExecutorOptions for_python(std::string image = "python:3.11-slim",
                                               bool network_enabled = false);
};

// Runs each command in a fresh container: create, start with a bounded wait,
// kill on timeout, and always remove.
class ContainerExecutor : public SandboxedExecutor {
public:
    explicit ContainerExecutor(ContainerExecutorOptions options = {});

    protocol::ExecutionResult execute(
        const protocol::ExecutionRequest& request) const override;

    // As execute(), with mounts that apply to this run only.
    protocol::ExecutionResult execute_with_mounts(
        const protocol::ExecutionRequest& request,
        const std::vector<VolumeMount>& extra_mounts) const;

    // Runs `<runtime> version`.
    std::optional<std::string> check_availability() const override;

    // Request and path checks only; runtime reachability is left to
    // check_availability() and surfaces as Failed from execute().
    std::optional<protocol::Denied> validate(
        const protocol::ExecutionRequest& request) const override;

    bool image_exists(const std::string& image) const;

    // Arguments following the runtime binary for `create`.
    std::vector<std::string> build_create_command(
        const std::string& container_name, const protocol::ExecutionRequest& request,
        const std::filesystem::path& input_dir, const std::filesystem::path& output_dir,
        const std::optional<std::filesystem::path>& host_work_dir,
        const std::vector<VolumeMount>& extra_mounts) const;

    const ContainerExecutorOptions& options() const { return options_; }

private:
    struct Preflight {
        std::vector<StagedInput> inputs;
        std::optional<std::filesystem::path> host_work_dir;
    };

    core::errors::Result<Preflight> preflight(const protocol::ExecutionRequest& request) const;

    core::errors::Result<ProcessCapture> run_runtime(
        std::vector<std::string> args, std::chrono::milliseconds timeout,
        std::optional<std::string> stdin_data = std::nullopt,
        std::function<void()> on_timeout = {}) const;

    void remove_container(const std::string& container_name) const;

    ContainerExecutorOptions options_;
    policy::SecurePathResolver resolver_;
    policy::PolicyGuard guard_;
};

}  // namespace warden::sandbox
