#include "sandbox/container_executor.hpp"

#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/scratch_directory.hpp"

namespace warden::sandbox {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

namespace {

constexpr const char* kContainerInputDir = "/input";
constexpr const char* kContainerOutputDir = "/output";
constexpr std::chrono::milliseconds kRemoveTimeout{30000};

// Removes the container on scope exit, whatever the outcome.
class ContainerRemovalGuard {
public:
    ContainerRemovalGuard(std::function<void(const std::string&)> remove, std::string name)
        : remove_(std::move(remove)), name_(std::move(name)) {}
    ~ContainerRemovalGuard() { remove_(name_); }

    ContainerRemovalGuard(const ContainerRemovalGuard&) = delete;
    ContainerRemovalGuard& operator=(const ContainerRemovalGuard&) = delete;

private:
    std::function<void(const std::string&)> remove_;
    std::string name_;
};

std::string trimmed(std::string text) {
    const auto end = text.find_last_not_of(" \t\r\n");
    text.erase(end == std::string::npos ? 0 : end + 1);
    return text;
}

}  // namespace

std::string VolumeMount::to_volume_arg() const {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(host_path, ec);
    return (ec ? host_path : absolute).string() + ":" + container_path +
           (read_only ? ":ro" : ":rw");
}

ContainerExecutorOptions ContainerExecutorOptions::isolated(std::string image) {
    ContainerExecutorOptions options;
    options.image = std::move(image);
    options.network_enabled = false;
    options.memory_limit = "256m";
    options.cpu_limit = "0.5";
    options.read_only_rootfs = true;
    return options;
}

ContainerExecutorOptions ContainerExecutorOptions::for_python(std::string image,
                                                              const bool network_enabled) {
    ContainerExecutorOptions options;
    options.image = std::move(image);
    options.network_enabled = network_enabled;
    options.memory_limit = "512m";
    options.cpu_limit = "1.0";
    return options;
}

ContainerExecutor::ContainerExecutor(ContainerExecutorOptions options)
    : options_(std::move(options)),
      resolver_(options_.allowed_root),
      guard_(options_.command_policy) {
    if (options_.image.empty()) {
        throw std::invalid_argument("container image must not be empty");
    }
    if (options_.runtime.empty()) {
        throw std::invalid_argument("container runtime must not be empty");
    }
    if (options_.work_dir.empty() || options_.work_dir.front() != '/') {
        throw std::invalid_argument("container work_dir must be an absolute path");
    }
    if (options_.kill_grace.count() < 0 || options_.query_timeout.count() <= 0 ||
        options_.create_timeout.count() <= 0) {
        throw std::invalid_argument("container timeouts must be positive");
    }
}

core::errors::Result<ProcessCapture> ContainerExecutor::run_runtime(
    std::vector<std::string> args, const std::chrono::milliseconds timeout,
    std::optional<std::string> stdin_data, std::function<void()> on_timeout) const {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(options_.runtime);
    for (auto& arg : args) {
        spec.argv.push_back(std::move(arg));
    }
    // The runtime client needs the host's DOCKER_HOST, HOME and friends.
    spec.environment = current_environment();
    spec.stdin_data = std::move(stdin_data);
    spec.timeout = timeout;
    spec.max_output_bytes = options_.max_output_bytes;
    spec.kill_grace = options_.kill_grace;
    spec.on_timeout = std::move(on_timeout);
    return run_child_process(spec);
}

std::optional<std::string> ContainerExecutor::check_availability() const {
    auto version = run_runtime({"version"}, options_.query_timeout);
    if (core::errors::is_error(version)) {
        return "Container runtime '" + options_.runtime +
               "' is not available: " + core::errors::get_error(version).message;
    }
    const auto& capture = core::errors::get_value(version);
    if (capture.timed_out) {
        return "Container runtime '" + options_.runtime + "' check timed out";
    }
    if (capture.exit_code != 0) {
        return "Container runtime '" + options_.runtime + "' returned error: " +
               trimmed(capture.stderr_text.empty() ? capture.stdout_text : capture.stderr_text);
    }
    return std::nullopt;
}

bool ContainerExecutor::image_exists(const std::string& image) const {
    auto inspect = run_runtime({"image", "inspect", image}, options_.query_timeout);
    if (core::errors::is_error(inspect)) {
        return false;
    }
    const auto& capture = core::errors::get_value(inspect);
    return !capture.timed_out && capture.exit_code == 0;
}

void ContainerExecutor::remove_container(const std::string& container_name) const {
    auto removed = run_runtime({"rm", "-f", container_name}, kRemoveTimeout);
    if (core::errors::is_error(removed)) {
        LOG_WARN("ContainerExecutor: could not remove " + container_name + ": " +
                 core::errors::get_error(removed).message);
        return;
    }
    const auto& capture = core::errors::get_value(removed);
    if (capture.timed_out || capture.exit_code != 0) {
        LOG_WARN("ContainerExecutor: removing " + container_name + " failed: " +
                 trimmed(capture.stderr_text));
        return;
    }
    LOG_DEBUG("ContainerExecutor: removed " + container_name);
}

core::errors::Result<ContainerExecutor::Preflight> ContainerExecutor::preflight(
    const protocol::ExecutionRequest& request) const {
    if (auto denied = protocol::validate_request(request)) {
        return SandboxError{ErrorCategory::Input, denied->reason, "invalid_request"};
    }

    auto program = guard_.validate_command(request.command);
    if (core::errors::is_error(program)) {
        return core::errors::get_error(program);
    }
    auto environment = guard_.validate_environment(request.environment);
    if (core::errors::is_error(environment)) {
        return core::errors::get_error(environment);
    }

    Preflight checked;
    // Mounted read-write, so it has to stay inside the allowed root.
    if (request.working_directory.has_value()) {
        auto work_dir = resolver_.resolve_directory(request.working_directory.value());
        if (core::errors::is_error(work_dir)) {
            return core::errors::get_error(work_dir);
        }
        checked.host_work_dir = core::errors::get_value(work_dir);
    }

    auto inputs = resolve_input_files(resolver_, request.input_files);
    if (core::errors::is_error(inputs)) {
        return core::errors::get_error(inputs);
    }
    checked.inputs = core::errors::take_value(std::move(inputs));
    return checked;
}

std::optional<protocol::Denied> ContainerExecutor::validate(
    const protocol::ExecutionRequest& request) const {
    auto checked = preflight(request);
    if (core::errors::is_error(checked)) {
        return protocol::denied_from(core::errors::get_error(checked));
    }
    return std::nullopt;
}

std::vector<std::string> ContainerExecutor::build_create_command(
    const std::string& container_name, const protocol::ExecutionRequest& request,
    const std::filesystem::path& input_dir, const std::filesystem::path& output_dir,
    const std::optional<std::filesystem::path>& host_work_dir,
    const std::vector<VolumeMount>& extra_mounts) const {
    std::vector<std::string> args = {"create", "--name", container_name};
    if (request.stdin_data.has_value()) {
        args.push_back("--interactive");
    }

    // Resource limits are fixed at creation time.
    if (options_.memory_limit.has_value()) {
        args.insert(args.end(), {"--memory", options_.memory_limit.value()});
    }
    if (options_.cpu_limit.has_value()) {
        args.insert(args.end(), {"--cpus", options_.cpu_limit.value()});
    }
    if (!options_.network_enabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    if (options_.read_only_rootfs) {
        args.push_back("--read-only");
        args.insert(args.end(), {"--tmpfs", "/tmp:rw,noexec,nosuid,size=64m"});
    }
    if (options_.user.has_value()) {
        args.insert(args.end(), {"--user", options_.user.value()});
    }
    args.insert(args.end(), {"--workdir", options_.work_dir});

    args.insert(args.end(), {"-v", VolumeMount{input_dir, kContainerInputDir, true}.to_volume_arg()});
    args.insert(args.end(),
                {"-v", VolumeMount{output_dir, kContainerOutputDir, false}.to_volume_arg()});
    if (host_work_dir.has_value()) {
        args.insert(args.end(),
                    {"-v", VolumeMount{host_work_dir.value(), options_.work_dir, false}.to_volume_arg()});
    }
    for (const auto& mount : options_.mounts) {
        args.insert(args.end(), {"-v", mount.to_volume_arg()});
    }
    for (const auto& mount : extra_mounts) {
        args.insert(args.end(), {"-v", mount.to_volume_arg()});
    }

    for (const auto& [key, value] : options_.base_environment) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    for (const auto& [key, value] : request.environment) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    // Last so neither base nor request environment can repoint them.
    args.insert(args.end(), {"-e", std::string("INPUT_DIR=") + kContainerInputDir});
    args.insert(args.end(), {"-e", std::string("OUTPUT_DIR=") + kContainerOutputDir});

    args.push_back(options_.image);
    args.insert(args.end(), request.command.begin(), request.command.end());
    return args;
}

protocol::ExecutionResult ContainerExecutor::execute(
    const protocol::ExecutionRequest& request) const {
    return execute_with_mounts(request, {});
}

protocol::ExecutionResult ContainerExecutor::execute_with_mounts(
    const protocol::ExecutionRequest& request,
    const std::vector<VolumeMount>& extra_mounts) const {
    const std::string execution_id = core::config::generate_execution_id();

    auto checked = preflight(request);
    if (core::errors::is_error(checked)) {
        const auto& err = core::errors::get_error(checked);
        LOG_INFO(execution_id + ": denied [" + err.code + "]: " + err.message);
        return protocol::denied_from(err);
    }
    const auto& plan = core::errors::get_value(checked);

    // A private (0700) run directory keeps other host users out; the mounts
    // inside it are opened up for the container user, who reaches them through
    // the bind mounts and never through the host parent.
    auto created_root = ScratchDirectory::create(execution_id + "-", options_.scratch_parent);
    if (core::errors::is_error(created_root)) {
        return protocol::failed_from(core::errors::get_error(created_root));
    }
    std::unique_ptr<ScratchDirectory> run_root =
        core::errors::take_value(std::move(created_root));

    auto input_dir = ScratchDirectory::create("input-", run_root->path());
    if (core::errors::is_error(input_dir)) {
        return protocol::failed_from(core::errors::get_error(input_dir));
    }
    const std::unique_ptr<ScratchDirectory> input =
        core::errors::take_value(std::move(input_dir));

    // Lives as long as `run_root`, which Completed takes over.
    const std::filesystem::path output_path = run_root->path() / "output";
    std::error_code ec;
    std::filesystem::create_directory(output_path, ec);
    if (ec) {
        return protocol::Failed{"Unable to create output directory under " +
                                    run_root->path().string(),
                                ec.message()};
    }

    using std::filesystem::perms;
    auto input_perms = input->set_permissions(perms::owner_all | perms::group_read |
                                              perms::group_exec | perms::others_read |
                                              perms::others_exec);
    if (core::errors::is_error(input_perms)) {
        return protocol::failed_from(core::errors::get_error(input_perms));
    }
    std::filesystem::permissions(output_path, perms::all, ec);
    if (ec) {
        return protocol::Failed{"Unable to open output directory " + output_path.string(),
                                ec.message()};
    }

    auto staged = stage_input_files(plan.inputs, input->path());
    if (core::errors::is_error(staged)) {
        const auto& err = core::errors::get_error(staged);
        LOG_ERROR(execution_id + ": staging failed [" + err.code + "]: " + err.message);
        return protocol::failed_from(err);
    }

    const std::string container_name = "warden-" + execution_id;
    const auto create_args = build_create_command(container_name, request, input->path(),
                                                  output_path, plan.host_work_dir,
                                                  extra_mounts);

    // From here on the container may exist.
    const ContainerRemovalGuard removal(
        [this](const std::string& name) { remove_container(name); }, container_name);

    LOG_INFO(execution_id + ": creating " + container_name + " from " + options_.image +
             " for " + protocol::describe_command(request.command));
    auto created = run_runtime(create_args, options_.create_timeout);
    if (core::errors::is_error(created)) {
        const auto& err = core::errors::get_error(created);
        LOG_ERROR(execution_id + ": container runtime unavailable: " + err.message);
        return protocol::Failed{"Container runtime '" + options_.runtime +
                                    "' could not be started: " + err.message,
                                err.hint.empty() ? std::optional<std::string>() : err.hint};
    }
    const auto& create_capture = core::errors::get_value(created);
    if (create_capture.timed_out || create_capture.exit_code != 0) {
        const std::string cause = create_capture.timed_out
                                      ? "create timed out"
                                      : trimmed(create_capture.stderr_text);
        LOG_ERROR(execution_id + ": container create failed: " + cause);
        return protocol::Failed{"Failed to create container from image " + options_.image,
                                cause};
    }

    std::vector<std::string> start_args = {"start", "--attach"};
    if (request.stdin_data.has_value()) {
        start_args.push_back("--interactive");
    }
    start_args.push_back(container_name);

    auto on_timeout = [this, &container_name, &execution_id]() {
        LOG_WARN(execution_id + ": killing container " + container_name);
        auto killed = run_runtime({"kill", container_name}, options_.query_timeout);
        if (core::errors::is_error(killed)) {
            LOG_WARN(execution_id + ": kill failed: " + core::errors::get_error(killed).message);
        }
    };

    auto run = run_runtime(start_args, request.timeout, request.stdin_data, on_timeout);
    if (core::errors::is_error(run)) {
        const auto& err = core::errors::get_error(run);
        LOG_ERROR(execution_id + ": container start failed: " + err.message);
        return protocol::failed_from(err);
    }
    ProcessCapture capture = core::errors::take_value(std::move(run));
    if (!request.capture_output) {
        capture.stdout_text.clear();
        capture.stderr_text.clear();
    }

    if (capture.timed_out) {
        LOG_WARN(execution_id + ": timed out after " + std::to_string(capture.duration.count()) +
                 "ms");
        return protocol::TimedOut{capture.duration, std::move(capture.stderr_text)};
    }

    protocol::Completed completed;
    completed.exit_code = capture.exit_code;
    completed.stdout_text = std::move(capture.stdout_text);
    completed.stderr_text = std::move(capture.stderr_text);
    completed.duration = capture.duration;
    completed.artifacts = collect_artifacts(output_path, options_.recursive_artifacts);
    completed.output_directory = std::move(run_root);

    LOG_INFO(execution_id + ": container exited with code " +
             std::to_string(completed.exit_code) + " in " +
             std::to_string(completed.duration.count()) + "ms, " +
             std::to_string(completed.artifacts.size()) + " artifact(s)");
    return completed;
}

}  // namespace warden::sandbox
