#include "sandbox/process_executor.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/child_process.hpp"
#include "sandbox/scratch_directory.hpp"

namespace warden::sandbox {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

}  // namespace

ProcessExecutor::ProcessExecutor(ProcessExecutorOptions options)
    : options_(std::move(options)),
      resolver_(options_.allowed_root),
      guard_(options_.command_policy) {
    if (options_.kill_grace.count() < 0) {
        throw std::invalid_argument("kill_grace must not be negative");
    }
    if (options_.scratch_parent.empty()) {
        throw std::invalid_argument("scratch_parent must not be empty");
    }
}

std::optional<std::string> ProcessExecutor::check_availability() const {
    return std::nullopt;
}

core::errors::Result<std::vector<StagedInput>> ProcessExecutor::preflight(
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

    if (request.working_directory.has_value()) {
        std::error_code ec;
        const auto& cwd = request.working_directory.value();
        if (!std::filesystem::is_directory(cwd, ec) || ec) {
            return SandboxError{ErrorCategory::Input,
                                "Working directory does not exist or is not a directory: " +
                                    cwd.string(),
                                "invalid_working_directory"};
        }
    }

    return resolve_input_files(resolver_, request.input_files);
}

std::optional<protocol::Denied> ProcessExecutor::validate(
    const protocol::ExecutionRequest& request) const {
    auto checked = preflight(request);
    if (core::errors::is_error(checked)) {
        return protocol::denied_from(core::errors::get_error(checked));
    }
    return std::nullopt;
}

std::map<std::string, std::string> ProcessExecutor::build_environment(
    const protocol::ExecutionRequest& request, const std::filesystem::path& input_dir,
    const std::filesystem::path& output_dir) const {
    std::map<std::string, std::string> env;
    if (options_.inherit_environment) {
        env = current_environment();
    } else {
        const char* host_path = std::getenv("PATH");
        env["PATH"] = host_path != nullptr ? host_path : kDefaultPath;
        for (const char* name : {"HOME", "LANG"}) {
            if (const char* value = std::getenv(name)) {
                env[name] = value;
            }
        }
    }

    for (const auto& [key, value] : options_.base_environment) {
        env[key] = value;
    }
    for (const auto& [key, value] : request.environment) {
        env[key] = value;
    }
    // Set last: the command must always see its own scratch directories.
    env["INPUT_DIR"] = input_dir.string();
    env["OUTPUT_DIR"] = output_dir.string();
    return env;
}

protocol::ExecutionResult ProcessExecutor::execute(
    const protocol::ExecutionRequest& request) const {
    const std::string execution_id = core::config::generate_execution_id();

    auto checked = preflight(request);
    if (core::errors::is_error(checked)) {
        const auto& err = core::errors::get_error(checked);
        LOG_INFO(execution_id + ": denied [" + err.code + "]: " + err.message);
        return protocol::denied_from(err);
    }
    const auto& inputs = core::errors::get_value(checked);

    // Both directories are released on every return path below.
    auto input_dir = ScratchDirectory::create(execution_id + "-input-", options_.scratch_parent);
    if (core::errors::is_error(input_dir)) {
        return protocol::failed_from(core::errors::get_error(input_dir));
    }
    const std::unique_ptr<ScratchDirectory> input =
        core::errors::take_value(std::move(input_dir));

    auto output_dir =
        ScratchDirectory::create(execution_id + "-output-", options_.scratch_parent);
    if (core::errors::is_error(output_dir)) {
        return protocol::failed_from(core::errors::get_error(output_dir));
    }
    std::unique_ptr<ScratchDirectory> output = core::errors::take_value(std::move(output_dir));

    auto staged = stage_input_files(inputs, input->path());
    if (core::errors::is_error(staged)) {
        const auto& err = core::errors::get_error(staged);
        LOG_ERROR(execution_id + ": staging failed [" + err.code + "]: " + err.message);
        return protocol::failed_from(err);
    }
    LOG_DEBUG(execution_id + ": staged " + std::to_string(core::errors::get_value(staged)) +
              " input file(s) into " + input->path().string());

    ProcessSpec spec;
    spec.argv = request.command;
    spec.working_directory = request.working_directory;
    spec.environment = build_environment(request, input->path(), output->path());
    spec.stdin_data = request.stdin_data;
    spec.timeout = request.timeout;
    spec.capture_output = request.capture_output;
    spec.max_output_bytes = options_.max_output_bytes;
    spec.kill_grace = options_.kill_grace;

    LOG_INFO(execution_id + ": running " + protocol::describe_command(request.command));
    auto run = run_child_process(spec);
    if (core::errors::is_error(run)) {
        const auto& err = core::errors::get_error(run);
        LOG_WARN(execution_id + ": failed to start [" + err.code + "]: " + err.message);
        return protocol::failed_from(err);
    }
    ProcessCapture capture = core::errors::take_value(std::move(run));

    if (capture.timed_out) {
        LOG_WARN(execution_id + ": timed out after " + std::to_string(capture.duration.count()) +
                 "ms");
        return protocol::TimedOut{capture.duration, std::move(capture.stderr_text)};
    }

    // The process has exited: collection always finishes, deadline or not.
    protocol::Completed completed;
    completed.exit_code = capture.exit_code;
    completed.stdout_text = std::move(capture.stdout_text);
    completed.stderr_text = std::move(capture.stderr_text);
    completed.duration = capture.duration;
    completed.artifacts = collect_artifacts(output->path(), options_.recursive_artifacts);
    completed.output_directory = std::move(output);

    LOG_INFO(execution_id + ": exited with code " + std::to_string(completed.exit_code) +
             " in " + std::to_string(completed.duration.count()) + "ms, " +
             std::to_string(completed.artifacts.size()) + " artifact(s)");
    return completed;
}

}  // namespace warden::sandbox
