#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"

namespace warden::sandbox {

struct ProcessSpec {
    // argv[0] is looked up on the PATH of `environment` when it has no '/'.
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> working_directory;
    // The complete environment of the child; nothing is inherited implicitly.
    std::map<std::string, std::string> environment;
    std::optional<std::string> stdin_data;
    std::chrono::milliseconds timeout{0};
    bool capture_output = true;
    // Per stream; 0 means unlimited.
    std::size_t max_output_bytes = 0;
    // Time between SIGTERM and SIGKILL once the deadline has passed.
    std::chrono::milliseconds kill_grace{2000};
    // Runs once when the deadline passes, before the child is signalled.
    std::function<void()> on_timeout;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds duration{0};
};

// Resolves a program the way execvp would, but against an explicit PATH and
// working directory.
core::errors::Result<std::filesystem::path> find_executable(
    const std::string& program, const std::string& search_path,
    const std::optional<std::filesystem::path>& working_directory = std::nullopt);

// Runs the child in its own process group. An error means the child never
// started; a started child always yields a capture, with timed_out set when
// the watchdog had to terminate it. No process from the group is left running
// when this returns.
core::errors::Result<ProcessCapture> run_child_process(const ProcessSpec& spec);

// The host environment as a map, for callers that opt into inheriting it.
std::map<std::string, std::string> current_environment();

}  // namespace warden::sandbox
