#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol/execution_result.hpp"

namespace warden::protocol {

    // A single sandboxed invocation. Built per call and discarded once the
    // result is returned.
    struct ExecutionRequest {
        // Program followed by its arguments. Never passed through a shell.
        std::vector<std::string> command;
        std::optional<std::filesystem::path> working_directory;
        // Merged over the executor's base environment.
        std::map<std::string, std::string> environment;
        // When empty the child's stdin is closed immediately.
        std::optional<std::string> stdin_data;
        // Resolved against the allowed root and staged into INPUT_DIR.
        std::vector<std::filesystem::path> input_files;
        std::chrono::milliseconds timeout{0};
        bool capture_output = true;
    };

    // Checks the request invariants: non-empty command, positive timeout.
    std::optional<Denied> validate_request(const ExecutionRequest& request);

    std::string describe_command(const std::vector<std::string>& command);

} // namespace warden::protocol
