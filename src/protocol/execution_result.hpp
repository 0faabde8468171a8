#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/sandbox_errors.hpp"

namespace warden::sandbox {
class ScratchDirectory;
}

namespace warden::protocol {

    // A file found in OUTPUT_DIR after a run. The record does not own the file:
    // it is only valid while the directory holding it is alive.
    struct ExecutionArtifact {
        std::string name;
        std::filesystem::path path;
        std::string mime_type;
        std::uintmax_t size_bytes = 0;

        // Extension lookup, application/octet-stream when unrecognized.
        static std::string infer_mime_type(const std::string& file_name);
    };

    // The process ran to completion, whatever its exit code.
    struct Completed {
        int exit_code = 0;
        std::string stdout_text;
        std::string stderr_text;
        std::chrono::milliseconds duration{0};
        std::vector<ExecutionArtifact> artifacts;
        // Keeps OUTPUT_DIR (and so the artifact files) alive; deleted with the
        // last copy of the result.
        std::shared_ptr<const sandbox::ScratchDirectory> output_directory;

        bool success() const { return exit_code == 0; }
    };

    // Killed by the watchdog.
    struct TimedOut {
        std::chrono::milliseconds duration{0};
        std::string partial_stderr;
    };

    // Never started, or the sandbox infrastructure broke.
    struct Failed {
        std::string error;
        std::optional<std::string> cause;
    };

    // Rejected before anything was spawned.
    struct Denied {
        std::string reason;
    };

    // Exactly one outcome per execution.
    using ExecutionResult = std::variant<Completed, TimedOut, Failed, Denied>;

    enum class OutcomeKind {
        Completed,
        TimedOut,
        Failed,
        Denied
    };

    OutcomeKind outcome_of(const ExecutionResult& result);
    std::string to_string(OutcomeKind kind);

    // One-line human readable summary of any outcome.
    std::string describe(const ExecutionResult& result);

    Denied denied_from(const core::errors::SandboxError& error);
    Failed failed_from(const core::errors::SandboxError& error);

} // namespace warden::protocol
