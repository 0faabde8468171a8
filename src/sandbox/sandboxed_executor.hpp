#pragma once

#include <optional>
#include <string>
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"

namespace warden::sandbox {

// One isolation strategy. Implementations hold only read-only configuration,
// so a single instance may serve concurrent executions.
class SandboxedExecutor {
public:
    virtual ~SandboxedExecutor() = default;

    // Blocks until the command completes, times out, fails or is denied.
    virtual protocol::ExecutionResult execute(
        const protocol::ExecutionRequest& request) const = 0;

    // std::nullopt when the executor can run commands, otherwise the reason it cannot.
    virtual std::optional<std::string> check_availability() const = 0;

    // Pre-flight policy checks. Never spawns anything.
    virtual std::optional<protocol::Denied> validate(
        const protocol::ExecutionRequest& request) const = 0;
};

}  // namespace warden::sandbox
