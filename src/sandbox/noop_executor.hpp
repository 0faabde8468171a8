#pragma once

#include "sandbox/sandboxed_executor.hpp"

namespace warden::sandbox {

// Denies everything. Used whenever no sandbox has been configured.
class NoOpExecutor : public SandboxedExecutor {
public:
    protocol::ExecutionResult execute(
        const protocol::ExecutionRequest& request) const override;
    std::optional<std::string> check_availability() const override;
    std::optional<protocol::Denied> validate(
        const protocol::ExecutionRequest& request) const override;
};

}  // namespace warden::sandbox
