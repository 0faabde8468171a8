#include "sandbox/noop_executor.hpp"

#include "core/logging/logger.hpp"

namespace warden::sandbox {

namespace {

constexpr const char* kDisabledReason =
    "Execution is disabled. No sandbox executor is configured.";

}  // namespace

protocol::ExecutionResult NoOpExecutor::execute(
    const protocol::ExecutionRequest& request) const {
    LOG_DEBUG("NoOpExecutor: denied " + protocol::describe_command(request.command));
    return protocol::Denied{kDisabledReason};
}

std::optional<std::string> NoOpExecutor::check_availability() const {
    return std::string("No sandbox executor is configured.");
}

std::optional<protocol::Denied> NoOpExecutor::validate(
    const protocol::ExecutionRequest&) const {
    return protocol::Denied{kDisabledReason};
}

}  // namespace warden::sandbox
