#include "policy/policy_guard.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

PolicyGuard::PolicyGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

namespace {

bool has_path(const std::string& program) {
    return program.find('/') != std::string::npos;
}

std::string normalized(const std::string& program) {
    return std::filesystem::path(program).lexically_normal().string();
}

}  // namespace

bool PolicyGuard::is_listed(const std::string& program) const {
    const auto& allowed = command_policy_.allowed_programs;
    if (!has_path(program)) {
        return std::find(allowed.begin(), allowed.end(), program) != allowed.end();
    }
    const std::string wanted = normalized(program);
    return std::any_of(allowed.begin(), allowed.end(), [&wanted](const std::string& entry) {
        return has_path(entry) && normalized(entry) == wanted;
    });
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::vector<std::string>& command) const {
    if (command.empty() || command.front().empty()) {
        return SandboxError{ErrorCategory::Input, "Command cannot be empty.",
                            "empty_command"};
    }

    for (const auto& token : command) {
        if (token.find('\0') != std::string::npos) {
            return SandboxError{ErrorCategory::Input,
                                "Command arguments cannot contain NUL bytes.",
                                "invalid_command"};
        }
    }

    const std::string& program = command.front();
    const auto& allowed = command_policy_.allowed_programs;
    if (allowed.empty()) {
        return program;
    }

    if (!is_listed(program)) {
        std::string listing;
        for (const auto& entry : allowed) {
            listing += listing.empty() ? entry : ", " + entry;
        }
        return SandboxError{ErrorCategory::Policy,
                            "Program '" + program + "' is not allowed. Allowed programs: " +
                                listing,
                            "program_not_allowed"};
    }
    return program;
}

core::errors::Result<std::size_t> PolicyGuard::validate_environment(
    const std::map<std::string, std::string>& environment) const {
    if (command_policy_.allowed_programs.empty()) {
        return environment.size();
    }
    for (const auto& [key, value] : environment) {
        static_cast<void>(value);
        if (key == "PATH" || key.rfind("LD_", 0) == 0) {
            return SandboxError{ErrorCategory::Policy,
                                "Environment variable " + key +
                                    " cannot be set while a program allow-list is in force.",
                                "environment_not_allowed"};
        }
    }
    return environment.size();
}

}  // namespace warden::policy
