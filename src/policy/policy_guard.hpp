#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"

namespace warden::policy {

// Tool allow-list. Empty means any program may be invoked. A bare entry
// ("python3") admits the bare program token only; a program given with a
// path must be listed with that same path ("/usr/bin/python3").
struct CommandPolicy {
    std::vector<std::string> allowed_programs;
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {});

    // Returns the program token when the command may run.
    core::errors::Result<std::string> validate_command(
        const std::vector<std::string>& command) const;

    // With an allow-list in force the request may not redirect program lookup
    // or loading (PATH, LD_*), or a listed name could run other code.
    core::errors::Result<std::size_t> validate_environment(
        const std::map<std::string, std::string>& environment) const;

    const CommandPolicy& command_policy() const { return command_policy_; }

private:
    bool is_listed(const std::string& program) const;

    CommandPolicy command_policy_;
};

}  // namespace warden::policy
