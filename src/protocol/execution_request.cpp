#include "protocol/execution_request.hpp"

#include <sstream>

namespace warden::protocol {

std::optional<Denied> validate_request(const ExecutionRequest& request) {
    if (request.command.empty()) {
        return Denied{"Command cannot be empty."};
    }
    if (request.command.front().empty()) {
        return Denied{"Program name cannot be empty."};
    }
    if (request.timeout.count() <= 0) {
        return Denied{"Timeout must be positive, got " +
                      std::to_string(request.timeout.count()) + "ms."};
    }
    return std::nullopt;
}

std::string describe_command(const std::vector<std::string>& command) {
    std::ostringstream out;
    for (std::size_t i = 0; i < command.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        const auto& token = command[i];
        if (token.find_first_of(" \t\n'\"") == std::string::npos && !token.empty()) {
            out << token;
        } else {
            out << '"' << token << '"';
        }
    }
    return out.str();
}

}  // namespace warden::protocol
