#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed request, bad CLI flag or config value
        Execution,  // E.g., executable missing, container could not be created
        Policy,     // E.g., language or program not on the allow-list
        Security,   // E.g., path escapes the allowed root
        Internal    // E.g., pipe/fork/filesystem setup failure
    };

    // The standardized error payload
    struct SandboxError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a SandboxError.
    template <typename T>
    using Result = std::variant<T, SandboxError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<SandboxError>(result);
    }

    template <typename T>
    const SandboxError& get_error(const Result<T>& result) {
        return std::get<SandboxError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Security:  return "security";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace warden::core::errors
