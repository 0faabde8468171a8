#include "core/config/sandbox_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace warden::core::config {

using errors::ErrorCategory;
using errors::SandboxError;
using nlohmann::json;

namespace {

SandboxError config_error(const std::string& message) {
    return SandboxError{ErrorCategory::Input, message, "invalid_config"};
}

std::optional<SandboxError> read_string(const json& object, const char* key,
                                        std::string& target) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    if (!object.at(key).is_string()) {
        return config_error(std::string("'") + key + "' must be a string");
    }
    target = object.at(key).get<std::string>();
    return std::nullopt;
}

std::optional<SandboxError> read_bool(const json& object, const char* key, bool& target) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    if (!object.at(key).is_boolean()) {
        return config_error(std::string("'") + key + "' must be a boolean");
    }
    target = object.at(key).get<bool>();
    return std::nullopt;
}

std::optional<SandboxError> read_milliseconds(const json& object, const char* key,
                                              std::chrono::milliseconds& target,
                                              const bool allow_zero) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (!value.is_number_integer()) {
        return config_error(std::string("'") + key + "' must be an integer");
    }
    const auto millis = value.get<long long>();
    if (millis < 0 || (millis == 0 && !allow_zero)) {
        return config_error(std::string("'") + key + "' must be positive");
    }
    target = std::chrono::milliseconds(millis);
    return std::nullopt;
}

std::optional<SandboxError> read_string_list(const json& object, const char* key,
                                             std::vector<std::string>& target) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (!value.is_array()) {
        return config_error(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return config_error(std::string("'") + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    target = std::move(items);
    return std::nullopt;
}

std::optional<SandboxError> read_string_map(const json& object, const char* key,
                                            std::map<std::string, std::string>& target) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (!value.is_object()) {
        return config_error(std::string("'") + key + "' must be an object of strings");
    }
    std::map<std::string, std::string> items;
    for (const auto& item : value.items()) {
        if (!item.value().is_string()) {
            return config_error(std::string("'") + key + "." + item.key() +
                                "' must be a string");
        }
        items[item.key()] = item.value().get<std::string>();
    }
    target = std::move(items);
    return std::nullopt;
}

// Accepts "1.5", 1.5 or null (no limit).
std::optional<SandboxError> read_limit(const json& object, const char* key,
                                       std::optional<std::string>& target) {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    const auto& value = object.at(key);
    if (value.is_null()) {
        target.reset();
    } else if (value.is_string()) {
        target = value.get<std::string>();
    } else if (value.is_number()) {
        std::ostringstream text;
        text << value.get<double>();
        target = text.str();
    } else {
        return config_error(std::string("'") + key + "' must be a string, number or null");
    }
    return std::nullopt;
}

std::optional<SandboxError> read_container(const json& object, ContainerConfig& container) {
    if (!object.is_object()) {
        return config_error("'container' must be an object");
    }

    if (auto err = read_bool(object, "isolated", container.isolated)) return err;
    if (container.isolated) {
        container.network_enabled = false;
        container.memory_limit = "256m";
        container.cpu_limit = "0.5";
        container.read_only_rootfs = true;
    }

    if (auto err = read_string(object, "image", container.image)) return err;
    if (auto err = read_string(object, "runtime", container.runtime)) return err;
    if (auto err = read_limit(object, "memory_limit", container.memory_limit)) return err;
    if (auto err = read_limit(object, "cpu_limit", container.cpu_limit)) return err;
    if (auto err = read_bool(object, "network_enabled", container.network_enabled)) return err;
    if (auto err = read_bool(object, "read_only_rootfs", container.read_only_rootfs)) return err;
    if (auto err = read_string(object, "work_dir", container.work_dir)) return err;
    if (object.contains("user")) {
        std::string user;
        if (auto err = read_string(object, "user", user)) return err;
        container.user = user;
    }

    if (container.image.empty()) {
        return config_error("'container.image' must not be empty");
    }
    if (container.runtime.empty()) {
        return config_error("'container.runtime' must not be empty");
    }
    return std::nullopt;
}

}  // namespace

errors::Result<ExecutorKind> parse_executor_kind(const std::string& text) {
    if (text == "none") {
        return ExecutorKind::None;
    }
    if (text == "process") {
        return ExecutorKind::Process;
    }
    if (text == "container") {
        return ExecutorKind::Container;
    }
    return SandboxError{ErrorCategory::Input, "Unknown executor: " + text, "invalid_config",
                        "Use one of: none, process, container."};
}

std::string to_string(const ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::None:
            return "none";
        case ExecutorKind::Process:
            return "process";
        case ExecutorKind::Container:
            return "container";
        default:
            return "unknown";
    }
}

errors::Result<logging::LogLevel> parse_log_level(const std::string& text) {
    if (text == "debug") {
        return logging::LogLevel::DEBUG;
    }
    if (text == "info") {
        return logging::LogLevel::INFO;
    }
    if (text == "warn") {
        return logging::LogLevel::WARN;
    }
    if (text == "error") {
        return logging::LogLevel::ERROR;
    }
    return SandboxError{ErrorCategory::Input, "Unknown log level: " + text, "invalid_config",
                        "Use one of: debug, info, warn, error."};
}

errors::Result<SandboxConfig> parse_config(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return SandboxError{ErrorCategory::Input, "Configuration is not valid JSON.",
                            "invalid_config"};
    }
    if (!document.is_object()) {
        return config_error("Configuration must be a JSON object.");
    }

    SandboxConfig config;

    if (document.contains("executor")) {
        std::string kind;
        if (auto err = read_string(document, "executor", kind)) return *err;
        auto parsed = parse_executor_kind(kind);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.executor = errors::get_value(parsed);
    }

    if (auto err = read_milliseconds(document, "timeout_ms", config.timeout, false)) return *err;
    if (auto err = read_milliseconds(document, "kill_grace_ms", config.kill_grace, true)) return *err;

    if (document.contains("allowed_root")) {
        std::string root;
        if (auto err = read_string(document, "allowed_root", root)) return *err;
        if (root.empty()) {
            return config_error("'allowed_root' must not be empty");
        }
        config.allowed_root = root;
    }

    if (auto err = read_string_list(document, "supported_languages", config.supported_languages)) return *err;
    if (auto err = read_string_list(document, "allowed_programs", config.allowed_programs)) return *err;
    if (auto err = read_bool(document, "inherit_environment", config.inherit_environment)) return *err;
    if (auto err = read_bool(document, "recursive_artifacts", config.recursive_artifacts)) return *err;
    if (auto err = read_string_map(document, "base_environment", config.base_environment)) return *err;

    if (document.contains("max_output_bytes")) {
        const auto& value = document.at("max_output_bytes");
        if (!value.is_number_unsigned()) {
            return config_error("'max_output_bytes' must be a non-negative integer");
        }
        config.max_output_bytes = value.get<std::size_t>();
    }

    if (document.contains("interpreters")) {
        const auto& value = document.at("interpreters");
        if (!value.is_object()) {
            return config_error("'interpreters' must be an object");
        }
        for (const auto& item : value.items()) {
            const std::string language = item.key();
            std::vector<std::string> tokens;
            if (auto err = read_string_list(value, language.c_str(), tokens)) return *err;
            if (tokens.empty() || tokens.front().empty()) {
                return config_error("Interpreter for '" + language + "' must not be empty");
            }
            config.interpreters[language] = std::move(tokens);
        }
    }

    if (document.contains("log_level")) {
        std::string level;
        if (auto err = read_string(document, "log_level", level)) return *err;
        auto parsed = parse_log_level(level);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.log_level = errors::get_value(parsed);
    }

    if (document.contains("container")) {
        if (auto err = read_container(document.at("container"), config.container)) return *err;
    }

    return config;
}

errors::Result<SandboxConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return SandboxError{ErrorCategory::Input,
                            "Unable to open configuration file: " + path.string(),
                            "config_not_found"};
    }
    std::ostringstream content;
    content << input.rdbuf();
    return parse_config(content.str());
}

}  // namespace warden::core::config
