#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"
#include "core/logging/logger.hpp"

namespace warden::core::config {

    enum class ExecutorKind {
        None,
        Process,
        Container
    };

    struct ContainerConfig {
        std::string image = "warden/sandbox:latest";
        std::string runtime = "docker";
        std::optional<std::string> memory_limit = std::string("512m");
        std::optional<std::string> cpu_limit = std::string("1.0");
        bool network_enabled = true;
        // Applies the isolated preset before the other container keys.
        bool isolated = false;
        bool read_only_rootfs = false;
        std::optional<std::string> user;
        std::string work_dir = "/workspace";
    };

    // Read-only once built; shared by every execution of the configured executor.
    struct SandboxConfig {
        ExecutorKind executor = ExecutorKind::None;
        std::chrono::milliseconds timeout{30000};
        std::filesystem::path allowed_root = std::filesystem::current_path();
        // Language names (python, bash, javascript, kotlin_script). Empty means all.
        std::vector<std::string> supported_languages;
        // Language name to interpreter command, overriding the defaults.
        std::map<std::string, std::vector<std::string>> interpreters;
        std::vector<std::string> allowed_programs;
        std::size_t max_output_bytes = 0;
        std::chrono::milliseconds kill_grace{2000};
        bool inherit_environment = false;
        bool recursive_artifacts = false;
        std::map<std::string, std::string> base_environment;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        ContainerConfig container;
    };

    errors::Result<ExecutorKind> parse_executor_kind(const std::string& text);
    std::string to_string(ExecutorKind kind);

    errors::Result<logging::LogLevel> parse_log_level(const std::string& text);

    // Missing keys keep their defaults; unknown keys are ignored.
    errors::Result<SandboxConfig> parse_config(const std::string& text);
    errors::Result<SandboxConfig> load_config(const std::filesystem::path& path);

} // namespace warden::core::config
