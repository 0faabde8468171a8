#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config/sandbox_config.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "protocol/execution_result.hpp"

namespace warden::app::cli {

    enum class CliCommand {
        Run,
        Script,
        Check
    };

    struct CliOptions {
        CliCommand command = CliCommand::Run;
        std::optional<std::filesystem::path> config_file;
        std::optional<core::config::ExecutorKind> executor;
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<std::filesystem::path> working_directory;
        std::map<std::string, std::string> environment;
        std::optional<std::string> stdin_data;
        std::vector<std::filesystem::path> input_files;
        std::optional<std::string> image;
        bool verbose = false;

        // run: everything after "--"
        std::vector<std::string> command_tokens;

        // script
        std::string skill_name;
        std::filesystem::path base_path;
        std::string file_name;
        std::vector<std::string> script_args;
    };

    core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // CLI flags win over the configuration file.
    void apply_overrides(const CliOptions& options, core::config::SandboxConfig& config);

    // Completed: the command's exit code. TimedOut 124, Failed 1, Denied 3.
    int exit_status_for(const protocol::ExecutionResult& result);

} // namespace warden::app::cli
