#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <system_error>

namespace warden::app::cli {

    using namespace warden::core::errors;

    namespace {

        constexpr std::uint64_t kMaxTimeoutMs = 24ull * 60 * 60 * 1000;

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> config;
            std::optional<std::string> executor;
            std::optional<std::string> timeout_ms;
            std::optional<std::string> cwd;
            std::vector<std::string> env;
            std::optional<std::string> stdin_data;
            std::vector<std::string> inputs;
            std::optional<std::string> image;
            std::optional<std::string> skill;
            std::optional<std::string> base;
            std::optional<std::string> file;
            std::vector<std::string> script_args;
            std::vector<std::string> command_tokens;
            bool saw_separator = false;
            bool verbose = false;
        };

        SandboxError missing_value(const std::string& flag) {
            return SandboxError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        Result<std::filesystem::path> existing_directory(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return SandboxError{ErrorCategory::Input, flag + " does not exist or is not a directory: " + raw, "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return SandboxError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + raw, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return SandboxError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: warden run|script|check [options]"};
        }

        CliOptions opts;
        const std::string command = argv[1];
        if (command == "run") {
            opts.command = CliCommand::Run;
        } else if (command == "script") {
            opts.command = CliCommand::Script;
        } else if (command == "check") {
            opts.command = CliCommand::Check;
        } else {
            return SandboxError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: run, script, check."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--") {
                raw.saw_separator = true;
                raw.command_tokens.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            }

            const bool has_value = i + 1 < args.size();
            if (arg == "--config") {
                if (has_value) raw.config = args[++i];
                else return missing_value(arg);
            } else if (arg == "--executor") {
                if (has_value) raw.executor = args[++i];
                else return missing_value(arg);
            } else if (arg == "--timeout-ms") {
                if (has_value) raw.timeout_ms = args[++i];
                else return missing_value(arg);
            } else if (arg == "--cwd") {
                if (has_value) raw.cwd = args[++i];
                else return missing_value(arg);
            } else if (arg == "--env") {
                if (has_value) raw.env.push_back(args[++i]);
                else return missing_value(arg);
            } else if (arg == "--stdin") {
                if (has_value) raw.stdin_data = args[++i];
                else return missing_value(arg);
            } else if (arg == "--input") {
                if (has_value) raw.inputs.push_back(args[++i]);
                else return missing_value(arg);
            } else if (arg == "--image") {
                if (has_value) raw.image = args[++i];
                else return missing_value(arg);
            } else if (arg == "--skill") {
                if (has_value) raw.skill = args[++i];
                else return missing_value(arg);
            } else if (arg == "--base") {
                if (has_value) raw.base = args[++i];
                else return missing_value(arg);
            } else if (arg == "--file") {
                if (has_value) raw.file = args[++i];
                else return missing_value(arg);
            } else if (arg == "--arg") {
                if (has_value) raw.script_args.push_back(args[++i]);
                else return missing_value(arg);
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else {
                return SandboxError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        opts.verbose = raw.verbose;

        if (raw.config) opts.config_file = std::filesystem::path(raw.config.value());
        if (raw.image) {
            if (raw.image->empty()) {
                return SandboxError{ErrorCategory::Input, "--image cannot be empty", "missing_value"};
            }
            opts.image = raw.image.value();
        }
        if (raw.stdin_data) opts.stdin_data = raw.stdin_data.value();
        for (const auto& input : raw.inputs) {
            opts.input_files.emplace_back(input);
        }

        if (raw.executor) {
            auto kind = core::config::parse_executor_kind(raw.executor.value());
            if (is_error(kind)) {
                return SandboxError{ErrorCategory::Input, "Invalid value for --executor: " + raw.executor.value(), "invalid_executor", "Use one of: none, process, container."};
            }
            opts.executor = get_value(kind);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::uint64_t millis = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, millis);
            if (ec != std::errc() || ptr != end) {
                return SandboxError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (millis == 0 || millis > kMaxTimeoutMs) {
                return SandboxError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 86400000."};
            }
            opts.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(millis));
        }

        for (const auto& entry : raw.env) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                return SandboxError{ErrorCategory::Input, "Invalid --env entry: " + entry, "invalid_env", "Use KEY=VALUE."};
            }
            opts.environment[entry.substr(0, eq)] = entry.substr(eq + 1);
        }

        // Path validation
        if (raw.cwd) {
            if (opts.command == CliCommand::Script) {
                return SandboxError{ErrorCategory::Input, "--cwd cannot be used with script", "conflicting_flags", "Scripts run in their skill directory."};
            }
            auto cwd = existing_directory(raw.cwd.value(), "Working directory");
            if (is_error(cwd)) {
                return get_error(cwd);
            }
            opts.working_directory = get_value(cwd);
        }

        switch (opts.command) {
            case CliCommand::Run:
                if (!raw.saw_separator || raw.command_tokens.empty()) {
                    return SandboxError{ErrorCategory::Input, "run requires a command after --", "missing_required_flag", "Usage: warden run [options] -- <program> [args...]"};
                }
                if (raw.skill || raw.base || raw.file || !raw.script_args.empty()) {
                    return SandboxError{ErrorCategory::Input, "Script flags cannot be used with run", "conflicting_flags"};
                }
                opts.command_tokens = raw.command_tokens;
                break;
            case CliCommand::Script: {
                if (raw.saw_separator) {
                    return SandboxError{ErrorCategory::Input, "script takes arguments via --arg, not after --", "conflicting_flags"};
                }
                if (!raw.skill || !raw.base || !raw.file) {
                    return SandboxError{ErrorCategory::Input, "script requires --skill, --base and --file", "missing_required_flag"};
                }
                if (raw.file->empty() || raw.file->find('/') != std::string::npos) {
                    return SandboxError{ErrorCategory::Input, "--file must be a plain file name: " + raw.file.value(), "invalid_path"};
                }
                auto base = existing_directory(raw.base.value(), "Skill directory");
                if (is_error(base)) {
                    return get_error(base);
                }
                opts.skill_name = raw.skill.value();
                opts.base_path = get_value(base);
                opts.file_name = raw.file.value();
                opts.script_args = raw.script_args;
                break;
            }
            case CliCommand::Check:
                if (raw.saw_separator || raw.skill || raw.base || raw.file) {
                    return SandboxError{ErrorCategory::Input, "check takes no command or script flags", "conflicting_flags"};
                }
                break;
        }

        return opts;
    }

    void apply_overrides(const CliOptions& options, core::config::SandboxConfig& config) {
        if (options.executor) config.executor = options.executor.value();
        if (options.timeout) config.timeout = options.timeout.value();
        if (options.image) config.container.image = options.image.value();
        if (options.verbose) config.log_level = core::logging::LogLevel::DEBUG;
        // Scripts have no per-request environment, so --env goes to the executor.
        if (options.command == CliCommand::Script) {
            for (const auto& [key, value] : options.environment) {
                config.base_environment[key] = value;
            }
        }
    }

    int exit_status_for(const protocol::ExecutionResult& result) {
        switch (protocol::outcome_of(result)) {
            case protocol::OutcomeKind::Completed:
                return std::get<protocol::Completed>(result).exit_code;
            case protocol::OutcomeKind::TimedOut:
                return 124;
            case protocol::OutcomeKind::Failed:
                return 1;
            case protocol::OutcomeKind::Denied:
            default:
                return 3;
        }
    }

} // namespace warden::app::cli
