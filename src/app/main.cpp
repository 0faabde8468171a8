#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/sandbox_config.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/result_json.hpp"
#include "sandbox/executor_factory.hpp"
#include "script/engine_factory.hpp"
#include "script/script.hpp"

namespace {

constexpr int kInputErrorExit = 2;

void report_input_error(const warden::core::errors::SandboxError& err) {
    LOG_ERROR("Input error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int print_result(const warden::protocol::ExecutionResult& result) {
    std::cout << warden::protocol::dump_json(warden::protocol::to_json(result), 2) << std::endl;
    return warden::app::cli::exit_status_for(result);
}

}  // namespace

int main(int argc, char* argv[]) {
    using warden::app::cli::CliCommand;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        report_input_error(warden::core::errors::get_error(parsed));
        return kInputErrorExit;
    }
    const auto& opts = warden::core::errors::get_value(parsed);
    if (opts.verbose) {
        warden::core::logging::Logger::get().set_min_level(warden::core::logging::LogLevel::DEBUG);
    }

    // 2. Configuration file first, then CLI overrides
    warden::core::config::SandboxConfig config;
    if (opts.config_file) {
        auto loaded = warden::core::config::load_config(opts.config_file.value());
        if (warden::core::errors::is_error(loaded)) {
            report_input_error(warden::core::errors::get_error(loaded));
            return kInputErrorExit;
        }
        config = warden::core::errors::get_value(loaded);
    }
    warden::app::cli::apply_overrides(opts, config);
    warden::core::logging::Logger::get().set_min_level(config.log_level);
    LOG_DEBUG("Executor: " + warden::core::config::to_string(config.executor));

    // 3. Dispatch
    if (opts.command == CliCommand::Script) {
        auto engine = warden::script::make_script_engine(config);
        if (warden::core::errors::is_error(engine)) {
            report_input_error(warden::core::errors::get_error(engine));
            return kInputErrorExit;
        }
        const auto script = warden::script::Script::from_file(opts.skill_name, opts.file_name, opts.base_path);
        LOG_INFO("Dispatching script " + script.tool_name());
        const auto result = warden::core::errors::get_value(engine)->execute(
            script, opts.script_args, opts.stdin_data, opts.input_files);
        return print_result(result);
    }

    auto executor = warden::sandbox::make_executor(config);
    if (warden::core::errors::is_error(executor)) {
        report_input_error(warden::core::errors::get_error(executor));
        return kInputErrorExit;
    }
    const auto& sandbox = warden::core::errors::get_value(executor);

    if (opts.command == CliCommand::Check) {
        const auto reason = sandbox->check_availability();
        nlohmann::json report;
        report["executor"] = warden::core::config::to_string(config.executor);
        report["available"] = !reason.has_value();
        report["reason"] = reason.has_value() ? nlohmann::json(reason.value()) : nlohmann::json();
        std::cout << warden::protocol::dump_json(report, 2) << std::endl;
        return reason.has_value() ? 1 : 0;
    }

    warden::protocol::ExecutionRequest request;
    request.command = opts.command_tokens;
    request.working_directory = opts.working_directory;
    request.environment = opts.environment;
    request.stdin_data = opts.stdin_data;
    request.input_files = opts.input_files;
    request.timeout = config.timeout;
    if (warden::core::logging::Logger::get().enabled(warden::core::logging::LogLevel::DEBUG)) {
        LOG_DEBUG("Request: " + warden::protocol::dump_json(warden::protocol::to_json(request)));
    }

    if (auto denied = sandbox->validate(request)) {
        return print_result(denied.value());
    }
    return print_result(sandbox->execute(request));
}
