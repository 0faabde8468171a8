#include "script/executor_script_engine.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::script {

InterpreterMap default_interpreters() {
    InterpreterMap interpreters;
    for (const auto& spec : language_table()) {
        interpreters[spec.language] = spec.default_interpreter;
    }
    return interpreters;
}

ExecutorScriptEngine::ExecutorScriptEngine(
    std::shared_ptr<const sandbox::SandboxedExecutor> executor,
    ExecutorScriptEngineOptions options)
    : executor_(std::move(executor)), options_(std::move(options)) {
    if (!executor_) {
        throw std::invalid_argument("script engine needs an executor");
    }
    if (options_.timeout.count() <= 0) {
        throw std::invalid_argument("script timeout must be positive");
    }
}

LanguageSet ExecutorScriptEngine::supported_languages() const {
    return options_.supported_languages;
}

std::optional<protocol::Denied> ExecutorScriptEngine::validate(const Script& script) const {
    if (auto denied = check_language(script)) {
        return denied;
    }

    const auto interpreter = options_.interpreters.find(script.language.value());
    if (interpreter == options_.interpreters.end() || interpreter->second.empty()) {
        return protocol::Denied{"No interpreter configured for " +
                                to_string(script.language.value())};
    }

    std::error_code ec;
    const auto path = script.script_path();
    if (!std::filesystem::exists(path, ec) || ec) {
        return protocol::Denied{"Script file does not exist: " + path.string()};
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return protocol::Denied{"Script path is not a file: " + path.string()};
    }
    return std::nullopt;
}

protocol::ExecutionRequest ExecutorScriptEngine::build_request(
    const Script& script, const std::vector<std::string>& args,
    const std::optional<std::string>& stdin_data,
    const std::vector<std::filesystem::path>& input_files) const {
    protocol::ExecutionRequest request;
    if (script.language.has_value()) {
        const auto interpreter = options_.interpreters.find(script.language.value());
        if (interpreter != options_.interpreters.end()) {
            request.command = interpreter->second;
        }
    }

    std::error_code ec;
    const auto absolute = std::filesystem::absolute(script.script_path(), ec);
    request.command.push_back((ec ? script.script_path() : absolute).string());
    request.command.insert(request.command.end(), args.begin(), args.end());

    request.working_directory = script.base_path;
    request.environment = options_.environment;
    request.stdin_data = stdin_data;
    request.input_files = input_files;
    request.timeout = options_.timeout;
    return request;
}

protocol::ExecutionResult ExecutorScriptEngine::execute(
    const Script& script, const std::vector<std::string>& args,
    const std::optional<std::string>& stdin_data,
    const std::vector<std::filesystem::path>& input_files) const {
    if (auto denied = validate(script)) {
        LOG_INFO("ExecutorScriptEngine: " + script.tool_name() + " denied: " + denied->reason);
        return denied.value();
    }

    LOG_DEBUG("ExecutorScriptEngine: running " + script.tool_name() + " with " +
              std::to_string(args.size()) + " arg(s), " + std::to_string(input_files.size()) +
              " input file(s)");
    return executor_->execute(build_request(script, args, stdin_data, input_files));
}

}  // namespace warden::script
