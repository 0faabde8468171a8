#include "script/container_script_engine.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/scratch_directory.hpp"

namespace warden::script {

namespace {

constexpr const char* kContainerScriptDir = "/script";

}  // namespace

ContainerScriptEngine::ContainerScriptEngine(
    std::shared_ptr<const sandbox::ContainerExecutor> executor,
    ContainerScriptEngineOptions options)
    : executor_(std::move(executor)), options_(std::move(options)) {
    if (!executor_) {
        throw std::invalid_argument("script engine needs a container executor");
    }
    if (options_.timeout.count() <= 0) {
        throw std::invalid_argument("script timeout must be positive");
    }
}

LanguageSet ContainerScriptEngine::supported_languages() const {
    return options_.supported_languages;
}

std::optional<protocol::Denied> ContainerScriptEngine::validate_script(
    const Script& script) const {
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
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return protocol::Denied{"Script file does not exist: " + path.string()};
    }
    return std::nullopt;
}

std::optional<protocol::Denied> ContainerScriptEngine::validate(const Script& script) const {
    if (auto denied = validate_script(script)) {
        return denied;
    }
    if (auto reason = executor_->check_availability()) {
        return protocol::Denied{reason.value()};
    }
    return std::nullopt;
}

protocol::ExecutionResult ContainerScriptEngine::execute(
    const Script& script, const std::vector<std::string>& args,
    const std::optional<std::string>& stdin_data,
    const std::vector<std::filesystem::path>& input_files) const {
    if (auto denied = validate(script)) {
        LOG_INFO("ContainerScriptEngine: " + script.tool_name() + " denied: " + denied->reason);
        return denied.value();
    }

    auto created = sandbox::ScratchDirectory::create(
        core::config::generate_execution_id() + "-script-",
        executor_->options().scratch_parent);
    if (core::errors::is_error(created)) {
        return protocol::failed_from(core::errors::get_error(created));
    }
    const std::unique_ptr<sandbox::ScratchDirectory> script_dir =
        core::errors::take_value(std::move(created));

    using std::filesystem::perms;
    auto opened = script_dir->set_permissions(perms::owner_all | perms::group_read |
                                              perms::group_exec | perms::others_read |
                                              perms::others_exec);
    if (core::errors::is_error(opened)) {
        return protocol::failed_from(core::errors::get_error(opened));
    }

    std::error_code ec;
    std::filesystem::copy_file(script.script_path(), script_dir->path() / script.file_name,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return protocol::Failed{"Failed to stage script " + script.file_name, ec.message()};
    }

    protocol::ExecutionRequest request;
    request.command = options_.interpreters.at(script.language.value());
    request.command.push_back(std::string(kContainerScriptDir) + "/" + script.file_name);
    request.command.insert(request.command.end(), args.begin(), args.end());
    request.environment = options_.environment;
    request.stdin_data = stdin_data;
    request.input_files = input_files;
    request.timeout = options_.timeout;

    LOG_DEBUG("ContainerScriptEngine: running " + script.tool_name() + " in " +
              executor_->options().image);
    return executor_->execute_with_mounts(
        request, {sandbox::VolumeMount{script_dir->path(), kContainerScriptDir, true}});
}

}  // namespace warden::script
