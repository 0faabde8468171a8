#include "script/script_engine.hpp"

#include "core/logging/logger.hpp"

namespace warden::script {

namespace {

constexpr const char* kDisabledReason =
    "Script execution is disabled. No execution engine is configured.";

}  // namespace

std::optional<protocol::Denied> ScriptEngine::check_language(const Script& script) const {
    const LanguageSet supported = supported_languages();
    if (!script.language.has_value()) {
        return protocol::Denied{"Script " + script.file_name +
                                " has no recognized language. Supported: " +
                                describe_languages(supported)};
    }
    if (supported.count(script.language.value()) == 0) {
        return protocol::Denied{"Language " + to_string(script.language.value()) +
                                " is not supported by this engine. Supported: " +
                                describe_languages(supported)};
    }
    return std::nullopt;
}

std::optional<protocol::Denied> ScriptEngine::validate(const Script& script) const {
    return check_language(script);
}

LanguageSet NoOpScriptEngine::supported_languages() const {
    return {};
}

protocol::ExecutionResult NoOpScriptEngine::execute(
    const Script& script, const std::vector<std::string>&, const std::optional<std::string>&,
    const std::vector<std::filesystem::path>&) const {
    LOG_DEBUG("NoOpScriptEngine: denied " + script.tool_name());
    return protocol::Denied{kDisabledReason};
}

std::optional<protocol::Denied> NoOpScriptEngine::validate(const Script&) const {
    return protocol::Denied{kDisabledReason};
}

}  // namespace warden::script
