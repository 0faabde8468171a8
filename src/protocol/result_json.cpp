#include "protocol/result_json.hpp"

namespace warden::protocol {

using nlohmann::json;

json to_json(const ExecutionArtifact& artifact) {
    json payload;
    payload["name"] = artifact.name;
    payload["path"] = artifact.path.string();
    payload["mime_type"] = artifact.mime_type;
    payload["size_bytes"] = artifact.size_bytes;
    return payload;
}

json to_json(const ExecutionResult& result) {
    json payload;
    payload["outcome"] = to_string(outcome_of(result));

    if (const auto* completed = std::get_if<Completed>(&result)) {
        payload["exit_code"] = completed->exit_code;
        payload["success"] = completed->success();
        payload["stdout"] = completed->stdout_text;
        payload["stderr"] = completed->stderr_text;
        payload["duration_ms"] = completed->duration.count();
        json artifacts = json::array();
        for (const auto& artifact : completed->artifacts) {
            artifacts.push_back(to_json(artifact));
        }
        payload["artifacts"] = artifacts;
    } else if (const auto* timed_out = std::get_if<TimedOut>(&result)) {
        payload["duration_ms"] = timed_out->duration.count();
        payload["partial_stderr"] = timed_out->partial_stderr;
    } else if (const auto* failed = std::get_if<Failed>(&result)) {
        payload["error"] = failed->error;
        payload["cause"] = failed->cause.has_value() ? json(failed->cause.value()) : json();
    } else {
        payload["reason"] = std::get<Denied>(result).reason;
    }
    return payload;
}

json to_json(const ExecutionRequest& request) {
    json payload;
    payload["command"] = request.command;
    payload["working_directory"] = request.working_directory.has_value()
                                       ? json(request.working_directory->string())
                                       : json();
    payload["environment"] = request.environment;
    payload["has_stdin"] = request.stdin_data.has_value();
    json inputs = json::array();
    for (const auto& input : request.input_files) {
        inputs.push_back(input.string());
    }
    payload["input_files"] = inputs;
    payload["timeout_ms"] = request.timeout.count();
    payload["capture_output"] = request.capture_output;
    return payload;
}

std::string dump_json(const json& payload, const int indent) {
    return payload.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace warden::protocol
