#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"

namespace warden::protocol {

nlohmann::json to_json(const ExecutionArtifact& artifact);
nlohmann::json to_json(const ExecutionResult& result);
nlohmann::json to_json(const ExecutionRequest& request);

// Command output is arbitrary bytes; invalid UTF-8 is written as U+FFFD.
std::string dump_json(const nlohmann::json& payload, int indent = -1);

}  // namespace warden::protocol
