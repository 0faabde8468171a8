#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "script/script.hpp"
#include "script/script_engine.hpp"

namespace warden::tools {

struct ScriptInput {
    std::vector<std::string> args;
    std::optional<std::string> stdin_data;
};

// Exposes one script as a callable tool named after Script::tool_name().
class ScriptTool {
public:
    ScriptTool(script::Script script, std::shared_ptr<const script::ScriptEngine> engine,
               std::optional<std::string> description = std::nullopt);

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const script::Script& script() const { return script_; }

    // JSON schema of the accepted input: {"args": [string], "stdin": string}.
    nlohmann::json parameters_json() const;

    // Validates, runs, and renders a text report.
    protocol::ToolResult call(const std::string& input) const;
    protocol::ToolResult call(const protocol::ToolCall& tool_call) const;

    // Blank or malformed input means no args and no stdin.
    static ScriptInput parse_input(const std::string& input);

    // 512 B, 1.5 KB, 2.0 MB, ...
    static std::string format_size(std::uintmax_t bytes);

private:
    protocol::ToolResult render(const protocol::ExecutionResult& result) const;

    script::Script script_;
    std::shared_ptr<const script::ScriptEngine> engine_;
    std::string name_;
    std::string description_;
};

}  // namespace warden::tools
