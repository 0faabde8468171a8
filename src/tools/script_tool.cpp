#include "tools/script_tool.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::tools {

using nlohmann::json;
using protocol::ToolResult;

namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

ToolResult error_result(const std::string& tool_name, const std::string& message,
                        const double duration_ms) {
    ToolResult result;
    result.tool_name = tool_name;
    result.success = false;
    result.error_message = message;
    result.output = message;
    result.duration_ms = duration_ms;
    return result;
}

}  // namespace

ScriptTool::ScriptTool(script::Script script,
                       std::shared_ptr<const script::ScriptEngine> engine,
                       std::optional<std::string> description)
    : script_(std::move(script)), engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("script tool needs an engine");
    }
    name_ = script_.tool_name();
    description_ = description.has_value()
                       ? description.value()
                       : "Execute the " + script_.file_name + " script from the " +
                             script_.skill_name + " skill";
}

json ScriptTool::parameters_json() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["args"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Arguments to pass to the script"}};
    schema["properties"]["stdin"] = {
        {"type", "string"},
        {"description", "Input to provide via standard input"}};
    schema["required"] = json::array();
    return schema;
}

ScriptInput ScriptTool::parse_input(const std::string& input) {
    if (is_blank(input)) {
        return {};
    }
    const json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return {};
    }

    ScriptInput parsed;
    if (document.contains("args")) {
        const auto& args = document.at("args");
        if (!args.is_array()) {
            return {};
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                return {};
            }
            parsed.args.push_back(arg.get<std::string>());
        }
    }
    if (document.contains("stdin") && !document.at("stdin").is_null()) {
        if (!document.at("stdin").is_string()) {
            return {};
        }
        parsed.stdin_data = document.at("stdin").get<std::string>();
    }
    return parsed;
}

std::string ScriptTool::format_size(const std::uintmax_t bytes) {
    constexpr double kKilo = 1024.0;
    std::ostringstream out;
    if (bytes < 1024) {
        out << bytes << " B";
        return out.str();
    }
    out << std::fixed << std::setprecision(1);
    const double value = static_cast<double>(bytes);
    if (value < kKilo * kKilo) {
        out << value / kKilo << " KB";
    } else if (value < kKilo * kKilo * kKilo) {
        out << value / (kKilo * kKilo) << " MB";
    } else {
        out << value / (kKilo * kKilo * kKilo) << " GB";
    }
    return out.str();
}

ToolResult ScriptTool::call(const protocol::ToolCall& tool_call) const {
    if (tool_call.name != name_) {
        return error_result(name_, "Tool call for '" + tool_call.name +
                                       "' routed to '" + name_ + "'", 0.0);
    }
    return call(tool_call.arguments);
}

ToolResult ScriptTool::call(const std::string& input) const {
    if (auto denied = engine_->validate(script_)) {
        return error_result(name_, "Execution denied: " + denied->reason, 0.0);
    }

    const ScriptInput parsed = parse_input(input);
    LOG_DEBUG("ScriptTool: " + name_ + " called with " + std::to_string(parsed.args.size()) +
              " arg(s)");
    return render(engine_->execute(script_, parsed.args, parsed.stdin_data, {}));
}

ToolResult ScriptTool::render(const protocol::ExecutionResult& result) const {
    if (const auto* completed = std::get_if<protocol::Completed>(&result)) {
        std::ostringstream report;
        report << "Script completed with exit code " << completed->exit_code << "\n";
        report << "Duration: " << completed->duration.count() << "ms\n";
        if (!is_blank(completed->stdout_text)) {
            report << "\n=== stdout ===\n" << trim(completed->stdout_text) << "\n";
        }
        if (!is_blank(completed->stderr_text)) {
            report << "\n=== stderr ===\n" << trim(completed->stderr_text) << "\n";
        }
        if (!completed->artifacts.empty()) {
            report << "\n=== artifacts ===\n";
            for (const auto& artifact : completed->artifacts) {
                report << "- " << artifact.name << " (" << artifact.mime_type << ", "
                       << format_size(artifact.size_bytes) << ")\n";
                report << "  Path: " << artifact.path.string() << "\n";
            }
        }

        ToolResult tool_result;
        tool_result.tool_name = name_;
        tool_result.success = true;
        tool_result.output = trim(report.str());
        tool_result.duration_ms = static_cast<double>(completed->duration.count());
        tool_result.artifacts = completed->artifacts;
        tool_result.output_directory = completed->output_directory;
        return tool_result;
    }

    if (const auto* timed_out = std::get_if<protocol::TimedOut>(&result)) {
        std::ostringstream message;
        message << "Script failed: Script execution timed out (timed out) [ran for: "
                << timed_out->duration.count() << "ms]";
        if (!is_blank(timed_out->partial_stderr)) {
            message << "\n=== stderr ===\n" << trim(timed_out->partial_stderr);
        }
        return error_result(name_, message.str(),
                            static_cast<double>(timed_out->duration.count()));
    }

    if (const auto* failed = std::get_if<protocol::Failed>(&result)) {
        std::string message = "Script failed: " + failed->error;
        if (failed->cause.has_value()) {
            message += " (" + failed->cause.value() + ")";
        }
        return error_result(name_, message, 0.0);
    }

    return error_result(name_, "Execution denied: " + std::get<protocol::Denied>(result).reason,
                        0.0);
}

}  // namespace warden::tools
