#pragma once
#include <memory>
#include <string>
#include <vector>
#include "protocol/execution_result.hpp"

namespace warden::protocol {

    // How a caller (LLM tool layer, skill runner) invokes a sandboxed tool
    struct ToolCall {
        std::string name;       // e.g., "pdf_extract"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // How the tool replies back
    struct ToolResult {
        std::string tool_name;
        bool success = false;
        std::string output;         // rendered report
        std::string error_message;  // failure or denial reason
        double duration_ms = 0.0;
        std::vector<ExecutionArtifact> artifacts;
        // Keeps the artifact files alive for as long as this result.
        std::shared_ptr<const sandbox::ScratchDirectory> output_directory;
    };

} // namespace warden::protocol
