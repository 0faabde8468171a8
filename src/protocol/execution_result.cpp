#include "protocol/execution_result.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace warden::protocol {

namespace {

const std::unordered_map<std::string, std::string>& mime_types() {
    static const std::unordered_map<std::string, std::string> kMimeTypes = {
        {"pdf", "application/pdf"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"csv", "text/csv"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"zip", "application/zip"},
        {"tar", "application/x-tar"},
        {"gz", "application/gzip"},
        {"py", "text/x-python"},
        {"js", "text/javascript"},
        {"kt", "text/x-kotlin"},
        {"kts", "text/x-kotlin"},
        {"java", "text/x-java"},
        {"sh", "text/x-shellscript"}};
    return kMimeTypes;
}

}  // namespace

std::string ExecutionArtifact::infer_mime_type(const std::string& file_name) {
    static const std::string kDefault = "application/octet-stream";
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return kDefault;
    }
    std::string extension = file_name.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    const auto& table = mime_types();
    const auto it = table.find(extension);
    return it == table.end() ? kDefault : it->second;
}

OutcomeKind outcome_of(const ExecutionResult& result) {
    switch (result.index()) {
        case 0:
            return OutcomeKind::Completed;
        case 1:
            return OutcomeKind::TimedOut;
        case 2:
            return OutcomeKind::Failed;
        default:
            return OutcomeKind::Denied;
    }
}

std::string to_string(const OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Completed:
            return "completed";
        case OutcomeKind::TimedOut:
            return "timed_out";
        case OutcomeKind::Failed:
            return "failed";
        case OutcomeKind::Denied:
            return "denied";
        default:
            return "unknown";
    }
}

std::string describe(const ExecutionResult& result) {
    if (const auto* completed = std::get_if<Completed>(&result)) {
        return "completed with exit code " + std::to_string(completed->exit_code) +
               " in " + std::to_string(completed->duration.count()) + "ms (" +
               std::to_string(completed->artifacts.size()) + " artifacts)";
    }
    if (const auto* timed_out = std::get_if<TimedOut>(&result)) {
        return "timed out after " + std::to_string(timed_out->duration.count()) + "ms";
    }
    if (const auto* failed = std::get_if<Failed>(&result)) {
        return "failed: " + failed->error +
               (failed->cause.has_value() ? " (" + failed->cause.value() + ")" : "");
    }
    return "denied: " + std::get<Denied>(result).reason;
}

Denied denied_from(const core::errors::SandboxError& error) {
    return Denied{error.message};
}

Failed failed_from(const core::errors::SandboxError& error) {
    Failed failed;
    failed.error = error.message;
    if (!error.hint.empty()) {
        failed.cause = error.hint;
    } else if (!error.code.empty()) {
        failed.cause = error.code;
    }
    return failed;
}

}  // namespace warden::protocol
