#include "policy/path_resolver.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

SecurePathResolver::SecurePathResolver(std::filesystem::path allowed_root)
    : allowed_root_(std::move(allowed_root)) {}

bool SecurePathResolver::is_within_root(const std::filesystem::path& root,
                                        const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        // A trailing separator shows up as an empty element
        if (root_it->empty()) {
            break;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() || root_it->empty();
}

core::errors::Result<std::filesystem::path> SecurePathResolver::canonical_root() const {
    std::error_code ec;
    if (!std::filesystem::exists(allowed_root_, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Allowed root does not exist: " + allowed_root_.string(),
                            "invalid_root"};
    }
    if (!std::filesystem::is_directory(allowed_root_, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Allowed root is not a directory: " + allowed_root_.string(),
                            "invalid_root"};
    }

    const std::filesystem::path canonical = std::filesystem::canonical(allowed_root_, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Input,
                            "Unable to resolve allowed root: " + allowed_root_.string(),
                            "invalid_root"};
    }
    return canonical;
}

core::errors::Result<std::filesystem::path> SecurePathResolver::resolve(
    const std::filesystem::path& target_path) const {
    const std::string raw = target_path.string();
    if (raw.empty()) {
        return SandboxError{ErrorCategory::Security, "Path cannot be empty.",
                            "invalid_path"};
    }
    if (raw.find('\0') != std::string::npos) {
        return SandboxError{ErrorCategory::Security,
                            "Path contains a NUL byte.", "invalid_path"};
    }

    auto root_result = canonical_root();
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const std::filesystem::path root = core::errors::get_value(root_result);

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = root / candidate;
    }

    std::error_code ec;
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        // Cannot prove containment, so treat it as a violation.
        return SandboxError{ErrorCategory::Security,
                            "Unable to resolve path: " + raw, "invalid_path"};
    }

    if (!is_within_root(root, canonical_candidate)) {
        return SandboxError{ErrorCategory::Security,
                            "Path traversal not allowed: " + raw +
                                " resolves outside " + root.string(),
                            "path_outside_root"};
    }
    return canonical_candidate;
}

core::errors::Result<std::filesystem::path> SecurePathResolver::resolve_file(
    const std::filesystem::path& target_path) const {
    auto resolved = resolve(target_path);
    if (core::errors::is_error(resolved)) {
        return resolved;
    }
    const auto& path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Input file does not exist: " + target_path.string(),
                            "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Input path is not a file: " + target_path.string(),
                            "not_a_regular_file"};
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> SecurePathResolver::resolve_directory(
    const std::filesystem::path& target_path) const {
    auto resolved = resolve(target_path);
    if (core::errors::is_error(resolved)) {
        return resolved;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(core::errors::get_value(resolved), ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Not a directory: " + target_path.string(),
                            "not_a_directory"};
    }
    return resolved;
}

}  // namespace warden::policy
