#pragma once

#include <filesystem>
#include "core/errors/sandbox_errors.hpp"

namespace warden::policy {

// Resolves caller-supplied paths against an allowed root. Anything whose
// canonical form (symlinks in the existing prefix resolved, ".." folded) is not
// inside the canonical root is rejected, as is anything that cannot be
// resolved at all.
class SecurePathResolver {
public:
    explicit SecurePathResolver(
        std::filesystem::path allowed_root = std::filesystem::current_path());

    const std::filesystem::path& allowed_root() const { return allowed_root_; }

    core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& target_path) const;

    // resolve() plus: must exist and be a regular file.
    core::errors::Result<std::filesystem::path> resolve_file(
        const std::filesystem::path& target_path) const;

    // resolve() plus: must exist and be a directory.
    core::errors::Result<std::filesystem::path> resolve_directory(
        const std::filesystem::path& target_path) const;

private:
    core::errors::Result<std::filesystem::path> canonical_root() const;
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path allowed_root_;
};

}  // namespace warden::policy
