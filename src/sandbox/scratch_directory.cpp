#include "sandbox/scratch_directory.hpp"

#include <cerrno>
#include <cstring>
#include <stdlib.h>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace warden::sandbox {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

ScratchDirectory::ScratchDirectory(ConstructionKey, std::filesystem::path path)
    : path_(std::move(path)) {}

core::errors::Result<std::unique_ptr<ScratchDirectory>> ScratchDirectory::create(
    const std::string& prefix, const std::filesystem::path& parent) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Internal,
                            "Unable to create scratch parent directory: " + parent.string(),
                            "scratch_dir_failed", ec.message()};
    }

    const std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return SandboxError{ErrorCategory::Internal,
                            "Unable to create scratch directory under " + parent.string(),
                            "scratch_dir_failed", std::strerror(errno)};
    }

    return std::make_unique<ScratchDirectory>(ConstructionKey{},
                                              std::filesystem::path(buffer.data()));
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("ScratchDirectory: failed to clean up " + path_.string() + ": " +
                 ec.message());
    } else {
        LOG_DEBUG("ScratchDirectory: removed " + path_.string());
    }
}

core::errors::Result<std::filesystem::path> ScratchDirectory::set_permissions(
    const std::filesystem::perms perms) const {
    std::error_code ec;
    std::filesystem::permissions(path_, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Internal,
                            "Unable to set permissions on " + path_.string(),
                            "scratch_dir_failed", ec.message()};
    }
    return path_;
}

}  // namespace warden::sandbox
