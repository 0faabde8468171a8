#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/sandbox_errors.hpp"

namespace warden::sandbox {

// A private (0700) temporary directory removed recursively on destruction.
class ScratchDirectory {
    // Only create() can name it.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    static core::errors::Result<std::unique_ptr<ScratchDirectory>> create(
        const std::string& prefix,
        const std::filesystem::path& parent = std::filesystem::temp_directory_path());

    ScratchDirectory(ConstructionKey, std::filesystem::path path);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Loosens the directory mode, e.g. so a container user can reach it.
    core::errors::Result<std::filesystem::path> set_permissions(
        std::filesystem::perms perms) const;

private:
    std::filesystem::path path_;
};

}  // namespace warden::sandbox
