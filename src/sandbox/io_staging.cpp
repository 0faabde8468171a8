#include "sandbox/io_staging.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include "core/logging/logger.hpp"

namespace warden::sandbox {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

namespace {

void add_artifact(const std::filesystem::directory_entry& entry,
                  const std::filesystem::path& output_dir,
                  std::vector<protocol::ExecutionArtifact>& artifacts) {
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return;
    }

    const auto size = std::filesystem::file_size(entry.path(), ec);
    if (ec) {
        LOG_WARN("collect_artifacts: skipping unreadable " + entry.path().string() + ": " +
                 ec.message());
        return;
    }

    protocol::ExecutionArtifact artifact;
    artifact.name = entry.path().lexically_relative(output_dir).generic_string();
    artifact.path = entry.path();
    artifact.mime_type = protocol::ExecutionArtifact::infer_mime_type(artifact.name);
    artifact.size_bytes = size;
    artifacts.push_back(std::move(artifact));
}

}  // namespace

core::errors::Result<std::vector<StagedInput>> resolve_input_files(
    const policy::SecurePathResolver& resolver,
    const std::vector<std::filesystem::path>& input_files) {
    std::vector<StagedInput> staged;
    staged.reserve(input_files.size());
    std::set<std::string> names;

    for (const auto& input : input_files) {
        auto resolved = resolver.resolve_file(input);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }

        const auto& source = core::errors::get_value(resolved);
        const std::string name = source.filename().string();
        if (!names.insert(name).second) {
            return SandboxError{ErrorCategory::Input,
                                "Duplicate input file name: " + name,
                                "duplicate_input",
                                "Input files are staged flat into INPUT_DIR."};
        }
        staged.push_back(StagedInput{source, name});
    }
    return staged;
}

core::errors::Result<std::size_t> stage_input_files(
    const std::vector<StagedInput>& inputs, const std::filesystem::path& input_dir) {
    const policy::SecurePathResolver input_root(input_dir);
    std::size_t copied = 0;

    for (const auto& input : inputs) {
        auto destination = input_root.resolve(input.name);
        if (core::errors::is_error(destination)) {
            return core::errors::get_error(destination);
        }

        std::error_code ec;
        std::filesystem::copy_file(input.source, core::errors::get_value(destination),
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return SandboxError{ErrorCategory::Internal,
                                "Failed to stage input file: " + input.source.string(),
                                "staging_failed", ec.message()};
        }
        ++copied;
    }
    return copied;
}

std::vector<protocol::ExecutionArtifact> collect_artifacts(
    const std::filesystem::path& output_dir, const bool recursive) {
    std::vector<protocol::ExecutionArtifact> artifacts;
    std::error_code ec;

    if (recursive) {
        std::filesystem::recursive_directory_iterator it(
            output_dir, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator();
             it.increment(ec)) {
            add_artifact(*it, output_dir, artifacts);
        }
    } else {
        std::filesystem::directory_iterator it(output_dir, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            add_artifact(*it, output_dir, artifacts);
        }
    }
    if (ec) {
        LOG_WARN("collect_artifacts: stopped scanning " + output_dir.string() + ": " +
                 ec.message());
    }

    std::sort(artifacts.begin(), artifacts.end(),
              [](const protocol::ExecutionArtifact& lhs,
                 const protocol::ExecutionArtifact& rhs) { return lhs.name < rhs.name; });
    return artifacts;
}

}  // namespace warden::sandbox
