#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"
#include "policy/path_resolver.hpp"
#include "protocol/execution_result.hpp"

namespace warden::sandbox {

// An input file that passed the resolver, with the name it gets in INPUT_DIR.
struct StagedInput {
    std::filesystem::path source;
    std::string name;
};

// Resolves every input against the allowed root before anything is copied.
// Fails on the first path that escapes the root, is missing or is not a
// regular file, and on two inputs that would share a name in INPUT_DIR.
core::errors::Result<std::vector<StagedInput>> resolve_input_files(
    const policy::SecurePathResolver& resolver,
    const std::vector<std::filesystem::path>& input_files);

// Copies resolved inputs into the input directory. Destinations are resolved
// against that directory too, so a crafted name cannot land outside it.
core::errors::Result<std::size_t> stage_input_files(
    const std::vector<StagedInput>& inputs, const std::filesystem::path& input_dir);

// Regular files under the output directory, sorted by name. Symlinks are
// skipped. Nested names are relative to the directory when recursive.
std::vector<protocol::ExecutionArtifact> collect_artifacts(
    const std::filesystem::path& output_dir, bool recursive);

}  // namespace warden::sandbox
