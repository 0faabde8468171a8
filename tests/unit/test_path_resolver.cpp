#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/execution_id.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "policy/path_resolver.hpp"

namespace {

using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::policy::SecurePathResolver;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_path_resolver_" + warden::core::config::generate_execution_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PathResolverTest, ResolvesRelativePathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/data.csv", "a,b\n");

    SecurePathResolver resolver(workspace.root());
    auto result = resolver.resolve_file("sub/data.csv");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              std::filesystem::canonical(workspace.root() / "sub/data.csv"));
}

TEST(PathResolverTest, FoldsDotDotThatStaysInside) {
    TempWorkspace workspace;
    write_file(workspace.root() / "top.txt", "top");

    SecurePathResolver resolver(workspace.root());
    auto result = resolver.resolve_file("sub/../top.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).filename(), "top.txt");
}

TEST(PathResolverTest, RejectsParentTraversal) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root());

    auto result = resolver.resolve("../../etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Security);
    EXPECT_EQ(get_error(result).code, "path_outside_root");
    EXPECT_NE(get_error(result).message.find("Path traversal not allowed"), std::string::npos);
}

TEST(PathResolverTest, RejectsAbsolutePathOutsideRoot) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root());

    auto result = resolver.resolve_file("/etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PathResolverTest, AcceptsAbsolutePathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "inside.txt", "ok");

    SecurePathResolver resolver(workspace.root());
    auto result = resolver.resolve_file(workspace.root() / "inside.txt");
    ASSERT_FALSE(is_error(result));
}

TEST(PathResolverTest, RejectsSiblingWithSharedPrefix) {
    TempWorkspace workspace;
    const auto sibling = std::filesystem::path(workspace.root().string() + "_sibling");
    write_file(sibling / "secret.txt", "secret");

    SecurePathResolver resolver(workspace.root());
    auto result = resolver.resolve(sibling / "secret.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");

    std::error_code ec;
    std::filesystem::remove_all(sibling, ec);
}

TEST(PathResolverTest, RejectsSymlinkEscapingRoot) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() /
                         (workspace.root().filename().string() + "_outside.txt");
    write_file(outside, "outside");
    std::filesystem::create_symlink(outside, workspace.root() / "link.txt");

    SecurePathResolver resolver(workspace.root());
    auto result = resolver.resolve_file("link.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PathResolverTest, RejectsEmptyPath) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root());

    auto result = resolver.resolve("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(PathResolverTest, ReportsMissingFile) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root());

    auto result = resolver.resolve_file("missing.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "file_not_found");
}

TEST(PathResolverTest, ReportsDirectoryWhereFileExpected) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root());

    auto result = resolver.resolve_file("sub");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "not_a_regular_file");

    auto directory = resolver.resolve_directory("sub");
    EXPECT_FALSE(is_error(directory));
}

TEST(PathResolverTest, ReportsMissingRoot) {
    TempWorkspace workspace;
    SecurePathResolver resolver(workspace.root() / "does_not_exist");

    auto result = resolver.resolve("anything.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_root");
}

}  // namespace
