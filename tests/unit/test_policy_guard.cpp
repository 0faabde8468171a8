#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/sandbox_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::policy::CommandPolicy;
using warden::policy::PolicyGuard;

TEST(PolicyGuardTest, AllowsAnyProgramWithEmptyAllowList) {
    PolicyGuard guard;
    auto result = guard.validate_command({"anything", "--flag"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "anything");
}

TEST(PolicyGuardTest, AllowsListedBareProgram) {
    PolicyGuard guard(CommandPolicy{{"python3", "echo"}});
    auto bare = guard.validate_command({"echo", "hi"});
    ASSERT_FALSE(is_error(bare));
    EXPECT_EQ(get_value(bare), "echo");
}

TEST(PolicyGuardTest, PathQualifiedProgramMustBeListedWithItsPath) {
    PolicyGuard guard(CommandPolicy{{"echo", "/usr/bin/python3"}});

    auto look_alike = guard.validate_command({"/tmp/untrusted/echo", "hi"});
    ASSERT_TRUE(is_error(look_alike));
    EXPECT_EQ(get_error(look_alike).code, "program_not_allowed");
    EXPECT_EQ(get_error(look_alike).message,
              "Program '/tmp/untrusted/echo' is not allowed. Allowed programs: echo, /usr/bin/python3");

    EXPECT_TRUE(is_error(guard.validate_command({"./echo"})));
    EXPECT_TRUE(is_error(guard.validate_command({"python3"})));

    auto listed = guard.validate_command({"/usr/bin/python3", "-c", "pass"});
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed), "/usr/bin/python3");
    EXPECT_FALSE(is_error(guard.validate_command({"/usr/bin/../bin/python3"})));
}

TEST(PolicyGuardTest, AllowListForbidsLookupAndLoaderOverrides) {
    PolicyGuard guard(CommandPolicy{{"echo"}});
    EXPECT_FALSE(is_error(guard.validate_environment({{"MODE", "fast"}})));

    auto path = guard.validate_environment({{"PATH", "/tmp/untrusted"}});
    ASSERT_TRUE(is_error(path));
    EXPECT_EQ(get_error(path).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(path).code, "environment_not_allowed");

    EXPECT_TRUE(is_error(guard.validate_environment({{"LD_PRELOAD", "/tmp/x.so"}})));

    PolicyGuard open_guard;
    EXPECT_FALSE(is_error(open_guard.validate_environment({{"PATH", "/opt/bin"}})));
}

TEST(PolicyGuardTest, DeniesUnlistedProgram) {
    PolicyGuard guard(CommandPolicy{{"python3", "echo"}});
    auto result = guard.validate_command({"rm", "-rf", "/"});
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::Policy);
    EXPECT_EQ(err.code, "program_not_allowed");
    EXPECT_EQ(err.message, "Program 'rm' is not allowed. Allowed programs: python3, echo");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto empty = guard.validate_command({});
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_command");

    auto blank_program = guard.validate_command({"", "arg"});
    ASSERT_TRUE(is_error(blank_program));
    EXPECT_EQ(get_error(blank_program).code, "empty_command");
}

TEST(PolicyGuardTest, RejectsNulBytesInArguments) {
    PolicyGuard guard;
    auto result = guard.validate_command({"echo", std::string("a\0b", 3)});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_command");
}

}  // namespace
