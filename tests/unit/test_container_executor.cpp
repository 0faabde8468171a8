#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/execution_id.hpp"
#include "sandbox/container_executor.hpp"

namespace {

using warden::protocol::Completed;
using warden::protocol::Denied;
using warden::protocol::ExecutionRequest;
using warden::protocol::Failed;
using warden::protocol::TimedOut;
using warden::sandbox::ContainerExecutor;
using warden::sandbox::ContainerExecutorOptions;
using warden::sandbox::VolumeMount;

// Stands in for the docker CLI: records every call and fakes the lifecycle.
constexpr const char* kFakeRuntime = R"(#!/bin/sh
log="$WARDEN_FAKE_RUNTIME_LOG"
echo "$*" >> "$log"
case "$1" in
  version)
    echo "fake runtime 1.0"
    exit 0 ;;
  image)
    [ "$3" = "present:latest" ] && exit 0
    exit 1 ;;
  create)
    shift
    printf '%s\n' "$@" > "$log.create"
    if [ -n "$WARDEN_FAKE_CREATE_FAIL" ]; then
      echo "Unable to find image" >&2
      exit 125
    fi
    echo "0123456789ab"
    exit 0 ;;
  start)
    out=$(sed -n 's/^\(.*\):\/output:rw$/\1/p' "$log.create")
    printf 'done!' > "$out/result.txt"
    cat
    if [ -n "$WARDEN_FAKE_START_SLEEP" ]; then
      sleep "$WARDEN_FAKE_START_SLEEP"
    fi
    exit "${WARDEN_FAKE_START_EXIT:-0}" ;;
  kill|rm)
    exit 0 ;;
esac
exit 1
)";

class ContainerExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::current_path() /
                (".tmp_container_executor_" + warden::core::config::generate_execution_id());
        std::filesystem::create_directories(root_ / "scratch");
        std::filesystem::create_directories(root_ / "allowed");

        runtime_ = root_ / "fake-runtime";
        {
            std::ofstream script(runtime_);
            script << kFakeRuntime;
        }
        std::filesystem::permissions(runtime_, std::filesystem::perms::owner_all);

        log_ = root_ / "runtime.log";
        setenv("WARDEN_FAKE_RUNTIME_LOG", log_.c_str(), 1);
    }

    void TearDown() override {
        unsetenv("WARDEN_FAKE_RUNTIME_LOG");
        unsetenv("WARDEN_FAKE_CREATE_FAIL");
        unsetenv("WARDEN_FAKE_START_SLEEP");
        unsetenv("WARDEN_FAKE_START_EXIT");
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    ContainerExecutorOptions fake_options() const {
        ContainerExecutorOptions options;
        options.runtime = runtime_.string();
        options.image = "present:latest";
        options.allowed_root = root_ / "allowed";
        options.scratch_parent = root_ / "scratch";
        options.kill_grace = std::chrono::milliseconds(500);
        return options;
    }

    std::vector<std::string> runtime_calls() const {
        std::vector<std::string> calls;
        std::ifstream in(log_);
        std::string line;
        while (std::getline(in, line)) {
            calls.push_back(line);
        }
        return calls;
    }

    bool called(const std::string& prefix) const {
        const auto calls = runtime_calls();
        return std::any_of(calls.begin(), calls.end(), [&prefix](const std::string& call) {
            return call.rfind(prefix, 0) == 0;
        });
    }

    std::size_t scratch_entries() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root_ / "scratch")) {
            static_cast<void>(entry);
            ++count;
        }
        return count;
    }

    std::filesystem::path root_;
    std::filesystem::path runtime_;
    std::filesystem::path log_;
};

ExecutionRequest request_for(std::vector<std::string> command,
                             std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    ExecutionRequest request;
    request.command = std::move(command);
    request.timeout = timeout;
    return request;
}

bool contains_sequence(const std::vector<std::string>& args,
                       const std::vector<std::string>& sequence) {
    return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

TEST_F(ContainerExecutorTest, RunsFullLifecycleAndCollectsArtifacts) {
    const ContainerExecutor executor(fake_options());

    auto request = request_for({"python3", "main.py"});
    request.stdin_data = std::string("piped input");
    {
        const auto result = executor.execute(request);
        ASSERT_TRUE(std::holds_alternative<Completed>(result));
        const auto& completed = std::get<Completed>(result);
        EXPECT_EQ(completed.exit_code, 0);
        EXPECT_EQ(completed.stdout_text, "piped input");
        ASSERT_EQ(completed.artifacts.size(), 1u);
        EXPECT_EQ(completed.artifacts[0].name, "result.txt");
        EXPECT_EQ(completed.artifacts[0].size_bytes, 5u);

        // The world-writable output mount sits inside an owner-only run directory.
        using std::filesystem::perms;
        const auto output_dir = completed.artifacts[0].path.parent_path();
        const auto run_dir = output_dir.parent_path();
        EXPECT_EQ(run_dir.parent_path(), root_ / "scratch");
        EXPECT_EQ(std::filesystem::status(output_dir).permissions() & perms::others_write,
                  perms::others_write);
        EXPECT_EQ(std::filesystem::status(run_dir).permissions() &
                      (perms::group_all | perms::others_all),
                  perms::none);
    }

    EXPECT_TRUE(called("create --name warden-exec-"));
    EXPECT_TRUE(called("start --attach --interactive warden-exec-"));
    EXPECT_TRUE(called("rm -f warden-exec-"));
    EXPECT_FALSE(called("kill"));
    EXPECT_EQ(scratch_entries(), 0u);
}

TEST_F(ContainerExecutorTest, ReportsCommandExitCode) {
    setenv("WARDEN_FAKE_START_EXIT", "3", 1);
    const ContainerExecutor executor(fake_options());

    const auto result = executor.execute(request_for({"false"}));
    ASSERT_TRUE(std::holds_alternative<Completed>(result));
    EXPECT_EQ(std::get<Completed>(result).exit_code, 3);
    EXPECT_TRUE(called("rm -f"));
}

TEST_F(ContainerExecutorTest, KillsAndRemovesContainerOnTimeout) {
    setenv("WARDEN_FAKE_START_SLEEP", "30", 1);
    const ContainerExecutor executor(fake_options());

    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.execute(request_for({"sleep", "30"}, std::chrono::milliseconds(500)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(std::holds_alternative<TimedOut>(result));
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_TRUE(called("kill warden-exec-"));
    EXPECT_TRUE(called("rm -f warden-exec-"));
    EXPECT_EQ(scratch_entries(), 0u);
}

TEST_F(ContainerExecutorTest, CreateFailureIsFailedAndStillRemoves) {
    setenv("WARDEN_FAKE_CREATE_FAIL", "1", 1);
    const ContainerExecutor executor(fake_options());

    const auto result = executor.execute(request_for({"echo", "hi"}));
    ASSERT_TRUE(std::holds_alternative<Failed>(result));
    const auto& failed = std::get<Failed>(result);
    EXPECT_EQ(failed.error, "Failed to create container from image present:latest");
    ASSERT_TRUE(failed.cause.has_value());
    EXPECT_NE(failed.cause->find("Unable to find image"), std::string::npos);
    EXPECT_FALSE(called("start"));
    EXPECT_TRUE(called("rm -f"));
}

TEST_F(ContainerExecutorTest, CommandExitCode125IsStillCompleted) {
    setenv("WARDEN_FAKE_START_EXIT", "125", 1);
    const ContainerExecutor executor(fake_options());

    const auto result = executor.execute(request_for({"sh", "-c", "exit 125"}));
    ASSERT_TRUE(std::holds_alternative<Completed>(result));
    EXPECT_EQ(std::get<Completed>(result).exit_code, 125);
    EXPECT_FALSE(std::get<Completed>(result).success());
}

TEST_F(ContainerExecutorTest, MissingRuntimeIsUnavailableAndFailed) {
    auto options = fake_options();
    options.runtime = "warden-no-such-runtime";
    const ContainerExecutor executor(options);

    const auto reason = executor.check_availability();
    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("Container runtime 'warden-no-such-runtime' is not available"),
              std::string::npos);

    EXPECT_FALSE(executor.validate(request_for({"echo"})).has_value());
    EXPECT_TRUE(std::holds_alternative<Failed>(executor.execute(request_for({"echo"}))));
    EXPECT_EQ(scratch_entries(), 0u);
}

TEST_F(ContainerExecutorTest, ChecksRuntimeAndImages) {
    const ContainerExecutor executor(fake_options());
    EXPECT_FALSE(executor.check_availability().has_value());
    EXPECT_TRUE(executor.image_exists("present:latest"));
    EXPECT_FALSE(executor.image_exists("absent:latest"));
}

TEST_F(ContainerExecutorTest, DeniesBeforeCreatingAnything) {
    const ContainerExecutor executor(fake_options());

    auto traversal = request_for({"cat"});
    traversal.input_files = {"../../etc/passwd"};
    EXPECT_TRUE(std::holds_alternative<Denied>(executor.execute(traversal)));

    auto outside_work_dir = request_for({"ls"});
    outside_work_dir.working_directory = std::filesystem::path("/etc");
    EXPECT_TRUE(executor.validate(outside_work_dir).has_value());

    EXPECT_TRUE(std::holds_alternative<Denied>(executor.execute(request_for({}))));
    EXPECT_TRUE(runtime_calls().empty());
}

TEST_F(ContainerExecutorTest, BuildsCreateCommandWithLimitsMountsAndEnvironment) {
    auto options = fake_options();
    options.base_environment["BASE"] = "1";
    options.user = "1000:1000";
    options.mounts.push_back(VolumeMount{"/data/models", "/models", true});
    const ContainerExecutor executor(options);

    auto request = request_for({"python3", "-c", "print(1)"});
    request.environment["OUTPUT_DIR"] = "/elsewhere";
    request.environment["MODE"] = "fast";
    const auto args = executor.build_create_command(
        "warden-test", request, "/tmp/in", "/tmp/out", std::nullopt,
        {VolumeMount{"/tmp/script", "/script", true}});

    EXPECT_TRUE(contains_sequence(args, {"create", "--name", "warden-test"}));
    EXPECT_TRUE(contains_sequence(args, {"--memory", "512m"}));
    EXPECT_TRUE(contains_sequence(args, {"--cpus", "1.0"}));
    EXPECT_TRUE(contains_sequence(args, {"--user", "1000:1000"}));
    EXPECT_TRUE(contains_sequence(args, {"--workdir", "/workspace"}));
    EXPECT_TRUE(contains_sequence(args, {"-v", "/tmp/in:/input:ro"}));
    EXPECT_TRUE(contains_sequence(args, {"-v", "/tmp/out:/output:rw"}));
    EXPECT_TRUE(contains_sequence(args, {"-v", "/data/models:/models:ro"}));
    EXPECT_TRUE(contains_sequence(args, {"-v", "/tmp/script:/script:ro"}));
    EXPECT_TRUE(contains_sequence(args, {"-e", "BASE=1"}));
    EXPECT_TRUE(contains_sequence(args, {"-e", "MODE=fast"}));
    EXPECT_TRUE(contains_sequence(args, {"present:latest", "python3", "-c", "print(1)"}));
    EXPECT_EQ(std::find(args.begin(), args.end(), "--interactive"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--network"), args.end());

    // The reserved variables come last and win.
    const auto overridden = std::find(args.begin(), args.end(), "OUTPUT_DIR=/elsewhere");
    const auto reserved = std::find(args.begin(), args.end(), "OUTPUT_DIR=/output");
    ASSERT_NE(reserved, args.end());
    EXPECT_LT(overridden - args.begin(), reserved - args.begin());
}

TEST_F(ContainerExecutorTest, IsolatedPresetLocksDownTheContainer) {
    const auto options = ContainerExecutorOptions::isolated("alpine:3");
    EXPECT_EQ(options.image, "alpine:3");
    EXPECT_FALSE(options.network_enabled);
    EXPECT_TRUE(options.read_only_rootfs);

    const ContainerExecutor executor(options);
    const auto args = executor.build_create_command("warden-iso", request_for({"true"}), "/i",
                                                    "/o", std::nullopt, {});
    EXPECT_TRUE(contains_sequence(args, {"--memory", "256m"}));
    EXPECT_TRUE(contains_sequence(args, {"--cpus", "0.5"}));
    EXPECT_TRUE(contains_sequence(args, {"--network", "none"}));
    EXPECT_TRUE(contains_sequence(args, {"--read-only", "--tmpfs"}));

    const auto python = ContainerExecutorOptions::for_python();
    EXPECT_EQ(python.image, "python:3.11-slim");
    EXPECT_FALSE(python.network_enabled);
}

TEST_F(ContainerExecutorTest, RejectsUnusableOptions) {
    auto options = fake_options();
    options.image.clear();
    EXPECT_THROW(ContainerExecutor{options}, std::invalid_argument);

    options = fake_options();
    options.work_dir = "relative";
    EXPECT_THROW(ContainerExecutor{options}, std::invalid_argument);
}

TEST(ContainerExecutorDockerTest, RunsEchoInRealContainer) {
    auto options = ContainerExecutorOptions::isolated("alpine:latest");
    const ContainerExecutor executor(options);
    if (const auto reason = executor.check_availability()) {
        GTEST_SKIP() << *reason;
    }
    if (!executor.image_exists(options.image)) {
        GTEST_SKIP() << "image " << options.image << " is not present locally";
    }

    const auto result = executor.execute(request_for({"echo", "hello world"}, std::chrono::seconds(60)));
    ASSERT_TRUE(std::holds_alternative<Completed>(result));
    EXPECT_NE(std::get<Completed>(result).stdout_text.find("hello world"), std::string::npos);
}

}  // namespace
