#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"
#include "protocol/result_json.hpp"

namespace {

using warden::protocol::Completed;
using warden::protocol::Denied;
using warden::protocol::ExecutionArtifact;
using warden::protocol::ExecutionRequest;
using warden::protocol::ExecutionResult;
using warden::protocol::Failed;
using warden::protocol::OutcomeKind;
using warden::protocol::TimedOut;

TEST(ExecutionContractTest, SuccessIsExitCodeZero) {
    Completed ok;
    ok.exit_code = 0;
    EXPECT_TRUE(ok.success());

    Completed failing;
    failing.exit_code = 42;
    EXPECT_FALSE(failing.success());

    Completed negative;
    negative.exit_code = -1;
    EXPECT_FALSE(negative.success());
}

TEST(ExecutionContractTest, InfersMimeTypesFromExtension) {
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("report.pdf"), "application/pdf");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("data.json"), "application/json");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("table.csv"), "text/csv");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("photo.JPEG"), "image/jpeg");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("page.htm"), "text/html");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("build.kts"), "text/x-kotlin");
}

TEST(ExecutionContractTest, UnknownExtensionsAreGenericBinary) {
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("blob.xyz"), "application/octet-stream");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("Makefile"), "application/octet-stream");
    EXPECT_EQ(ExecutionArtifact::infer_mime_type("trailing."), "application/octet-stream");
}

TEST(ExecutionContractTest, OutcomeKindMatchesActiveCase) {
    EXPECT_EQ(warden::protocol::outcome_of(ExecutionResult{Completed{}}), OutcomeKind::Completed);
    EXPECT_EQ(warden::protocol::outcome_of(ExecutionResult{TimedOut{}}), OutcomeKind::TimedOut);
    EXPECT_EQ(warden::protocol::outcome_of(ExecutionResult{Failed{"boom", std::nullopt}}),
              OutcomeKind::Failed);
    EXPECT_EQ(warden::protocol::outcome_of(ExecutionResult{Denied{"no"}}), OutcomeKind::Denied);
    EXPECT_EQ(warden::protocol::to_string(OutcomeKind::TimedOut), "timed_out");
}

TEST(ExecutionContractTest, ValidateRequestRejectsEmptyCommand) {
    ExecutionRequest request;
    request.timeout = std::chrono::seconds(1);

    const auto denied = warden::protocol::validate_request(request);
    ASSERT_TRUE(denied.has_value());
    EXPECT_EQ(denied->reason, "Command cannot be empty.");
}

TEST(ExecutionContractTest, ValidateRequestRejectsNonPositiveTimeout) {
    ExecutionRequest request;
    request.command = {"echo", "hi"};
    request.timeout = std::chrono::milliseconds(0);

    const auto denied = warden::protocol::validate_request(request);
    ASSERT_TRUE(denied.has_value());
    EXPECT_NE(denied->reason.find("Timeout must be positive"), std::string::npos);

    request.timeout = std::chrono::milliseconds(10);
    EXPECT_FALSE(warden::protocol::validate_request(request).has_value());
}

TEST(ExecutionContractTest, DescribeCommandQuotesTokensWithSpaces) {
    EXPECT_EQ(warden::protocol::describe_command({"sh", "-c", "echo hi"}), "sh -c \"echo hi\"");
}

TEST(ExecutionContractTest, DescribesEveryOutcome) {
    Completed completed;
    completed.exit_code = 3;
    completed.duration = std::chrono::milliseconds(12);
    EXPECT_EQ(warden::protocol::describe(completed), "completed with exit code 3 in 12ms (0 artifacts)");
    EXPECT_EQ(warden::protocol::describe(Failed{"no binary", std::string("ENOENT")}),
              "failed: no binary (ENOENT)");
    EXPECT_EQ(warden::protocol::describe(Denied{"disabled"}), "denied: disabled");
}

TEST(ExecutionContractTest, SerializesCompletedResult) {
    Completed completed;
    completed.exit_code = 0;
    completed.stdout_text = "hello\n";
    completed.duration = std::chrono::milliseconds(5);
    ExecutionArtifact artifact;
    artifact.name = "out.json";
    artifact.path = "/tmp/out/out.json";
    artifact.mime_type = "application/json";
    artifact.size_bytes = 17;
    completed.artifacts.push_back(artifact);

    const auto payload = warden::protocol::to_json(ExecutionResult{completed});
    EXPECT_EQ(payload["outcome"], "completed");
    EXPECT_EQ(payload["exit_code"], 0);
    EXPECT_EQ(payload["success"], true);
    EXPECT_EQ(payload["stdout"], "hello\n");
    ASSERT_EQ(payload["artifacts"].size(), 1u);
    EXPECT_EQ(payload["artifacts"][0]["name"], "out.json");
    EXPECT_EQ(payload["artifacts"][0]["size_bytes"], 17);
}

TEST(ExecutionContractTest, SerializesFailureCases) {
    const auto timed_out = warden::protocol::to_json(
        ExecutionResult{TimedOut{std::chrono::milliseconds(1000), "partial"}});
    EXPECT_EQ(timed_out["outcome"], "timed_out");
    EXPECT_EQ(timed_out["partial_stderr"], "partial");

    const auto failed = warden::protocol::to_json(ExecutionResult{Failed{"boom", std::nullopt}});
    EXPECT_EQ(failed["outcome"], "failed");
    EXPECT_TRUE(failed["cause"].is_null());

    const auto denied = warden::protocol::to_json(ExecutionResult{Denied{"nope"}});
    EXPECT_EQ(denied["outcome"], "denied");
    EXPECT_EQ(denied["reason"], "nope");
}

}  // namespace
