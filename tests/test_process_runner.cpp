#include <gtest/gtest.h>

#include "process/process_runner.hpp"

#include <chrono>
#include <string>

namespace vaudio {
namespace {

ProcessOutcome RunShell(const std::string& script,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    ProcessRequest req;
    req.program = "/bin/sh";
    req.args = {"-c", script};
    req.timeout = timeout;
    return CreateDefaultProcessRunner()->Run(req);
}

TEST(ProcessRunnerTest, CapturesStdoutAndStderr) {
    const auto out = RunShell("printf '3010\\n'; printf 'warn' >&2");
    ASSERT_TRUE(out.Succeeded()) << out.ErrorText();
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.Output(), "3010");
    EXPECT_EQ(out.std_err, "warn");
    EXPECT_FALSE(out.timed_out);
}

TEST(ProcessRunnerTest, ReportsNonZeroExit) {
    const auto out = RunShell("echo 'Access is denied.' >&2; exit 5");
    EXPECT_FALSE(out.Succeeded());
    EXPECT_EQ(out.exit_code, 5);
    EXPECT_EQ(out.ErrorText(), "Access is denied.");
}

TEST(ProcessRunnerTest, SilentFailureDescribesExitCode) {
    const auto out = RunShell("exit 3");
    EXPECT_EQ(out.ErrorText(), "Process exited with code 3");
}

TEST(ProcessRunnerTest, KillsChildOnTimeout) {
    const auto start = std::chrono::steady_clock::now();
    const auto out = RunShell("sleep 30", std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(out.timed_out);
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_FALSE(out.Succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_NE(out.ErrorText().find("timed out"), std::string::npos);
}

TEST(ProcessRunnerTest, HugeTimeoutDoesNotExpireImmediately) {
    const auto out = RunShell("echo 0", std::chrono::milliseconds(10000000000000LL));
    ASSERT_TRUE(out.Succeeded()) << out.ErrorText();
    EXPECT_FALSE(out.timed_out);
    EXPECT_EQ(out.Output(), "0");
}

TEST(ProcessRunnerTest, MissingProgramIsSpawnError) {
    ProcessRequest req;
    req.program = "/nonexistent/vaudio-tool";
    const auto out = CreateDefaultProcessRunner()->Run(req);
    EXPECT_FALSE(out.Succeeded());
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_NE(out.spawn_error.find("failed to execute /nonexistent/vaudio-tool"), std::string::npos);
    EXPECT_EQ(out.ErrorText(), out.spawn_error);
}

TEST(ProcessRunnerTest, OutputCapKillsChild) {
    ProcessRequest req;
    req.program = "/bin/sh";
    req.args = {"-c", "yes"};
    req.timeout = std::chrono::seconds(10);
    req.max_output_bytes = 64 * 1024;

    const auto out = CreateDefaultProcessRunner()->Run(req);
    EXPECT_FALSE(out.Succeeded());
    EXPECT_NE(out.spawn_error.find("output exceeded"), std::string::npos);
    EXPECT_LE(out.std_out.size(), req.max_output_bytes);
}

TEST(ProcessRunnerTest, TrimWhitespace) {
    EXPECT_EQ(TrimWhitespace("  a b \r\n"), "a b");
    EXPECT_EQ(TrimWhitespace("\t\n"), "");
}

} // namespace
} // namespace vaudio
