#include <gtest/gtest.h>

#include "testing.hpp"
#include "vaudio/outcome_parser.hpp"

#include <string>

namespace vaudio {
namespace {

ProcessOutcome Failure(std::string err, int code = 1) {
    return testutil::Exited(code, {}, std::move(err));
}

TEST(OutcomeParserTest, ParseLeadingInt) {
    EXPECT_EQ(ParseLeadingInt("0"), 0);
    EXPECT_EQ(ParseLeadingInt("  3010\r\n"), 3010);
    EXPECT_EQ(ParseLeadingInt("-128"), -128);
    EXPECT_EQ(ParseLeadingInt("+7"), 7);
    EXPECT_EQ(ParseLeadingInt("1638 trailing text"), 1638);
    EXPECT_FALSE(ParseLeadingInt("").has_value());
    EXPECT_FALSE(ParseLeadingInt("done").has_value());
    EXPECT_FALSE(ParseLeadingInt("-").has_value());
}

TEST(OutcomeParserTest, ExitCodeMapping) {
    EXPECT_EQ(MapExitCode(0), InstallState::Installed);
    EXPECT_EQ(MapExitCode(1638), InstallState::AlreadyInstalled);
    EXPECT_EQ(MapExitCode(3010), InstallState::RebootRequired);
    EXPECT_EQ(MapExitCode(1641), InstallState::RebootRequired);
    EXPECT_EQ(MapExitCode(1223), InstallState::UserCancelled);
    EXPECT_EQ(MapExitCode(55), InstallState::Failed);
    EXPECT_EQ(MapExitCode(-1), InstallState::Failed);
}

TEST(OutcomeParserTest, WindowsReadsExitCodeFromOutput) {
    auto exit = InterpretWindowsInstaller(testutil::Exited(0, "3010\r\n"));
    ASSERT_TRUE(exit.code.has_value());
    EXPECT_EQ(*exit.code, 3010);
}

TEST(OutcomeParserTest, WindowsNonNumericOutput) {
    auto exit = InterpretWindowsInstaller(testutil::Exited(0, "  garbage  "));
    EXPECT_FALSE(exit.code.has_value());
    EXPECT_EQ(exit.error, "Unexpected installer output: garbage");
}

TEST(OutcomeParserTest, WindowsCancellation) {
    auto exit = InterpretWindowsInstaller(
        Failure("Start-Process : This command cannot be run due to the error: The operation was "
                "canceled by the user."));
    ASSERT_TRUE(exit.code.has_value());
    EXPECT_EQ(*exit.code, kUserCancelledCode);

    exit = InterpretWindowsInstaller(Failure("The operation was Cancelled by the user"));
    EXPECT_EQ(exit.code, kUserCancelledCode);
}

TEST(OutcomeParserTest, WindowsOtherErrorKeepsText) {
    auto exit = InterpretWindowsInstaller(Failure("Access is denied.\r\n"));
    EXPECT_FALSE(exit.code.has_value());
    EXPECT_EQ(exit.error, "Access is denied.");
}

TEST(OutcomeParserTest, WindowsSpawnFailure) {
    ProcessOutcome o;
    o.spawn_error = "failed to execute powershell.exe: No such file or directory";
    auto exit = InterpretWindowsInstaller(o);
    EXPECT_FALSE(exit.code.has_value());
    EXPECT_EQ(exit.error, o.spawn_error);
}

TEST(OutcomeParserTest, MacReadsScriptResult) {
    EXPECT_EQ(InterpretMacInstaller(testutil::Exited(0, "0\n")).code, 0);
    EXPECT_EQ(InterpretMacInstaller(testutil::Exited(0, "1223")).code, kUserCancelledCode);
    EXPECT_EQ(InterpretMacInstaller(testutil::Exited(0, "-60005")).code, -60005);
}

TEST(OutcomeParserTest, MacCancellationPhrases) {
    for (const char* text : {
             "0:1: execution error: User canceled. (-128)",
             "User canceled authorization prompt",
             "user cancelled",
             "execution error: error number -128",
             "failed - 128",
         }) {
        auto exit = InterpretMacInstaller(Failure(text));
        ASSERT_TRUE(exit.code.has_value()) << text;
        EXPECT_EQ(*exit.code, kUserCancelledCode) << text;
    }
}

TEST(OutcomeParserTest, MacEmbeddedErrorNumber) {
    auto exit = InterpretMacInstaller(
        Failure("execution error: installer: Error - the package path specified was invalid. "
                "(error number 1)"));
    ASSERT_TRUE(exit.code.has_value());
    EXPECT_EQ(*exit.code, 1);

    exit = InterpretMacInstaller(Failure("AppleScript reported number 3010"));
    EXPECT_EQ(exit.code, 3010);
}

TEST(OutcomeParserTest, MacUnrecognisedErrorKeepsText) {
    auto exit = InterpretMacInstaller(Failure("osascript: no such file"));
    EXPECT_FALSE(exit.code.has_value());
    EXPECT_EQ(exit.error, "osascript: no such file");
}

TEST(OutcomeParserTest, MacTimeoutIsNotCancellation) {
    ProcessOutcome o;
    o.timed_out = true;
    auto exit = InterpretMacInstaller(o);
    EXPECT_FALSE(exit.code.has_value());
    EXPECT_NE(exit.error.find("timed out"), std::string::npos);
}

TEST(OutcomeParserTest, ExtractMacErrorNumber) {
    EXPECT_EQ(ExtractMacErrorNumber("Error Number -1743"), -1743);
    EXPECT_EQ(ExtractMacErrorNumber("number  42"), 42);
    EXPECT_FALSE(ExtractMacErrorNumber("no digits here").has_value());
}

TEST(OutcomeParserTest, AuthenticodeRecord) {
    auto rec = ParseAuthenticodeRecord(R"({"status":"Valid","subject":"CN=VB-Audio Software"})");
    ASSERT_TRUE(rec.has_value()) << rec.error();
    EXPECT_EQ(rec->status, "Valid");
    EXPECT_EQ(rec->subject, "CN=VB-Audio Software");

    rec = ParseAuthenticodeRecord(R"({"status":"NotSigned","subject":null})");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, "NotSigned");
    EXPECT_TRUE(rec->subject.empty());

    EXPECT_FALSE(ParseAuthenticodeRecord("").has_value());
    EXPECT_FALSE(ParseAuthenticodeRecord("Valid").has_value());
    EXPECT_FALSE(ParseAuthenticodeRecord("[]").has_value());
}

TEST(OutcomeParserTest, PkgutilSignerIsFirstLine) {
    auto sig = ParsePkgutilSignature("\nDeveloper ID Installer: Existential Audio Inc.\n"
                                     "Team Identifier: Q5C99V536K\n");
    EXPECT_EQ(sig.signer, "Developer ID Installer: Existential Audio Inc.");
    ASSERT_TRUE(sig.team_id.has_value());
    EXPECT_EQ(*sig.team_id, "Q5C99V536K");
}

TEST(OutcomeParserTest, PkgutilSignerFromCertificateChain) {
    auto sig = ParsePkgutilSignature(
        "Package \"BlackHole2ch.pkg\":\n"
        "   Status: signed by a developer certificate issued by Apple for distribution\n"
        "   Certificate Chain:\n"
        "    1. Developer ID Installer: Existential Audio Inc. (Q5C99V536K)\n"
        "    2. Developer ID Certification Authority\n");
    EXPECT_EQ(sig.signer, "Developer ID Installer: Existential Audio Inc. (Q5C99V536K)");
    EXPECT_FALSE(sig.team_id.has_value());
}

} // namespace
} // namespace vaudio
