#include <gtest/gtest.h>

#include "testing.hpp"
#include "vaudio/manifest_parser.hpp"

#include <string>

namespace vaudio {
namespace {

TEST(ManifestParserTest, ParsesFullManifest) {
    const std::string input = R"({
        "provider": "blackhole",
        "version": "0.6.0",
        "installerFile": "BlackHole2ch.pkg",
        "sha256": "ABCDEF",
        "verificationMode": "strict",
        "timeoutMs": 60000,
        "packageId": "audio.existential.BlackHole2ch",
        "expectedSignerContains": "Existential Audio",
        "expectedTeamId": "Q5C99V536K",
        "requireNotarization": true,
        "silentArgs": ["-i", "-h"]
    })";

    auto m = ManifestParser{}.Parse(input);
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->provider, "blackhole");
    EXPECT_EQ(m->version, "0.6.0");
    EXPECT_EQ(m->installer_file, "BlackHole2ch.pkg");
    EXPECT_EQ(m->sha256, "ABCDEF");
    ASSERT_TRUE(m->verification_mode.has_value());
    EXPECT_EQ(*m->verification_mode, VerificationMode::Strict);
    ASSERT_TRUE(m->timeout_ms.has_value());
    EXPECT_EQ(*m->timeout_ms, 60000u);
    EXPECT_EQ(m->package_id, "audio.existential.BlackHole2ch");
    EXPECT_EQ(m->expected_signer_contains, "Existential Audio");
    EXPECT_EQ(m->expected_team_id, "Q5C99V536K");
    EXPECT_TRUE(m->require_notarization);
    EXPECT_EQ(m->silent_args, (std::vector<std::string>{"-i", "-h"}));
}

TEST(ManifestParserTest, OptionalFieldsDefault) {
    auto m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"setup.exe","sha256":"00"})");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_FALSE(m->verification_mode.has_value());
    EXPECT_FALSE(m->timeout_ms.has_value());
    EXPECT_FALSE(m->require_notarization);
    EXPECT_TRUE(m->silent_args.empty());
    EXPECT_TRUE(m->expected_publisher.empty());
}

TEST(ManifestParserTest, RejectsMissingRequiredFields) {
    auto m = ManifestParser{}.Parse(R"({"provider":"vb-cable","sha256":"00"})");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "missing installerFile");

    m = ManifestParser{}.Parse(R"({"provider":"vb-cable","installerFile":"a.exe","sha256":""})");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "empty sha256");
}

TEST(ManifestParserTest, RejectsWrongTypes) {
    auto m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"a.exe","sha256":"00","timeoutMs":"soon"})");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "'timeoutMs' must be an integer");

    m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"a.exe","sha256":"00","silentArgs":[1]})");
    ASSERT_FALSE(m.has_value());
    EXPECT_NE(m.error().find("silentArgs"), std::string::npos);
}

TEST(ManifestParserTest, RejectsTimeoutBeyondCeiling) {
    auto m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"a.exe","sha256":"00","timeoutMs":10000000000000})");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "'timeoutMs' must not exceed 86400000");

    m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"a.exe","sha256":"00","timeoutMs":86400000})");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(*m->timeout_ms, kMaxInstallTimeoutMs);
}

TEST(ManifestParserTest, RejectsMalformedJson) {
    auto m = ManifestParser{}.Parse("{\"provider\": ");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().rfind("Syntax Error", 0), 0u);

    m = ManifestParser{}.Parse("   ");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "Empty input");

    m = ManifestParser{}.Parse("[1,2]");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error(), "JSON root must be an object");
}

TEST(ManifestParserTest, UnknownVerificationModeIsUnset) {
    auto m = ManifestParser{}.Parse(
        R"({"provider":"vb-cable","installerFile":"a.exe","sha256":"00","verificationMode":"paranoid"})");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_FALSE(m->verification_mode.has_value());
}

TEST(ManifestParserTest, LoadFileReportsMissingFile) {
    testutil::TemporaryDirectory tmp;
    auto m = ManifestParser{}.LoadFile(tmp.Path() / "manifest.json");
    ASSERT_FALSE(m.has_value());
    EXPECT_NE(m.error().find("cannot open"), std::string::npos);
}

TEST(VerificationModeTest, ExplicitModeWins) {
    DriverManifest m;
    m.provider = "vb-cable";
    m.expected_publisher = "VB-Audio";
    m.verification_mode = VerificationMode::HashOnly;
    EXPECT_EQ(EffectiveVerificationMode(m), VerificationMode::HashOnly);

    m.verification_mode = VerificationMode::Strict;
    m.expected_publisher.clear();
    EXPECT_EQ(EffectiveVerificationMode(m), VerificationMode::Strict);
}

TEST(VerificationModeTest, LegacyVbCablePublisherImpliesStrict) {
    DriverManifest m;
    m.provider = "vb-cable";
    EXPECT_EQ(EffectiveVerificationMode(m), VerificationMode::HashOnly);

    m.expected_publisher = "VB-Audio Software";
    EXPECT_EQ(EffectiveVerificationMode(m), VerificationMode::Strict);

    m.provider = "blackhole";
    EXPECT_EQ(EffectiveVerificationMode(m), VerificationMode::HashOnly);
}

} // namespace
} // namespace vaudio
