#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaudio {

inline constexpr std::uint64_t kDefaultInstallTimeoutMs = 180000;
inline constexpr std::uint64_t kMaxInstallTimeoutMs = 24ull * 60 * 60 * 1000;

enum class VerificationMode {
    HashOnly,
    Strict,
};

// manifest.json shipped next to a provider's installer payload.
struct DriverManifest {
    std::string provider;
    std::string version;
    std::string installer_file;
    std::string sha256;

    // nullopt when absent or not one of "hash-only" / "strict".
    std::optional<VerificationMode> verification_mode;
    std::optional<std::uint64_t> timeout_ms;

    std::string package_id;
    std::string expected_publisher;
    std::string expected_signer_contains;
    std::string expected_team_id;
    bool require_notarization = false;

    std::vector<std::string> silent_args;
};

// Explicit mode wins. Without one, a vb-cable manifest naming an expectedPublisher is
// strict; older VB-CABLE bundles relied on that.
VerificationMode EffectiveVerificationMode(const DriverManifest& manifest);

const char* ToString(VerificationMode mode);

} // namespace vaudio
