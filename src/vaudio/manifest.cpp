#include "vaudio/manifest.hpp"

namespace vaudio {

VerificationMode EffectiveVerificationMode(const DriverManifest& manifest) {
    if (manifest.verification_mode)
        return *manifest.verification_mode;

    if (manifest.provider == "vb-cable" && !manifest.expected_publisher.empty())
        return VerificationMode::Strict;
    return VerificationMode::HashOnly;
}

const char* ToString(VerificationMode mode) {
    return mode == VerificationMode::Strict ? "strict" : "hash-only";
}

} // namespace vaudio
