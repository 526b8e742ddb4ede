#pragma once

#include "vaudio/bundle_resolver.hpp"
#include "vaudio/manifest.hpp"
#include "vaudio/provider.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace vaudio {

struct LoadedBundle {
    Provider provider{};
    DriverManifest manifest;
    std::filesystem::path dir;
    std::filesystem::path manifest_path;
    std::filesystem::path installer_path;
};

enum class BundleErrorKind {
    ManifestMissing,
    ManifestInvalid,
    ProviderMismatch,
    InstallerMissing,
    HashMismatch,
};

struct BundleError {
    BundleErrorKind kind{};
    std::string detail;
};

struct BundleValidation {
    bool ok = false;
    std::string message;
};

// Reads a provider's bundle fresh from disk on every call; nothing is cached so a bundle
// replaced on disk is never trusted on the strength of an earlier check.
class BundleValidator {
  public:
    explicit BundleValidator(BundleResolver resolver);

    // Resolves the bundle, parses the manifest, checks the provider field and that the
    // installer file exists. Does not hash.
    std::expected<LoadedBundle, BundleError> Load(Provider provider) const;

    std::expected<void, BundleError> VerifyHash(const LoadedBundle& bundle) const;

    // Load + VerifyHash, reported with the pre-flight wording.
    BundleValidation Validate(Provider provider) const;

    const BundleResolver& Resolver() const { return resolver_; }

  private:
    BundleResolver resolver_;
};

} // namespace vaudio
