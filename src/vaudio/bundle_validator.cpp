#include "vaudio/bundle_validator.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "vaudio/manifest_parser.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace vaudio {

namespace {

std::string PreflightMessage(Provider provider, const BundleError& error) {
    const std::string name = ToString(provider);
    switch (error.kind) {
        case BundleErrorKind::ManifestMissing:  return name + " manifest missing.";
        case BundleErrorKind::ManifestInvalid:  return name + " manifest invalid: " + error.detail;
        case BundleErrorKind::ProviderMismatch: return name + " manifest provider mismatch.";
        case BundleErrorKind::InstallerMissing: return name + " installer binary missing.";
        case BundleErrorKind::HashMismatch:     return name + " installer bundle hash mismatch.";
    }
    return name + " installer bundle invalid.";
}

bool StaysInsideBundle(const std::string& installer_file) {
    const fs::path rel(installer_file);
    if (rel.empty() || rel.is_absolute() || rel.has_root_name() || rel.has_root_directory())
        return false;
    for (const auto& part : rel) {
        if (part == "..")
            return false;
    }
    return true;
}

} // namespace

BundleValidator::BundleValidator(BundleResolver resolver) : resolver_(std::move(resolver)) {}

std::expected<LoadedBundle, BundleError> BundleValidator::Load(Provider provider) const {
    auto dir = resolver_.Resolve(provider);
    if (!dir) {
        return std::unexpected(BundleError{BundleErrorKind::ManifestMissing, {}});
    }

    LoadedBundle bundle;
    bundle.provider = provider;
    bundle.dir = *dir;
    bundle.manifest_path = *dir / kManifestFileName;

    auto parsed = ManifestParser{}.LoadFile(bundle.manifest_path);
    if (!parsed) {
        LogWarn("Manifest parse error in %s: %s",
                bundle.manifest_path.string().c_str(),
                parsed.error().c_str());
        return std::unexpected(BundleError{BundleErrorKind::ManifestInvalid, parsed.error()});
    }
    bundle.manifest = std::move(*parsed);

    if (bundle.manifest.provider != ToString(provider)) {
        return std::unexpected(BundleError{BundleErrorKind::ProviderMismatch,
                                           bundle.manifest.provider});
    }

    if (!StaysInsideBundle(bundle.manifest.installer_file)) {
        return std::unexpected(BundleError{BundleErrorKind::ManifestInvalid,
                                           "installerFile must name a file inside the bundle"});
    }

    bundle.installer_path = *dir / bundle.manifest.installer_file;
    std::error_code ec;
    if (!fs::is_regular_file(bundle.installer_path, ec)) {
        return std::unexpected(BundleError{BundleErrorKind::InstallerMissing,
                                           bundle.installer_path.string()});
    }

    return bundle;
}

std::expected<void, BundleError> BundleValidator::VerifyHash(const LoadedBundle& bundle) const {
    std::string actual;
    auto hr = Sha256HexFile(bundle.installer_path, actual);
    if (!hr.is_ok()) {
        return std::unexpected(BundleError{BundleErrorKind::HashMismatch, hr.message()});
    }
    if (!Sha256HexEquals(actual, bundle.manifest.sha256)) {
        LogWarn("sha256 mismatch for %s: expected=%s actual=%s",
                bundle.installer_path.string().c_str(),
                bundle.manifest.sha256.c_str(),
                actual.c_str());
        return std::unexpected(BundleError{BundleErrorKind::HashMismatch,
                                           "expected=" + bundle.manifest.sha256 +
                                               " actual=" + actual});
    }
    return {};
}

BundleValidation BundleValidator::Validate(Provider provider) const {
    auto bundle = Load(provider);
    if (!bundle) {
        return {.ok = false, .message = PreflightMessage(provider, bundle.error())};
    }
    if (auto hashed = VerifyHash(*bundle); !hashed) {
        return {.ok = false, .message = PreflightMessage(provider, hashed.error())};
    }
    return {.ok = true, .message = std::string(ToString(provider)) + " installer bundle verified."};
}

} // namespace vaudio
