#include "vaudio/virtual_audio_installer.hpp"

#include <memory>
#include <mutex>

namespace vaudio {

namespace {

struct DefaultInstaller {
    std::mutex mu;
    std::optional<InstallerOptions> options;
    std::unique_ptr<InstallCoordinator> coordinator;
};

DefaultInstaller& Default() {
    static DefaultInstaller instance;
    return instance;
}

} // namespace

Result ConfigureDefaultInstaller(InstallerOptions options) {
    auto& d = Default();
    std::lock_guard<std::mutex> lk(d.mu);
    if (d.coordinator) {
        return Result::Fail("installer already initialized");
    }
    d.options = std::move(options);
    return Result::Ok();
}

InstallCoordinator& DefaultInstallCoordinator() {
    auto& d = Default();
    std::lock_guard<std::mutex> lk(d.mu);
    if (!d.coordinator) {
        InstallerOptions opt;
        if (d.options) {
            opt = std::move(*d.options);
            d.options.reset();
        } else {
            opt.roots = BundleRoots::FromEnvironment();
        }
        d.coordinator = std::make_unique<InstallCoordinator>(std::move(opt));
    }
    return *d.coordinator;
}

std::optional<Provider> GetPreferredProvider() {
    return GetPreferredProviderForPlatform(DefaultInstallCoordinator().Platform());
}

BundleValidation ValidateBundledVirtualAudioAssets(std::optional<Provider> provider) {
    return DefaultInstallCoordinator().Validate(provider);
}

InstallerRuntimeState GetVirtualAudioInstallerState() {
    return DefaultInstallCoordinator().GetState();
}

std::future<InstallResult> InstallVirtualAudioDriver(Provider provider, std::string correlation_id) {
    return DefaultInstallCoordinator().Install(provider, std::move(correlation_id));
}

} // namespace vaudio
