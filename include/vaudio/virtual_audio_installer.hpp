#pragma once

#include "util/result.hpp"
#include "vaudio/install_coordinator.hpp"

#include <future>
#include <optional>
#include <string>

namespace vaudio {

// Process-wide entry points for the UI bridge, backed by one default InstallCoordinator.

// Replaces the options the default coordinator is built with. Fails once the coordinator
// exists; call before the first entry point below.
Result ConfigureDefaultInstaller(InstallerOptions options);

InstallCoordinator& DefaultInstallCoordinator();

std::optional<Provider> GetPreferredProvider();

BundleValidation ValidateBundledVirtualAudioAssets(std::optional<Provider> provider = std::nullopt);

InstallerRuntimeState GetVirtualAudioInstallerState();

std::future<InstallResult> InstallVirtualAudioDriver(Provider provider, std::string correlation_id);

} // namespace vaudio
