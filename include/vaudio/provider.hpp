#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vaudio {

enum class Provider {
    VbCable,   // "vb-cable", Windows
    BlackHole, // "blackhole", macOS
};

enum class HostPlatform {
    Windows,
    MacOS,
    Linux,
    Other,
};

// Wire names used in manifests, bundle directories and results.
const char* ToString(Provider provider);
std::optional<Provider> ParseProvider(std::string_view name);

// Human-facing names used in install-path messages ("VB-CABLE", "BlackHole").
const char* DisplayName(Provider provider);

// Accepts Node-style platform names: "win32", "darwin", "linux".
HostPlatform ParsePlatform(std::string_view name);
const char* ToString(HostPlatform platform);
HostPlatform CurrentPlatform();

std::optional<Provider> GetPreferredProviderForPlatform(HostPlatform platform);

// A provider is installable only on the platform it is preferred on.
bool IsProviderSupported(Provider provider, HostPlatform platform);

} // namespace vaudio
