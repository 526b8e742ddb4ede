#include "vaudio/provider.hpp"

namespace vaudio {

const char* ToString(Provider provider) {
    switch (provider) {
        case Provider::VbCable:   return "vb-cable";
        case Provider::BlackHole: return "blackhole";
    }
    return "unknown";
}

std::optional<Provider> ParseProvider(std::string_view name) {
    if (name == "vb-cable") return Provider::VbCable;
    if (name == "blackhole") return Provider::BlackHole;
    return std::nullopt;
}

const char* DisplayName(Provider provider) {
    switch (provider) {
        case Provider::VbCable:   return "VB-CABLE";
        case Provider::BlackHole: return "BlackHole";
    }
    return "Virtual audio";
}

HostPlatform ParsePlatform(std::string_view name) {
    if (name == "win32") return HostPlatform::Windows;
    if (name == "darwin") return HostPlatform::MacOS;
    if (name == "linux") return HostPlatform::Linux;
    return HostPlatform::Other;
}

const char* ToString(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::Windows: return "win32";
        case HostPlatform::MacOS:   return "darwin";
        case HostPlatform::Linux:   return "linux";
        case HostPlatform::Other:   return "other";
    }
    return "other";
}

HostPlatform CurrentPlatform() {
#if defined(_WIN32)
    return HostPlatform::Windows;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#elif defined(__linux__)
    return HostPlatform::Linux;
#else
    return HostPlatform::Other;
#endif
}

std::optional<Provider> GetPreferredProviderForPlatform(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::Windows: return Provider::VbCable;
        case HostPlatform::MacOS:   return Provider::BlackHole;
        default:                    return std::nullopt;
    }
}

bool IsProviderSupported(Provider provider, HostPlatform platform) {
    const auto preferred = GetPreferredProviderForPlatform(platform);
    return preferred.has_value() && *preferred == provider;
}

} // namespace vaudio
