#include "vaudio/install_result.hpp"

namespace vaudio {

const char* ToString(InstallState state) {
    switch (state) {
        case InstallState::Unsupported:      return "unsupported";
        case InstallState::Installed:        return "installed";
        case InstallState::AlreadyInstalled: return "already-installed";
        case InstallState::RebootRequired:   return "reboot-required";
        case InstallState::UserCancelled:    return "user-cancelled";
        case InstallState::Failed:           return "failed";
    }
    return "failed";
}

nlohmann::json ToJson(const InstallResult& result) {
    nlohmann::json j{
        {"provider", ToString(result.provider)},
        {"state", ToString(result.state)},
        {"correlationId", result.correlation_id},
    };
    if (result.code) j["code"] = *result.code;
    if (result.message) j["message"] = *result.message;
    if (result.requires_restart) j["requiresRestart"] = *result.requires_restart;
    return j;
}

nlohmann::json ToJson(const InstallerRuntimeState& state) {
    nlohmann::json j{
        {"inProgress", state.in_progress},
        {"platformSupported", state.platform_supported},
        {"bundleReady", state.bundle_ready},
        {"bundleMessage", state.bundle_message},
    };
    if (state.active_provider) j["activeProvider"] = ToString(*state.active_provider);
    return j;
}

} // namespace vaudio
