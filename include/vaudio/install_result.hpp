#pragma once

#include "vaudio/provider.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vaudio {

enum class InstallState {
    Unsupported,
    Installed,
    AlreadyInstalled,
    RebootRequired,
    UserCancelled,
    Failed,
};

const char* ToString(InstallState state);

// Terminal outcome of one install attempt.
struct InstallResult {
    Provider provider{};
    InstallState state = InstallState::Failed;
    std::optional<int> code;
    std::optional<std::string> message;
    std::string correlation_id;
    std::optional<bool> requires_restart;

    bool Succeeded() const {
        return state == InstallState::Installed || state == InstallState::AlreadyInstalled ||
               state == InstallState::RebootRequired;
    }
};

struct InstallerRuntimeState {
    bool in_progress = false;
    std::optional<Provider> active_provider;
    bool platform_supported = false;
    bool bundle_ready = false;
    std::string bundle_message;
};

// camelCase keys, optional members omitted when unset.
nlohmann::json ToJson(const InstallResult& result);
nlohmann::json ToJson(const InstallerRuntimeState& state);

} // namespace vaudio
