#include "util/config_json_utils.hpp"

#include <fstream>
#include <iterator>
#include <optional>

namespace vaudio::config::detail {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string("'") + key + "' must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err) {
    const char* const kPathKeys[] = {"ResourcesRoot", "AppRoot", "WorkingDir"};
    std::optional<std::string>* const kPathFields[] = {
        &cfg.resources_root, &cfg.app_root, &cfg.working_dir};
    for (size_t i = 0; i < std::size(kPathKeys); ++i) {
        std::string v;
        if (GetStringIfPresent(j, kPathKeys[i], v, err)) {
            if (v.empty()) {
                err = std::string("'") + kPathKeys[i] + "' must not be empty";
                return false;
            }
            *kPathFields[i] = std::move(v);
        } else if (!err.empty()) {
            return false;
        }
    }

    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "DefaultTimeoutMs", v, err)) {
            if (v == 0) {
                err = "'DefaultTimeoutMs' must be positive";
                return false;
            }
            cfg.default_timeout_ms = v;
        } else if (!err.empty()) {
            return false;
        }
    }
    {
        std::string v;
        if (GetStringIfPresent(j, "LogLevel", v, err)) {
            auto lvl = ParseLogLevel(v);
            if (!lvl) {
                err = "unknown LogLevel: " + v;
                return false;
            }
            cfg.log_level = *lvl;
        } else if (!err.empty()) {
            return false;
        }
    }

    return true;
}

} // namespace vaudio::config::detail
