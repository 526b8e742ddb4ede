#include "vaudio/manifest_parser.hpp"

#include "util/config_json_utils.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace vaudio {

using json = nlohmann::json;
using config::detail::GetBoolIfPresent;
using config::detail::GetStringIfPresent;
using config::detail::GetU64IfPresent;

namespace {

std::expected<std::string, std::string> RequireString(const json& j, const char* key) {
    std::string out;
    std::string err;
    if (!GetStringIfPresent(j, key, out, err)) {
        if (!err.empty())
            return std::unexpected(err);
        return std::unexpected(std::string("missing ") + key);
    }
    if (out.empty())
        return std::unexpected(std::string("empty ") + key);
    return out;
}

std::expected<std::vector<std::string>, std::string> ParseSilentArgs(const json& j) {
    std::vector<std::string> out;
    auto it = j.find("silentArgs");
    if (it == j.end() || it->is_null())
        return out;
    if (!it->is_array())
        return std::unexpected("'silentArgs' must be an array of strings");
    for (const auto& item : *it) {
        if (!item.is_string())
            return std::unexpected("'silentArgs' must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::expected<DriverManifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        DriverManifest m;
        for (auto [key, field] : {std::pair{"provider", &m.provider},
                                  std::pair{"installerFile", &m.installer_file},
                                  std::pair{"sha256", &m.sha256}}) {
            auto value = RequireString(j, key);
            if (!value)
                return std::unexpected(value.error());
            *field = std::move(*value);
        }

        std::string err;
        for (auto [key, field] : {std::pair{"version", &m.version},
                                  std::pair{"packageId", &m.package_id},
                                  std::pair{"expectedPublisher", &m.expected_publisher},
                                  std::pair{"expectedSignerContains", &m.expected_signer_contains},
                                  std::pair{"expectedTeamId", &m.expected_team_id}}) {
            if (!GetStringIfPresent(j, key, *field, err) && !err.empty())
                return std::unexpected(err);
        }

        std::string mode;
        if (GetStringIfPresent(j, "verificationMode", mode, err)) {
            if (mode == "strict")
                m.verification_mode = VerificationMode::Strict;
            else if (mode == "hash-only")
                m.verification_mode = VerificationMode::HashOnly;
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        std::uint64_t timeout = 0;
        if (GetU64IfPresent(j, "timeoutMs", timeout, err)) {
            if (timeout > kMaxInstallTimeoutMs)
                return std::unexpected("'timeoutMs' must not exceed " + std::to_string(kMaxInstallTimeoutMs));
            m.timeout_ms = timeout;
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        if (!GetBoolIfPresent(j, "requireNotarization", m.require_notarization, err) && !err.empty())
            return std::unexpected(err);

        auto args = ParseSilentArgs(j);
        if (!args)
            return std::unexpected(args.error());
        m.silent_args = std::move(*args);

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<DriverManifest, std::string> ManifestParser::LoadFile(const std::filesystem::path& path) const {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return std::unexpected("cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return Parse(ss.str());
}

} // namespace vaudio
