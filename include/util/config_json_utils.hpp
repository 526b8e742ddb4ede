#pragma once

#include "util/config_parser.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace vaudio::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err);

// Typed lookups shared with the manifest parser. A present key of the wrong type is
// reported through `err`; an absent key leaves `out` untouched and returns false.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err);

} // namespace vaudio::config::detail
