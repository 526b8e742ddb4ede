#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace vaudio::config {

void InstallerConfigFromFile::Reset() {
    resources_root.reset();
    app_root.reset();
    working_dir.reset();
    default_timeout_ms.reset();
    log_level.reset();
}

Result InstallerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail("Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail("Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace vaudio::config
