#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vaudio::config {

// Optional settings read from the installer's JSON configuration file.
// Absent keys stay nullopt so callers can layer their own defaults.
class InstallerConfigFromFile {
public:
    std::optional<std::string> resources_root;
    std::optional<std::string> app_root;
    std::optional<std::string> working_dir;

    std::optional<std::uint64_t> default_timeout_ms;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace vaudio::config
