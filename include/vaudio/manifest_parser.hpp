#pragma once

#include "vaudio/manifest.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace vaudio {

class ManifestParser {
  public:
    std::expected<DriverManifest, std::string> Parse(const std::string& json_input) const;
    std::expected<DriverManifest, std::string> LoadFile(const std::filesystem::path& path) const;
};

} // namespace vaudio
