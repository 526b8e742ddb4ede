#pragma once

#include "vaudio/provider.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace vaudio {

inline constexpr const char kManifestFileName[] = "manifest.json";

// Directories that may contain a `drivers/<provider>/` bundle, in priority order.
struct BundleRoots {
    std::optional<std::filesystem::path> resources_root;
    std::filesystem::path app_root;
    std::filesystem::path working_dir;

    // resources_root from VAUDIO_RESOURCES_PATH, app_root from the running executable's
    // directory, working_dir from the process.
    static BundleRoots FromEnvironment();
};

class BundleResolver {
  public:
    explicit BundleResolver(BundleRoots roots);

    std::vector<std::filesystem::path> CandidateDirs(Provider provider) const;

    // First candidate directory holding a manifest.json.
    std::optional<std::filesystem::path> Resolve(Provider provider) const;

    const BundleRoots& Roots() const { return roots_; }

  private:
    BundleRoots roots_;
};

} // namespace vaudio
