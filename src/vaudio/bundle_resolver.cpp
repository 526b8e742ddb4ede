#include "vaudio/bundle_resolver.hpp"

#include <cstdlib>
#include <string>
#include <system_error>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__)
#include <cstdint>
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace vaudio {

namespace {

std::optional<fs::path> ExecutablePath() {
#if defined(_WIN32)
    std::wstring buf(MAX_PATH, L'\0');
    while (true) {
        const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (n == 0) return std::nullopt;
        if (n < buf.size()) {
            buf.resize(n);
            return fs::path(buf);
        }
        buf.resize(buf.size() * 2);
    }
#elif defined(__APPLE__)
    std::uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buf(size, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) return std::nullopt;
    buf.resize(std::char_traits<char>::length(buf.c_str()));
    return fs::path(buf);
#else
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    return p;
#endif
}

} // namespace

BundleRoots BundleRoots::FromEnvironment() {
    BundleRoots roots;
    if (const char* env = std::getenv("VAUDIO_RESOURCES_PATH"); env && *env) {
        roots.resources_root = fs::path(env);
    }

    std::error_code ec;
    roots.working_dir = fs::current_path(ec);
    if (ec) roots.working_dir = fs::path(".");

    if (auto exe = ExecutablePath()) {
        roots.app_root = exe->parent_path();
    } else {
        roots.app_root = roots.working_dir;
    }
    return roots;
}

BundleResolver::BundleResolver(BundleRoots roots) : roots_(std::move(roots)) {}

std::vector<fs::path> BundleResolver::CandidateDirs(Provider provider) const {
    const fs::path segments = fs::path("drivers") / ToString(provider);

    std::vector<fs::path> out;
    out.reserve(3);
    if (roots_.resources_root && !roots_.resources_root->empty()) {
        out.push_back(*roots_.resources_root / segments);
    }
    if (!roots_.app_root.empty()) {
        out.push_back(roots_.app_root / segments);
    }
    if (!roots_.working_dir.empty()) {
        out.push_back(roots_.working_dir / segments);
    }
    return out;
}

std::optional<fs::path> BundleResolver::Resolve(Provider provider) const {
    for (const auto& dir : CandidateDirs(provider)) {
        std::error_code ec;
        if (fs::is_regular_file(dir / kManifestFileName, ec)) {
            return dir;
        }
    }
    return std::nullopt;
}

} // namespace vaudio
