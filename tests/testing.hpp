#pragma once

#include "crypto/sha256.hpp"
#include "process/process_runner.hpp"
#include "vaudio/bundle_resolver.hpp"
#include "vaudio/provider.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/vaudio_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

  private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
    out << contents;
}

// A manifest whose sha256 matches `payload`.
inline nlohmann::json ManifestFor(vaudio::Provider provider,
                                  const std::string& installer_file,
                                  const std::string& payload) {
    return nlohmann::json{
        {"provider", vaudio::ToString(provider)},
        {"version", "1.0.0"},
        {"installerFile", installer_file},
        {"sha256", vaudio::Sha256Hex(payload)},
    };
}

// Writes <root>/drivers/<provider>/{manifest.json,<installerFile>} and returns the bundle dir.
inline std::filesystem::path WriteBundle(const std::filesystem::path& root,
                                         vaudio::Provider provider,
                                         const nlohmann::json& manifest,
                                         const std::string& payload) {
    const auto dir = root / "drivers" / vaudio::ToString(provider);
    WriteFile(dir / vaudio::kManifestFileName, manifest.dump(2));
    if (manifest.contains("installerFile") && manifest["installerFile"].is_string()) {
        WriteFile(dir / manifest["installerFile"].get<std::string>(), payload);
    }
    return dir;
}

inline vaudio::BundleRoots RootsAt(const std::filesystem::path& root) {
    vaudio::BundleRoots roots;
    roots.resources_root = root;
    roots.app_root = root / "app";
    roots.working_dir = root / "cwd";
    return roots;
}

inline vaudio::ProcessOutcome Exited(int code, std::string out = {}, std::string err = {}) {
    vaudio::ProcessOutcome o;
    o.exit_code = code;
    o.std_out = std::move(out);
    o.std_err = std::move(err);
    return o;
}

// Records every request; answers through `handler` (exit 0 with no output by default).
class FakeProcessRunner final : public vaudio::IProcessRunner {
  public:
    using Handler = std::function<vaudio::ProcessOutcome(const vaudio::ProcessRequest&)>;

    FakeProcessRunner() = default;
    explicit FakeProcessRunner(Handler handler) : handler_(std::move(handler)) {}

    vaudio::ProcessOutcome Run(const vaudio::ProcessRequest& request) const override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lk(mu_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (handler) return handler(request);
        return Exited(0);
    }

    void SetHandler(Handler handler) {
        std::lock_guard<std::mutex> lk(mu_);
        handler_ = std::move(handler);
    }

    std::vector<vaudio::ProcessRequest> Requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }

    size_t Calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_.size();
    }

    size_t CallsTo(const std::string& program) const {
        std::lock_guard<std::mutex> lk(mu_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.program == program) ++n;
        }
        return n;
    }

  private:
    mutable std::mutex mu_;
    mutable std::vector<vaudio::ProcessRequest> requests_;
    Handler handler_;
};

} // namespace testutil
