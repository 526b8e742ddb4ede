#pragma once

#include "process/process_runner.hpp"
#include "vaudio/bundle_validator.hpp"
#include "vaudio/install_result.hpp"
#include "vaudio/manifest.hpp"
#include "vaudio/provider.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vaudio {

// Starts the worker that runs an install attempt. May throw std::system_error.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

struct InstallerOptions {
    HostPlatform platform = CurrentPlatform();
    BundleRoots roots;
    std::shared_ptr<const IProcessRunner> runner;
    std::uint64_t default_timeout_ms = kDefaultInstallTimeoutMs;
    // Empty means a plain std::thread.
    WorkerLauncher launch_worker;
};

// Serializes install requests: while one attempt runs, further requests join it instead of
// raising a second elevation prompt. The attempt runs on a worker thread owned here.
class InstallCoordinator {
  public:
    explicit InstallCoordinator(InstallerOptions options);
    InstallCoordinator(const InstallCoordinator&) = delete;
    InstallCoordinator& operator=(const InstallCoordinator&) = delete;
    ~InstallCoordinator();

    // Unsupported providers resolve immediately. Otherwise the future becomes ready once
    // the shared attempt settles, carrying this caller's correlation id.
    std::future<InstallResult> Install(Provider provider, std::string correlation_id);

    // inProgress/activeProvider from the live attempt; bundle fields validated fresh.
    InstallerRuntimeState GetState() const;

    // Pre-flight check of a provider's bundle, the platform's preferred one when omitted.
    BundleValidation Validate(std::optional<Provider> provider = std::nullopt) const;

    HostPlatform Platform() const { return options_.platform; }

  private:
    class ActiveInstallGuard;

    struct Waiter {
        std::string correlation_id;
        std::promise<InstallResult> promise;
    };

    struct ActiveInstall {
        bool in_progress = false;
        std::optional<Provider> provider;
        std::vector<Waiter> waiters;
    };

    // Never throws for std::exception; those become a failed result.
    InstallResult RunAttempt(Provider provider, const std::string& correlation_id) const;
    InstallResult Attempt(Provider provider, const std::string& correlation_id) const;

    InstallerOptions options_;
    BundleValidator validator_;

    mutable std::mutex mu_;
    ActiveInstall active_;
    std::thread worker_;
};

} // namespace vaudio
