#include "vaudio/install_coordinator.hpp"

#include "util/logger.hpp"
#include "vaudio/outcome_parser.hpp"
#include "vaudio/platform_strategy.hpp"

#include <exception>
#include <functional>
#include <stdexcept>
#include <utility>

namespace vaudio {

namespace {

constexpr const char kNoProviderMessage[] =
    "No virtual audio installer is supported on this platform.";

InstallResult Failed(Provider provider, const std::string& correlation_id, std::string message) {
    InstallResult r;
    r.provider = provider;
    r.state = InstallState::Failed;
    r.message = std::move(message);
    r.correlation_id = correlation_id;
    return r;
}

InstallResult Unsupported(Provider provider, std::string correlation_id) {
    InstallResult r;
    r.provider = provider;
    r.state = InstallState::Unsupported;
    r.message = std::string("Provider \"") + ToString(provider) + "\" is unsupported on this platform.";
    r.correlation_id = std::move(correlation_id);
    return r;
}

std::string LoadFailureMessage(Provider provider, const BundleError& error) {
    const std::string name = DisplayName(provider);
    switch (error.kind) {
        case BundleErrorKind::ManifestMissing:
            return name + " manifest not found in bundled resources.";
        case BundleErrorKind::ManifestInvalid:
            return name + " manifest invalid: " + error.detail;
        case BundleErrorKind::ProviderMismatch:
            return name + " manifest provider mismatch.";
        case BundleErrorKind::InstallerMissing:
            return name + " installer not found: " + error.detail;
        case BundleErrorKind::HashMismatch:
            return "Installer hash verification failed.";
    }
    return name + " installer bundle invalid.";
}

} // namespace

// Clears the in-flight bookkeeping and resolves every waiter exactly once, in that order,
// whichever way the attempt ends.
class InstallCoordinator::ActiveInstallGuard {
  public:
    explicit ActiveInstallGuard(InstallCoordinator& owner) : owner_(owner) {}
    ActiveInstallGuard(const ActiveInstallGuard&) = delete;
    ActiveInstallGuard& operator=(const ActiveInstallGuard&) = delete;

    ~ActiveInstallGuard() {
        if (!settled_) {
            Abort(std::make_exception_ptr(std::runtime_error("install attempt did not complete")));
        }
    }

    void Settle(const InstallResult& result) {
        for (auto& w : Release()) {
            InstallResult copy = result;
            copy.correlation_id = w.correlation_id;
            w.promise.set_value(std::move(copy));
        }
    }

    void Abort(std::exception_ptr error) {
        for (auto& w : Release()) {
            w.promise.set_exception(error);
        }
    }

  private:
    std::vector<Waiter> Release() {
        std::vector<Waiter> waiters;
        {
            std::lock_guard<std::mutex> lk(owner_.mu_);
            waiters = std::move(owner_.active_.waiters);
            owner_.active_ = ActiveInstall{};
        }
        settled_ = true;
        return waiters;
    }

    InstallCoordinator& owner_;
    bool settled_ = false;
};

InstallCoordinator::InstallCoordinator(InstallerOptions options)
    : options_(std::move(options)), validator_(BundleResolver(options_.roots)) {
    if (!options_.runner) {
        options_.runner = CreateDefaultProcessRunner();
    }
}

InstallCoordinator::~InstallCoordinator() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::future<InstallResult> InstallCoordinator::Install(Provider provider,
                                                       std::string correlation_id) {
    if (!IsProviderSupported(provider, options_.platform)) {
        LogInfo("[%s] %s is unsupported on %s",
                correlation_id.c_str(), ToString(provider), ToString(options_.platform));
        std::promise<InstallResult> ready;
        ready.set_value(Unsupported(provider, std::move(correlation_id)));
        return ready.get_future();
    }

    std::lock_guard<std::mutex> lk(mu_);

    Waiter waiter{.correlation_id = correlation_id, .promise = {}};
    auto future = waiter.promise.get_future();

    if (active_.in_progress) {
        LogInfo("[%s] joining in-flight %s install",
                correlation_id.c_str(), ToString(*active_.provider));
        active_.waiters.push_back(std::move(waiter));
        return future;
    }

    // The previous worker has already released the bookkeeping; it only has promises
    // left to fulfil before exiting.
    if (worker_.joinable()) {
        worker_.join();
    }

    // The worker cannot release the bookkeeping before mu_ is dropped. The attempt is
    // committed only once the worker exists.
    std::function<void()> body = [this, provider, id = correlation_id]() {
        ActiveInstallGuard guard(*this);
        try {
            guard.Settle(RunAttempt(provider, id));
        } catch (...) {
            guard.Abort(std::current_exception());
        }
    };
    try {
        worker_ = options_.launch_worker ? options_.launch_worker(std::move(body))
                                         : std::thread(std::move(body));
    } catch (const std::exception& e) {
        LogError("[%s] cannot start %s install worker: %s",
                 correlation_id.c_str(), ToString(provider), e.what());
        waiter.promise.set_value(Failed(provider, correlation_id,
                                        std::string("Failed to start installer: ") + e.what()));
        return future;
    }

    active_.in_progress = true;
    active_.provider = provider;
    active_.waiters.push_back(std::move(waiter));
    return future;
}

InstallResult InstallCoordinator::RunAttempt(Provider provider,
                                             const std::string& correlation_id) const {
    InstallResult result;
    try {
        result = Attempt(provider, correlation_id);
    } catch (const std::exception& e) {
        LogError("[%s] %s install aborted: %s", correlation_id.c_str(), ToString(provider), e.what());
        result = Failed(provider, correlation_id, e.what());
    }
    LogInfo("[%s] %s install finished: %s",
            correlation_id.c_str(), ToString(provider), ToString(result.state));
    return result;
}

InstallResult InstallCoordinator::Attempt(Provider provider,
                                          const std::string& correlation_id) const {
    const char* cid = correlation_id.c_str();
    LogInfo("[%s] starting %s install", cid, ToString(provider));

    auto strategy = CreatePlatformStrategy(provider, options_.platform, options_.runner,
                                           options_.default_timeout_ms);
    if (!strategy) {
        return Unsupported(provider, correlation_id);
    }

    auto bundle = validator_.Load(provider);
    if (!bundle) {
        LogWarn("[%s] bundle rejected: %s", cid, bundle.error().detail.c_str());
        return Failed(provider, correlation_id, LoadFailureMessage(provider, bundle.error()));
    }
    LogInfo("[%s] using bundle %s (version %s)",
            cid, bundle->dir.string().c_str(),
            bundle->manifest.version.empty() ? "unknown" : bundle->manifest.version.c_str());

    if (auto hashed = validator_.VerifyHash(*bundle); !hashed) {
        return Failed(provider, correlation_id, "Installer hash verification failed.");
    }

    const VerificationMode mode = EffectiveVerificationMode(bundle->manifest);
    LogInfo("[%s] verification mode: %s", cid, ToString(mode));
    if (mode == VerificationMode::Strict) {
        auto vr = strategy->VerifySigner(*bundle);
        if (!vr.is_ok()) {
            LogWarn("[%s] strict verification failed: %s", cid, vr.message().c_str());
            return Failed(provider, correlation_id,
                          vr.message().empty() ? "Installer strict verification failed."
                                               : vr.message());
        }
    }

    if (strategy->ProbeExisting(*bundle)) {
        InstallResult r;
        r.provider = provider;
        r.state = InstallState::AlreadyInstalled;
        r.correlation_id = correlation_id;
        return r;
    }

    const ProcessOutcome outcome = strategy->InvokeInstaller(*bundle);
    const InstallerExit exit = strategy->InterpretOutcome(outcome);
    if (!exit.code) {
        LogWarn("[%s] installer did not report an exit code: %s", cid, exit.error.c_str());
        return Failed(provider, correlation_id,
                      exit.error.empty() ? std::string(DisplayName(provider)) +
                                               " installer failed to start."
                                         : exit.error);
    }

    InstallResult r;
    r.provider = provider;
    r.state = MapExitCode(*exit.code);
    r.code = *exit.code;
    r.requires_restart = r.state == InstallState::RebootRequired;
    r.correlation_id = correlation_id;
    if (r.state == InstallState::Failed) {
        r.message = "Installer exited with code " + std::to_string(*exit.code);
    }
    LogInfo("[%s] installer exited with code %d", cid, *exit.code);
    return r;
}

InstallerRuntimeState InstallCoordinator::GetState() const {
    InstallerRuntimeState state;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state.in_progress = active_.in_progress;
        state.active_provider = active_.provider;
    }

    const auto preferred = GetPreferredProviderForPlatform(options_.platform);
    state.platform_supported = preferred.has_value();
    const BundleValidation v = Validate(preferred);
    state.bundle_ready = v.ok;
    state.bundle_message = v.message;
    return state;
}

BundleValidation InstallCoordinator::Validate(std::optional<Provider> provider) const {
    const auto resolved = provider ? provider : GetPreferredProviderForPlatform(options_.platform);
    if (!resolved) {
        return {.ok = false, .message = kNoProviderMessage};
    }
    return validator_.Validate(*resolved);
}

} // namespace vaudio
