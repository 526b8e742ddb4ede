#pragma once

#include "process/process_runner.hpp"
#include "util/result.hpp"
#include "vaudio/bundle_validator.hpp"
#include "vaudio/outcome_parser.hpp"
#include "vaudio/provider.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vaudio {

// Everything an install attempt needs from the host OS. One implementation per provider;
// every external tool goes through the injected IProcessRunner.
class IPlatformStrategy {
  public:
    virtual ~IPlatformStrategy() = default;

    virtual Provider GetProvider() const = 0;

    // True when the driver package is already registered with the OS.
    virtual bool ProbeExisting(const LoadedBundle& bundle) const = 0;

    // Strict-mode signer/team/notarization checks. Fails closed.
    virtual Result VerifySigner(const LoadedBundle& bundle) const = 0;

    virtual ProcessOutcome InvokeInstaller(const LoadedBundle& bundle) const = 0;
    virtual InstallerExit InterpretOutcome(const ProcessOutcome& outcome) const = 0;
};

class PlatformStrategyBase : public IPlatformStrategy {
  public:
    PlatformStrategyBase(std::shared_ptr<const IProcessRunner> runner,
                         std::uint64_t default_timeout_ms);

  protected:
    // manifest.timeoutMs when set and non-zero, else the configured default.
    std::chrono::milliseconds TimeoutFor(const LoadedBundle& bundle) const;

    ProcessOutcome Run(const std::string& program,
                       std::vector<std::string> args,
                       std::chrono::milliseconds timeout) const;

  private:
    std::shared_ptr<const IProcessRunner> runner_;
    std::uint64_t default_timeout_ms_;
};

// VB-CABLE through PowerShell: Get-AuthenticodeSignature for strict mode and
// Start-Process -Verb RunAs for the elevated run.
class WindowsStrategy final : public PlatformStrategyBase {
  public:
    using PlatformStrategyBase::PlatformStrategyBase;

    Provider GetProvider() const override { return Provider::VbCable; }
    bool ProbeExisting(const LoadedBundle& bundle) const override;
    Result VerifySigner(const LoadedBundle& bundle) const override;
    ProcessOutcome InvokeInstaller(const LoadedBundle& bundle) const override;
    InstallerExit InterpretOutcome(const ProcessOutcome& outcome) const override;

    static std::string SignatureScript(const std::string& installer_path);
    static std::string InstallScript(const std::string& installer_path,
                                     const std::vector<std::string>& args);
};

// BlackHole through pkgutil/spctl for strict mode and osascript with administrator
// privileges around /usr/sbin/installer.
class MacStrategy final : public PlatformStrategyBase {
  public:
    using PlatformStrategyBase::PlatformStrategyBase;

    Provider GetProvider() const override { return Provider::BlackHole; }
    bool ProbeExisting(const LoadedBundle& bundle) const override;
    Result VerifySigner(const LoadedBundle& bundle) const override;
    ProcessOutcome InvokeInstaller(const LoadedBundle& bundle) const override;
    InstallerExit InterpretOutcome(const ProcessOutcome& outcome) const override;

    static std::string InstallScript(const std::string& pkg_path);
};

inline constexpr const char kPowerShellProgram[] = "powershell.exe";
inline constexpr const char kPkgutilProgram[] = "/usr/sbin/pkgutil";
inline constexpr const char kSpctlProgram[] = "/usr/sbin/spctl";
inline constexpr const char kOsascriptProgram[] = "/usr/bin/osascript";

// PowerShell single-quoted literal: ' doubled.
std::string QuotePowerShell(std::string_view value);

// AppleScript string literal: backslash and double quote escaped.
std::string QuoteAppleScript(std::string_view value);

// nullptr when the provider is not installable on `platform`.
std::unique_ptr<IPlatformStrategy> CreatePlatformStrategy(Provider provider,
                                                          HostPlatform platform,
                                                          std::shared_ptr<const IProcessRunner> runner,
                                                          std::uint64_t default_timeout_ms);

} // namespace vaudio
