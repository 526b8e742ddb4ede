#include "vaudio/platform_strategy.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace vaudio {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::vector<std::string> PowerShellArgs(std::string script) {
    return {"-NoProfile", "-NonInteractive", "-ExecutionPolicy", "Bypass", "-Command",
            std::move(script)};
}

} // namespace

std::string QuotePowerShell(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string QuoteAppleScript(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// ---------------- PlatformStrategyBase ----------------

PlatformStrategyBase::PlatformStrategyBase(std::shared_ptr<const IProcessRunner> runner,
                                           std::uint64_t default_timeout_ms)
    : runner_(std::move(runner)),
      default_timeout_ms_(default_timeout_ms ? default_timeout_ms : kDefaultInstallTimeoutMs) {}

std::chrono::milliseconds PlatformStrategyBase::TimeoutFor(const LoadedBundle& bundle) const {
    const auto& t = bundle.manifest.timeout_ms;
    return std::chrono::milliseconds(std::min(t && *t > 0 ? *t : default_timeout_ms_,
                                              kMaxInstallTimeoutMs));
}

ProcessOutcome PlatformStrategyBase::Run(const std::string& program,
                                         std::vector<std::string> args,
                                         std::chrono::milliseconds timeout) const {
    if (!runner_) {
        ProcessOutcome out;
        out.spawn_error = "no process runner configured";
        return out;
    }
    ProcessRequest req;
    req.program = program;
    req.args = std::move(args);
    req.timeout = timeout;
    return runner_->Run(req);
}

// ---------------- WindowsStrategy ----------------

std::string WindowsStrategy::SignatureScript(const std::string& installer_path) {
    std::string s;
    s += "$ErrorActionPreference = \"Stop\"\n";
    s += "$sig = Get-AuthenticodeSignature -FilePath " + QuotePowerShell(installer_path) + "\n";
    s += "$result = @{\n";
    s += "  status = $sig.Status.ToString()\n";
    s += "  subject = if ($sig.SignerCertificate) { $sig.SignerCertificate.Subject } else { \"\" }\n";
    s += "}\n";
    s += "$result | ConvertTo-Json -Compress";
    return s;
}

std::string WindowsStrategy::InstallScript(const std::string& installer_path,
                                           const std::vector<std::string>& args) {
    std::string arg_list;
    for (const auto& a : args) {
        if (!arg_list.empty()) arg_list += ", ";
        arg_list += QuotePowerShell(a);
    }

    std::string s;
    s += "$ErrorActionPreference = \"Stop\"\n";
    s += "$proc = Start-Process -FilePath " + QuotePowerShell(installer_path) +
         " -ArgumentList @(" + arg_list + ") -Verb RunAs -Wait -PassThru\n";
    s += "Write-Output $proc.ExitCode";
    return s;
}

bool WindowsStrategy::ProbeExisting(const LoadedBundle&) const {
    return false;
}

Result WindowsStrategy::VerifySigner(const LoadedBundle& bundle) const {
    const auto& m = bundle.manifest;
    const std::string& expected =
        !m.expected_signer_contains.empty() ? m.expected_signer_contains : m.expected_publisher;
    if (expected.empty()) {
        return Result::Fail("Strict verification requires expected signer information.");
    }

    LogInfo("Checking Authenticode signature of %s", bundle.installer_path.string().c_str());
    auto out = Run(kPowerShellProgram,
                   PowerShellArgs(SignatureScript(bundle.installer_path.string())),
                   TimeoutFor(bundle));
    if (!out.Succeeded()) {
        return Result::Fail("Failed to verify signature: " + out.ErrorText());
    }

    auto record = ParseAuthenticodeRecord(out.Output());
    if (!record) {
        return Result::Fail("Failed to verify signature: " + record.error());
    }

    if (ToLower(record->status) != "valid") {
        return Result::Fail("Authenticode status is " +
                            (record->status.empty() ? std::string("unknown") : record->status));
    }
    if (!ContainsIgnoreCase(record->subject, expected)) {
        LogWarn("Authenticode subject '%s' does not contain '%s'",
                record->subject.c_str(), expected.c_str());
        return Result::Fail("Installer publisher mismatch");
    }
    return Result::Ok();
}

ProcessOutcome WindowsStrategy::InvokeInstaller(const LoadedBundle& bundle) const {
    LogInfo("Launching elevated installer %s", bundle.installer_path.string().c_str());
    return Run(kPowerShellProgram,
               PowerShellArgs(InstallScript(bundle.installer_path.string(),
                                            bundle.manifest.silent_args)),
               TimeoutFor(bundle));
}

InstallerExit WindowsStrategy::InterpretOutcome(const ProcessOutcome& outcome) const {
    return InterpretWindowsInstaller(outcome);
}

// ---------------- MacStrategy ----------------

std::string MacStrategy::InstallScript(const std::string& pkg_path) {
    std::string s;
    s += "set pkgPath to " + QuoteAppleScript(pkg_path) + "\n";
    s += "try\n";
    s += "  do shell script \"/usr/sbin/installer -pkg \" & quoted form of pkgPath & \" -target /\""
         " with administrator privileges\n";
    s += "  return \"0\"\n";
    s += "on error errMsg number errNum\n";
    s += "  if errNum = -128 then return \"1223\"\n";
    s += "  return errNum as string\n";
    s += "end try";
    return s;
}

bool MacStrategy::ProbeExisting(const LoadedBundle& bundle) const {
    const std::string& id = bundle.manifest.package_id;
    if (id.empty()) return false;

    auto out = Run(kPkgutilProgram, {"--pkg-info", id}, TimeoutFor(bundle));
    if (out.Succeeded()) {
        LogInfo("Package %s is already registered", id.c_str());
        return true;
    }
    LogDebug("Package %s not registered: %s", id.c_str(), out.ErrorText().c_str());
    return false;
}

Result MacStrategy::VerifySigner(const LoadedBundle& bundle) const {
    const auto& m = bundle.manifest;
    const std::string pkg = bundle.installer_path.string();

    LogInfo("Checking package signature of %s", pkg.c_str());
    auto out = Run(kPkgutilProgram, {"--check-signature", pkg}, TimeoutFor(bundle));
    if (!out.Succeeded()) {
        return Result::Fail("Failed to verify package signature: " + out.ErrorText());
    }

    const std::string text = out.Output();
    if (text.empty()) {
        return Result::Fail("No signature output from pkgutil.");
    }

    const PkgutilSignature sig = ParsePkgutilSignature(text);
    if (!m.expected_signer_contains.empty() &&
        !ContainsIgnoreCase(sig.signer, m.expected_signer_contains)) {
        LogWarn("Package signer '%s' does not contain '%s'",
                sig.signer.c_str(), m.expected_signer_contains.c_str());
        return Result::Fail("Installer signer does not match expected value.");
    }
    if (!m.expected_team_id.empty() && sig.team_id.value_or("") != m.expected_team_id) {
        const std::string found =
            sig.team_id && !sig.team_id->empty() ? *sig.team_id : std::string("unknown");
        return Result::Fail("Installer Team ID mismatch (found: " + found + ").");
    }

    if (m.require_notarization) {
        LogInfo("Checking notarization of %s", pkg.c_str());
        auto notarized = Run(kSpctlProgram, {"-a", "-vv", "-t", "install", pkg}, TimeoutFor(bundle));
        if (!notarized.Succeeded()) {
            return Result::Fail("Installer notarization check failed: " + notarized.ErrorText());
        }
    }
    return Result::Ok();
}

ProcessOutcome MacStrategy::InvokeInstaller(const LoadedBundle& bundle) const {
    LogInfo("Launching installer for %s with administrator privileges",
            bundle.installer_path.string().c_str());
    return Run(kOsascriptProgram, {"-e", InstallScript(bundle.installer_path.string())},
               TimeoutFor(bundle));
}

InstallerExit MacStrategy::InterpretOutcome(const ProcessOutcome& outcome) const {
    return InterpretMacInstaller(outcome);
}

// ---------------- factory ----------------

std::unique_ptr<IPlatformStrategy> CreatePlatformStrategy(Provider provider,
                                                          HostPlatform platform,
                                                          std::shared_ptr<const IProcessRunner> runner,
                                                          std::uint64_t default_timeout_ms) {
    if (!IsProviderSupported(provider, platform)) return nullptr;

    switch (provider) {
        case Provider::VbCable:
            return std::make_unique<WindowsStrategy>(std::move(runner), default_timeout_ms);
        case Provider::BlackHole:
            return std::make_unique<MacStrategy>(std::move(runner), default_timeout_ms);
    }
    return nullptr;
}

} // namespace vaudio
