#pragma once

#include "process/process_runner.hpp"
#include "vaudio/install_result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace vaudio {

// ERROR_CANCELLED; also what the AppleScript wrapper reports for error -128.
inline constexpr int kUserCancelledCode = 1223;

// What an elevated installer run amounted to: an exit code, or free text when no code
// could be recovered.
struct InstallerExit {
    std::optional<int> code;
    std::string error;
};

// Leading-integer parse after trimming whitespace; trailing text is ignored.
std::optional<int> ParseLeadingInt(std::string_view text);

// 0 installed, 1638 already installed, 3010/1641 reboot required, 1223 cancelled.
InstallState MapExitCode(int code);

bool IsWindowsCancellation(std::string_view error_text);
bool IsMacCancellation(std::string_view error_text);

// "error number <n>" / "number <n>" embedded in osascript error text.
std::optional<int> ExtractMacErrorNumber(std::string_view error_text);

// PowerShell Start-Process wrapper: stdout carries the installer's exit code.
InstallerExit InterpretWindowsInstaller(const ProcessOutcome& outcome);

// osascript wrapper: stdout carries "0" or an AppleScript error number.
InstallerExit InterpretMacInstaller(const ProcessOutcome& outcome);

// `{status, subject}` emitted by the Get-AuthenticodeSignature wrapper. Missing or
// non-string members read as empty.
struct AuthenticodeRecord {
    std::string status;
    std::string subject;
};

std::expected<AuthenticodeRecord, std::string> ParseAuthenticodeRecord(std::string_view text);

// `pkgutil --check-signature` output reduced to the claims strict mode checks. The signer
// is the leaf entry of the certificate chain ("1. ...") when one is listed, otherwise the
// first non-empty line.
struct PkgutilSignature {
    std::string signer;
    std::optional<std::string> team_id;
};

PkgutilSignature ParsePkgutilSignature(std::string_view output);

} // namespace vaudio
