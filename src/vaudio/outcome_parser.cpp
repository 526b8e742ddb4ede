#include "vaudio/outcome_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <nlohmann/json.hpp>
#include <regex>

namespace vaudio {

namespace {

constexpr int kAppleScriptUserCanceled = -128;

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string StringMember(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

InstallerExit FromOutput(const ProcessOutcome& outcome) {
    const std::string output = outcome.Output();
    if (auto code = ParseLeadingInt(output)) {
        return {.code = *code, .error = {}};
    }
    return {.code = std::nullopt, .error = "Unexpected installer output: " + output};
}

} // namespace

std::optional<int> ParseLeadingInt(std::string_view text) {
    const std::string trimmed = TrimWhitespace(text);
    std::string_view digits(trimmed);
    if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
    if (digits.empty()) return std::nullopt;

    int value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr == digits.data()) return std::nullopt;
    return value;
}

InstallState MapExitCode(int code) {
    switch (code) {
        case 0:
            return InstallState::Installed;
        case 1638:
            return InstallState::AlreadyInstalled;
        case 3010:
        case 1641:
            return InstallState::RebootRequired;
        case kUserCancelledCode:
            return InstallState::UserCancelled;
        default:
            return InstallState::Failed;
    }
}

bool IsWindowsCancellation(std::string_view error_text) {
    const std::string lower = ToLower(error_text);
    return lower.find("canceled by the user") != std::string::npos ||
           lower.find("cancelled by the user") != std::string::npos;
}

bool IsMacCancellation(std::string_view error_text) {
    static const std::regex kCancel(R"(user cancell?ed|-\s*128\b)", std::regex::icase);
    return std::regex_search(error_text.begin(), error_text.end(), kCancel);
}

std::optional<int> ExtractMacErrorNumber(std::string_view error_text) {
    static const std::regex kNumber(R"((?:error number|number)\s+(-?\d+))", std::regex::icase);
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(error_text.begin(), error_text.end(), match, kNumber)) {
        return std::nullopt;
    }
    return ParseLeadingInt(std::string_view(&*match[1].first,
                                            static_cast<size_t>(match[1].length())));
}

InstallerExit InterpretWindowsInstaller(const ProcessOutcome& outcome) {
    if (outcome.Succeeded()) {
        return FromOutput(outcome);
    }

    std::string text = outcome.ErrorText();
    if (IsWindowsCancellation(text)) {
        return {.code = kUserCancelledCode, .error = {}};
    }
    return {.code = std::nullopt, .error = std::move(text)};
}

InstallerExit InterpretMacInstaller(const ProcessOutcome& outcome) {
    if (outcome.Succeeded()) {
        return FromOutput(outcome);
    }

    std::string text = outcome.ErrorText();
    if (!outcome.timed_out && IsMacCancellation(text)) {
        return {.code = kUserCancelledCode, .error = {}};
    }
    if (!outcome.timed_out) {
        if (auto number = ExtractMacErrorNumber(text)) {
            const int code = *number == kAppleScriptUserCanceled ? kUserCancelledCode : *number;
            return {.code = code, .error = {}};
        }
    }
    return {.code = std::nullopt, .error = std::move(text)};
}

std::expected<AuthenticodeRecord, std::string> ParseAuthenticodeRecord(std::string_view text) {
    const std::string trimmed = TrimWhitespace(text);
    if (trimmed.empty()) {
        return std::unexpected("Empty signature output");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(trimmed);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
    if (!j.is_object()) {
        return std::unexpected("Signature output is not a JSON object");
    }

    return AuthenticodeRecord{.status = StringMember(j, "status"),
                              .subject = StringMember(j, "subject")};
}

PkgutilSignature ParsePkgutilSignature(std::string_view output) {
    static const std::regex kTeam(R"(^\s*Team Identifier:\s*(.+)$)", std::regex::icase);
    static const std::regex kLeaf(R"(^\s*1\.\s+(.+)$)");

    PkgutilSignature sig;
    std::string first_line;
    std::string leaf;

    size_t pos = 0;
    while (pos <= output.size()) {
        size_t end = output.find('\n', pos);
        if (end == std::string_view::npos) end = output.size();
        const std::string line = TrimWhitespace(output.substr(pos, end - pos));
        pos = end + 1;
        if (line.empty()) continue;

        if (first_line.empty()) first_line = line;

        std::smatch m;
        if (!sig.team_id && std::regex_match(line, m, kTeam)) {
            sig.team_id = TrimWhitespace(m[1].str());
        } else if (leaf.empty() && std::regex_match(line, m, kLeaf)) {
            leaf = TrimWhitespace(m[1].str());
        }
    }

    sig.signer = leaf.empty() ? first_line : leaf;
    return sig;
}

} // namespace vaudio
