#include "process/process_runner.hpp"

#include <string_view>

namespace vaudio {

std::string TrimWhitespace(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto begin = s.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) return {};
    const auto end = s.find_last_not_of(kSpace);
    return std::string(s.substr(begin, end - begin + 1));
}

std::string ProcessOutcome::Output() const { return TrimWhitespace(std_out); }

std::string ProcessOutcome::ErrorText() const {
    if (timed_out) {
        std::string detail = TrimWhitespace(std_err);
        if (detail.empty()) return "Process timed out and was killed";
        return "Process timed out and was killed: " + detail;
    }
    if (!spawn_error.empty()) return spawn_error;
    if (auto err = TrimWhitespace(std_err); !err.empty()) return err;
    if (auto out = TrimWhitespace(std_out); !out.empty()) return out;
    if (term_signal) return "Process terminated by signal " + std::to_string(*term_signal);
    if (exit_code) return "Process exited with code " + std::to_string(*exit_code);
    return "Process terminated abnormally";
}

} // namespace vaudio
