#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaudio {

// Longer requests are clamped to this before the deadline is computed.
inline constexpr std::chrono::milliseconds kMaxProcessTimeout = std::chrono::hours(24);

struct ProcessRequest {
    std::string program;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{180000};
    std::size_t max_output_bytes = 4 * 1024 * 1024;
};

// Raw result of one child process. `exit_code` is empty when the child could not be
// started, was killed after the timeout, or died from a signal.
struct ProcessOutcome {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool timed_out = false;
    std::string std_out;
    std::string std_err;
    std::string spawn_error;

    bool Succeeded() const {
        return spawn_error.empty() && !timed_out && exit_code.has_value() && *exit_code == 0;
    }

    // Trimmed stdout.
    std::string Output() const;

    // Best human-readable description of a failed run: the timeout or spawn error, then
    // stderr, then stdout, then the exit status.
    std::string ErrorText() const;
};

class IProcessRunner {
  public:
    virtual ~IProcessRunner() = default;
    virtual ProcessOutcome Run(const ProcessRequest& request) const = 0;
};

// fork/exec on POSIX hosts, CreateProcessW on Windows.
std::shared_ptr<const IProcessRunner> CreateDefaultProcessRunner();

std::string TrimWhitespace(std::string_view s);

} // namespace vaudio
