#if defined(_WIN32)
#error "process_runner_posix.cpp should not be compiled on Windows builds"
#else

#include "process/process_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vaudio {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kChildErrorExit = 127;

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe(fds) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("pipe failed: ") + std::strerror(err));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("fcntl failed: ") + std::strerror(err));
    }
    return Result::Ok();
}

int RemainingMs(Clock::time_point deadline) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) return 0;
    return left > 1000 * 60 * 60 ? 1000 * 60 * 60 : static_cast<int>(left);
}

// Runs between fork and exec, so it must not allocate.
[[noreturn]] void ExecChild(char* const* argv,
                            int stdout_fd,
                            int stderr_fd,
                            int exec_err_fd) {
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0 || ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        const int err = errno;
        (void)!::write(exec_err_fd, &err, sizeof(err));
        _exit(kChildErrorExit);
    }

    ::execvp(argv[0], argv);
    const int err = errno;
    (void)!::write(exec_err_fd, &err, sizeof(err));
    _exit(kChildErrorExit);
}

// Returns the errno reported by the child when exec failed, 0 once exec succeeded.
int ReadExecError(Fd& exec_err_read) {
    int child_errno = 0;
    while (true) {
        const ssize_t n = ::read(exec_err_read.Get(), &child_errno, sizeof(child_errno));
        if (n < 0 && errno == EINTR) continue;
        if (n == static_cast<ssize_t>(sizeof(child_errno))) return child_errno;
        return 0;
    }
}

void KillChild(pid_t child) { (void)::kill(child, SIGKILL); }

void RecordStatus(int status, ProcessOutcome& out) {
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
    }
}

// Reaps the child, killing it once the deadline passes.
void WaitForExit(pid_t child, Clock::time_point deadline, ProcessOutcome& out) {
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(child, &status, WNOHANG);
        if (r == child) {
            if (!out.timed_out) RecordStatus(status, out);
            return;
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            out.spawn_error = std::string("waitpid failed: ") + std::strerror(errno);
            return;
        }
        if (!out.timed_out && Clock::now() >= deadline) {
            out.timed_out = true;
            KillChild(child);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

struct PipeState {
    Fd fd;
    std::string* sink = nullptr;
};

// Drains stdout and stderr until both close, the deadline passes, or the output cap is hit.
void DrainPipes(std::array<PipeState, 2>& pipes,
                pid_t child,
                Clock::time_point deadline,
                std::size_t max_output_bytes,
                ProcessOutcome& out) {
    std::array<pollfd, 2> poll_fds{};
    std::vector<char> chunk(4096);
    std::size_t total = 0;

    while (pipes[0].fd.Valid() || pipes[1].fd.Valid()) {
        for (size_t i = 0; i < pipes.size(); ++i) {
            poll_fds[i].fd = pipes[i].fd.Valid() ? pipes[i].fd.Get() : -1;
            poll_fds[i].events = POLLIN;
            poll_fds[i].revents = 0;
        }

        const int wait_ms = RemainingMs(deadline);
        if (wait_ms == 0) {
            out.timed_out = true;
            KillChild(child);
            return;
        }

        const int pr = ::poll(poll_fds.data(), poll_fds.size(), wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            out.spawn_error = std::string("poll failed: ") + std::strerror(errno);
            KillChild(child);
            return;
        }
        if (pr == 0) continue;

        for (size_t i = 0; i < pipes.size(); ++i) {
            if (!pipes[i].fd.Valid() || poll_fds[i].revents == 0) continue;

            const ssize_t n = ::read(pipes[i].fd.Get(), chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                pipes[i].fd.Close();
                continue;
            }
            if (n == 0) {
                pipes[i].fd.Close();
                continue;
            }

            total += static_cast<std::size_t>(n);
            if (total > max_output_bytes) {
                out.spawn_error =
                    "output exceeded " + std::to_string(max_output_bytes) + " bytes";
                KillChild(child);
                return;
            }
            pipes[i].sink->append(chunk.data(), static_cast<size_t>(n));
        }
    }
}

class PosixProcessRunner final : public IProcessRunner {
  public:
    ProcessOutcome Run(const ProcessRequest& request) const override {
        ProcessOutcome out;
        if (request.program.empty()) {
            out.spawn_error = "empty program path";
            return out;
        }

        std::vector<std::string> argv;
        argv.reserve(request.args.size() + 1);
        argv.push_back(request.program);
        argv.insert(argv.end(), request.args.begin(), request.args.end());
        std::vector<char*> argv_ptrs;
        argv_ptrs.reserve(argv.size() + 1);
        for (auto& arg : argv) argv_ptrs.push_back(arg.data());
        argv_ptrs.push_back(nullptr);

        Fd stdout_read, stdout_write, stderr_read, stderr_write, exec_err_read, exec_err_write;
        for (auto [r, w] : {std::pair{&stdout_read, &stdout_write},
                            std::pair{&stderr_read, &stderr_write},
                            std::pair{&exec_err_read, &exec_err_write}}) {
            auto pr = MakePipe(*r, *w);
            if (!pr.is_ok()) {
                out.spawn_error = pr.message();
                return out;
            }
        }

        const auto timeout =
            std::clamp(request.timeout, std::chrono::milliseconds::zero(), kMaxProcessTimeout);
        const auto deadline = Clock::now() + timeout;
        const pid_t child = ::fork();
        if (child < 0) {
            out.spawn_error = std::string("fork failed: ") + std::strerror(errno);
            return out;
        }
        if (child == 0) {
            ExecChild(argv_ptrs.data(), stdout_write.Get(), stderr_write.Get(), exec_err_write.Get());
        }

        stdout_write.Close();
        stderr_write.Close();
        exec_err_write.Close();

        if (const int child_errno = ReadExecError(exec_err_read); child_errno != 0) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
            }
            out.spawn_error = "failed to execute " + request.program + ": " +
                              std::strerror(child_errno);
            return out;
        }

        LogDebug("spawned pid=%d: %s", static_cast<int>(child), request.program.c_str());

        std::array<PipeState, 2> pipes{
            PipeState{std::move(stdout_read), &out.std_out},
            PipeState{std::move(stderr_read), &out.std_err},
        };
        DrainPipes(pipes, child, deadline, request.max_output_bytes, out);
        WaitForExit(child, deadline, out);

        if (out.timed_out) {
            out.exit_code.reset();
            LogWarn("%s timed out after %lld ms and was killed",
                    request.program.c_str(),
                    static_cast<long long>(request.timeout.count()));
        } else if (!out.spawn_error.empty()) {
            out.exit_code.reset();
        }
        return out;
    }
};

} // namespace

std::shared_ptr<const IProcessRunner> CreateDefaultProcessRunner() {
    static const std::shared_ptr<const IProcessRunner> kDefault =
        std::make_shared<PosixProcessRunner>();
    return kDefault;
}

} // namespace vaudio

#endif // !_WIN32
