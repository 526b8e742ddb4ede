#if !defined(_WIN32)
#error "process_runner_win.cpp should only be compiled on Windows builds"
#else

#include "process/process_runner.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace vaudio {

namespace {

class HandleCloser {
  public:
    HandleCloser() = default;
    explicit HandleCloser(HANDLE handle) : handle_(handle) {}
    ~HandleCloser() { Reset(); }

    HandleCloser(const HandleCloser&) = delete;
    HandleCloser& operator=(const HandleCloser&) = delete;

    HANDLE Get() const { return handle_; }
    void Reset(HANDLE handle = nullptr) {
        if (handle_ && handle_ != INVALID_HANDLE_VALUE && handle_ != handle) {
            ::CloseHandle(handle_);
        }
        handle_ = handle;
    }

  private:
    HANDLE handle_ = nullptr;
};

std::string LastErrorText(const char* what) {
    return std::system_error(static_cast<int>(::GetLastError()), std::system_category(), what)
        .what();
}

std::wstring Utf8ToWide(std::string_view input) {
    if (input.empty()) return {};
    const int len = ::MultiByteToWideChar(
        CP_UTF8, 0, input.data(), static_cast<int>(input.size()), nullptr, 0);
    if (len <= 0) return {};
    std::wstring out(static_cast<size_t>(len), L'\0');
    ::MultiByteToWideChar(
        CP_UTF8, 0, input.data(), static_cast<int>(input.size()), out.data(), len);
    return out;
}

// Quotes one argument following the MSVC runtime's CommandLineToArgvW rules.
void AppendQuotedArgument(std::wstring& cmd, const std::wstring& arg) {
    if (!cmd.empty()) cmd.push_back(L' ');
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
        cmd.append(arg);
        return;
    }

    cmd.push_back(L'"');
    for (auto it = arg.begin();; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == L'\\') {
            ++it;
            ++backslashes;
        }
        if (it == arg.end()) {
            cmd.append(backslashes * 2, L'\\');
            break;
        }
        if (*it == L'"') {
            cmd.append(backslashes * 2 + 1, L'\\');
        } else {
            cmd.append(backslashes, L'\\');
        }
        cmd.push_back(*it);
    }
    cmd.push_back(L'"');
}

struct PipeCapture {
    std::string* sink = nullptr;
    std::atomic<std::size_t>* total = nullptr;
    std::size_t cap = 0;
    std::atomic<bool>* overflow = nullptr;
};

void ReadPipe(HANDLE pipe, PipeCapture capture) {
    std::vector<char> chunk(4096);
    while (true) {
        DWORD n = 0;
        if (!::ReadFile(pipe, chunk.data(), static_cast<DWORD>(chunk.size()), &n, nullptr) ||
            n == 0) {
            return;
        }
        const std::size_t seen = capture.total->fetch_add(n) + n;
        if (seen > capture.cap) {
            capture.overflow->store(true);
            continue;
        }
        capture.sink->append(chunk.data(), n);
    }
}

class WindowsProcessRunner final : public IProcessRunner {
  public:
    ProcessOutcome Run(const ProcessRequest& request) const override {
        ProcessOutcome out;
        if (request.program.empty()) {
            out.spawn_error = "empty program path";
            return out;
        }

        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        HANDLE raw_read = nullptr;
        HANDLE raw_write = nullptr;
        if (!::CreatePipe(&raw_read, &raw_write, &sa, 0)) {
            out.spawn_error = LastErrorText("CreatePipe failed");
            return out;
        }
        HandleCloser stdout_read(raw_read);
        HandleCloser stdout_write(raw_write);

        if (!::CreatePipe(&raw_read, &raw_write, &sa, 0)) {
            out.spawn_error = LastErrorText("CreatePipe failed");
            return out;
        }
        HandleCloser stderr_read(raw_read);
        HandleCloser stderr_write(raw_write);

        if (!::SetHandleInformation(stdout_read.Get(), HANDLE_FLAG_INHERIT, 0) ||
            !::SetHandleInformation(stderr_read.Get(), HANDLE_FLAG_INHERIT, 0)) {
            out.spawn_error = LastErrorText("SetHandleInformation failed");
            return out;
        }

        HandleCloser null_in(::CreateFileW(L"NUL",
                                           GENERIC_READ,
                                           FILE_SHARE_READ | FILE_SHARE_WRITE,
                                           &sa,
                                           OPEN_EXISTING,
                                           FILE_ATTRIBUTE_NORMAL,
                                           nullptr));
        if (null_in.Get() == INVALID_HANDLE_VALUE) {
            out.spawn_error = LastErrorText("CreateFileW NUL failed");
            return out;
        }

        std::wstring command_line;
        AppendQuotedArgument(command_line, Utf8ToWide(request.program));
        for (const auto& arg : request.args) {
            AppendQuotedArgument(command_line, Utf8ToWide(arg));
        }
        std::vector<wchar_t> cmd_buffer(command_line.begin(), command_line.end());
        cmd_buffer.push_back(L'\0');

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        si.dwFlags |= STARTF_USESTDHANDLES;
        si.hStdInput = null_in.Get();
        si.hStdOutput = stdout_write.Get();
        si.hStdError = stderr_write.Get();

        PROCESS_INFORMATION pi{};
        if (!::CreateProcessW(nullptr,
                              cmd_buffer.data(),
                              nullptr,
                              nullptr,
                              TRUE,
                              CREATE_NO_WINDOW,
                              nullptr,
                              nullptr,
                              &si,
                              &pi)) {
            out.spawn_error = LastErrorText(("failed to execute " + request.program).c_str());
            return out;
        }
        HandleCloser process(pi.hProcess);
        HandleCloser thread(pi.hThread);

        LogDebug("spawned pid=%lu: %s", static_cast<unsigned long>(pi.dwProcessId),
                 request.program.c_str());

        null_in.Reset();
        stdout_write.Reset();
        stderr_write.Reset();

        std::atomic<std::size_t> total{0};
        std::atomic<bool> overflow{false};
        std::thread stdout_reader(
            ReadPipe, stdout_read.Get(),
            PipeCapture{&out.std_out, &total, request.max_output_bytes, &overflow});
        std::thread stderr_reader(
            ReadPipe, stderr_read.Get(),
            PipeCapture{&out.std_err, &total, request.max_output_bytes, &overflow});

        const auto timeout_ms =
            std::clamp(request.timeout, std::chrono::milliseconds::zero(), kMaxProcessTimeout).count();
        const DWORD wait_ms = static_cast<DWORD>(timeout_ms);
        const DWORD wait_result = ::WaitForSingleObject(process.Get(), wait_ms);
        if (wait_result == WAIT_TIMEOUT) {
            out.timed_out = true;
            ::TerminateProcess(process.Get(), 1);
            ::WaitForSingleObject(process.Get(), INFINITE);
            LogWarn("%s timed out after %lld ms and was killed",
                    request.program.c_str(),
                    static_cast<long long>(timeout_ms));
        } else if (wait_result != WAIT_OBJECT_0) {
            out.spawn_error = LastErrorText("WaitForSingleObject failed");
            ::TerminateProcess(process.Get(), 1);
            ::WaitForSingleObject(process.Get(), INFINITE);
        }

        // Descendants can keep the pipes open after the child is gone.
        if (out.timed_out || !out.spawn_error.empty()) {
            ::CancelIoEx(stdout_read.Get(), nullptr);
            ::CancelIoEx(stderr_read.Get(), nullptr);
        }
        stdout_reader.join();
        stderr_reader.join();

        if (out.timed_out || !out.spawn_error.empty()) return out;

        if (overflow.load()) {
            out.spawn_error =
                "output exceeded " + std::to_string(request.max_output_bytes) + " bytes";
            return out;
        }

        DWORD exit_code = 0;
        if (!::GetExitCodeProcess(process.Get(), &exit_code)) {
            out.spawn_error = LastErrorText("GetExitCodeProcess failed");
            return out;
        }
        out.exit_code = static_cast<int>(exit_code);
        return out;
    }
};

} // namespace

std::shared_ptr<const IProcessRunner> CreateDefaultProcessRunner() {
    static const std::shared_ptr<const IProcessRunner> kDefault =
        std::make_shared<WindowsProcessRunner>();
    return kDefault;
}

} // namespace vaudio

#endif // _WIN32
