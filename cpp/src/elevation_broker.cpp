#include "../include/elevation_broker.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <thread>
#include <variant>

#ifdef _WIN32
#include <cwchar>
#include <objbase.h>
#include <shellapi.h>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace psrelay {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

std::string system_message(int code) {
    return std::system_category().message(code);
}

LaunchOutcome launch_failure(std::string message, FailureHint hint = FailureHint::None) {
    PSRELAY_DBG("LAUNCH", "failed: %s", message.c_str());
    LaunchOutcome outcome;
    outcome.error = std::move(message);
    outcome.hint = hint;
    return outcome;
}

} // namespace

#ifndef _WIN32

namespace {

constexpr auto TERM_GRACE = std::chrono::milliseconds(500);
constexpr auto REAP_LIMIT = std::chrono::milliseconds(2000);

void set_cloexec(int fd) {
    int f = fcntl(fd, F_GETFD, 0);
    if (f != -1) fcntl(fd, F_SETFD, f | FD_CLOEXEC);
}

void close_fd(int& fd) {
    if (fd != -1) { ::close(fd); fd = -1; }
}

bool is_executable(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// execvp() semantics, resolved in the parent so a missing program is reported before fork().
std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        return std::nullopt;
    }
    const char* pathEnv = std::getenv("PATH");
    std::string_view dirs = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    size_t pos = 0;
    while (pos <= dirs.size()) {
        size_t next = dirs.find(':', pos);
        if (next == std::string_view::npos) next = dirs.size();
        std::string dir(dirs.substr(pos, next - pos));
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) return candidate;
        pos = next + 1;
    }
    return std::nullopt;
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        std::string key(entry.substr(0, entry.find('=')));
        if (overrides.count(key)) continue;
        env.emplace_back(entry);
    }
    for (const auto& [k, v] : overrides) {
        env.push_back(k + "=" + v);
    }
    return env;
}

std::vector<char*> c_array(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

class PosixHandle final : public ElevationHandle {
public:
    PosixHandle(HandleKind kind, pid_t pid, int outFd, int errFd)
        : ElevationHandle(kind, outFd != -1), pid_(pid), outFd_(outFd), errFd_(errFd) {}

    ~PosixHandle() override {
        if (!reaped_) {
            PSRELAY_DBG("WAIT", "pid=%d still running at release, terminating", (int)pid_);
            terminate_group();
        }
        close_streams();
    }

    pid_t pid() const noexcept { return pid_; }
    int& out_fd() noexcept { return outFd_; }
    int& err_fd() noexcept { return errFd_; }

    void close_streams() {
        close_fd(outFd_);
        close_fd(errFd_);
    }

    // Non-blocking; true once the child is gone.
    bool try_reap() {
        if (reaped_) return true;
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, WNOHANG);
        } while (r == -1 && errno == EINTR);
        if (r == pid_) {
            reaped_ = true;
            status_ = status;
        } else if (r == -1) {
            // ECHILD: reaped elsewhere (SIGCHLD ignored by the host), status lost.
            PSRELAY_DBG("WAIT", "pid=%d reaped elsewhere, exit status lost", (int)pid_);
            reaped_ = true;
            statusLost_ = true;
        }
        return reaped_;
    }

    bool reap_within(Clock::duration limit) {
        const auto until = Clock::now() + limit;
        while (!try_reap()) {
            if (Clock::now() >= until) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    // SIGTERM to the whole group, grace period, then SIGKILL and a bounded reap.
    void terminate_group() {
        if (::kill(-pid_, SIGTERM) == -1) ::kill(pid_, SIGTERM);
        if (reap_within(TERM_GRACE)) return;
        if (::kill(-pid_, SIGKILL) == -1) ::kill(pid_, SIGKILL);
        if (!reap_within(REAP_LIMIT)) {
            PSRELAY_DBG("WAIT", "pid=%d did not exit after SIGKILL", (int)pid_);
        }
    }

    std::optional<int> exit_code() const {
        if (!status_) return std::nullopt;
        if (WIFEXITED(*status_)) return WEXITSTATUS(*status_);
        if (WIFSIGNALED(*status_)) return 128 + WTERMSIG(*status_);
        return std::nullopt;
    }

    bool status_lost() const noexcept { return statusLost_; }

private:
    pid_t pid_;
    int outFd_;
    int errFd_;
    bool reaped_{false};
    bool statusLost_{false};
    std::optional<int> status_{};
};

class SystemElevationBroker final : public ElevationBroker {
public:
    LaunchOutcome launch(const LaunchRequest& req) override {
        auto interpreter = find_executable(req.interpreterPath);
        if (!interpreter) {
            return launch_failure("interpreter not found: " + req.interpreterPath);
        }

        HandleKind kind = HandleKind::ChildProcess;
        std::string program = *interpreter;
        std::vector<std::string> argv;
        if (req.elevate) {
            if (req.elevationLauncher.empty()) {
                return launch_failure("elevation requested but no elevation launcher is configured");
            }
            auto launcher = find_executable(req.elevationLauncher.front());
            if (!launcher) {
                return launch_failure("elevation launcher not found: " + req.elevationLauncher.front());
            }
            program = *launcher;
            argv.assign(req.elevationLauncher.begin(), req.elevationLauncher.end());
            kind = HandleKind::ElevationRequest;
        }
        argv.push_back(*interpreter);
        argv.insert(argv.end(), req.arguments.begin(), req.arguments.end());

        // Everything the child touches is prepared before fork().
        std::vector<std::string> env = merged_environment(req.environment);
        std::vector<char*> argvC = c_array(argv);
        std::vector<char*> envC = c_array(env);
        const char* workDir = req.workingDirectory.empty() ? nullptr : req.workingDirectory.c_str();

        const bool direct = std::holds_alternative<DirectChannels>(req.channels);
        int outPipe[2] = {-1, -1};
        int errPipe[2] = {-1, -1};
        int execPipe[2] = {-1, -1};   // child reports exec() failure here
        auto close_all = [&] {
            for (int* p : {outPipe, errPipe, execPipe}) {
                close_fd(p[0]);
                close_fd(p[1]);
            }
        };

        if (direct && (::pipe(outPipe) == -1 || ::pipe(errPipe) == -1)) {
            int e = errno;
            close_all();
            return launch_failure("pipe: " + system_message(e));
        }
        if (::pipe(execPipe) == -1) {
            int e = errno;
            close_all();
            return launch_failure("pipe: " + system_message(e));
        }
        if (direct) {
            set_cloexec(outPipe[0]);
            set_cloexec(errPipe[0]);
        }
        set_cloexec(execPipe[0]);
        set_cloexec(execPipe[1]);

        PSRELAY_DBG("LAUNCH", "spawn program='%s' elevate=%d direct=%d argc=%zu",
                    program.c_str(), int(req.elevate), int(direct), argv.size());

        pid_t pid = ::fork();
        if (pid == -1) {
            int e = errno;
            close_all();
            return launch_failure("fork: " + system_message(e));
        }

        if (pid == 0) {
            // --- Child process context ---
            ::setpgid(0, 0);
            int devNull = ::open("/dev/null", O_RDWR);
            if (devNull != -1) ::dup2(devNull, STDIN_FILENO);
            if (direct) {
                ::dup2(outPipe[1], STDOUT_FILENO);
                ::dup2(errPipe[1], STDERR_FILENO);
            } else if (devNull != -1) {
                ::dup2(devNull, STDOUT_FILENO);
                ::dup2(devNull, STDERR_FILENO);
            }
            if (devNull > STDERR_FILENO) ::close(devNull);
            for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0]}) {
                if (fd > STDERR_FILENO) ::close(fd);
            }

            int e = 0;
            if (workDir && ::chdir(workDir) != 0) {
                e = errno;
            } else {
                ::execve(program.c_str(), argvC.data(), envC.data());
                e = errno;
            }
            ssize_t ignored = ::write(execPipe[1], &e, sizeof e);
            (void)ignored;
            _exit(127);
        }

        // --- Parent process context ---
        (void)::setpgid(pid, pid);
        close_fd(outPipe[1]);
        close_fd(errPipe[1]);
        close_fd(execPipe[1]);

        // EOF means exec() succeeded and closed the pipe.
        int childErr = 0;
        ssize_t got;
        do {
            got = ::read(execPipe[0], &childErr, sizeof childErr);
        } while (got == -1 && errno == EINTR);
        close_fd(execPipe[0]);

        if (got == static_cast<ssize_t>(sizeof childErr)) {
            int st = 0;
            while (::waitpid(pid, &st, 0) == -1 && errno == EINTR) {}
            close_fd(outPipe[0]);
            close_fd(errPipe[0]);
            if (workDir && childErr == ENOENT) {
                return launch_failure("working directory not found: " + req.workingDirectory);
            }
            return launch_failure("failed to start '" + program + "': " + system_message(childErr));
        }

        PSRELAY_DBG("LAUNCH", "started pid=%d kind=%s", (int)pid,
                    kind == HandleKind::ChildProcess ? "child" : "elevated");
        LaunchOutcome outcome;
        outcome.handle = std::make_unique<PosixHandle>(kind, pid, outPipe[0], errPipe[0]);
        return outcome;
    }

    WaitOutcome wait(ElevationHandle& handle, std::optional<std::chrono::milliseconds> timeout) override {
        WaitOutcome result;
        auto* h = dynamic_cast<PosixHandle*>(&handle);
        if (!h) {
            PSRELAY_DBG("WAIT", "handle was not created by this broker");
            return result;
        }

        std::optional<Clock::time_point> deadline;
        if (timeout) deadline = Clock::now() + *timeout;

        if (h->has_streams()) {
            StreamCollector collector(h->capture());
            auto drain = collector.pump(h->out_fd(), h->err_fd(), deadline,
                                        [h] { return h->try_reap(); });
            PSRELAY_DBG("WAIT", "pid=%d drain=%d out=%zu err=%zu", (int)h->pid(), int(drain),
                        h->capture().out.size(), h->capture().err.size());
        }

        // Poll-based wait with WNOHANG for whatever is left after the pipes closed.
        while (!h->try_reap()) {
            if (deadline && Clock::now() >= *deadline) {
                result.timedOut = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (result.timedOut) {
            PSRELAY_DBG("WAIT", "pid=%d timed out, terminating process group", (int)h->pid());
            h->terminate_group();
            result.terminated = true;
        } else {
            result.exitCode = h->exit_code();
            result.statusLost = h->status_lost();
        }
        h->close_streams();
        return result;
    }
};

} // namespace

#else // _WIN32

namespace {

using psrelay::helpers::quote_windows_arg;
using psrelay::helpers::utf8_to_wstring;

constexpr DWORD TERMINATE_WAIT_MS = 5000;
constexpr auto PIPE_DRAIN_GRACE = std::chrono::milliseconds(2000);

std::string join_arguments(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out.push_back(' ');
        out += quote_windows_arg(a);
    }
    return out;
}

// Parent environment with overrides applied, as a CREATE_UNICODE_ENVIRONMENT block.
std::vector<wchar_t> environment_block(const std::map<std::string, std::string>& overrides) {
    std::vector<std::wstring> entries;
    std::vector<std::wstring> keys;
    for (const auto& [k, v] : overrides) {
        keys.push_back(utf8_to_wstring(k));
        entries.push_back(keys.back() + L"=" + utf8_to_wstring(v));
    }

    if (LPWCH base = ::GetEnvironmentStringsW()) {
        for (LPWCH p = base; *p; p += wcslen(p) + 1) {
            std::wstring entry(p);
            // Skip index 0 so per-drive entries ("=C:=C:\\") keep their name.
            const size_t eq = entry.find(L'=', 1);
            const std::wstring key = entry.substr(0, eq);
            bool overridden = std::any_of(keys.begin(), keys.end(), [&](const std::wstring& k) {
                return _wcsicmp(k.c_str(), key.c_str()) == 0;
            });
            if (!overridden) entries.push_back(std::move(entry));
        }
        ::FreeEnvironmentStringsW(base);
    }

    std::sort(entries.begin(), entries.end(), [](const std::wstring& a, const std::wstring& b) {
        return _wcsicmp(a.c_str(), b.c_str()) < 0;
    });

    std::vector<wchar_t> block;
    for (const auto& e : entries) {
        block.insert(block.end(), e.begin(), e.end());
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

void close_handle(HANDLE& h) {
    if (h) { ::CloseHandle(h); h = nullptr; }
}

class WinHandle final : public ElevationHandle {
public:
    WinHandle(HandleKind kind, HANDLE process, HANDLE outRead, HANDLE errRead)
        : ElevationHandle(kind, outRead != nullptr),
          process_(process), outRead_(outRead), errRead_(errRead), collector_(capture()) {
        if (outRead_) collector_.start(outRead_, errRead_);
    }

    ~WinHandle() override {
        if (!exited_ && process_) {
            PSRELAY_DBG("WAIT", "process still running at release, terminating");
            ::TerminateProcess(process_, 1);
            ::WaitForSingleObject(process_, TERMINATE_WAIT_MS);
        }
        // Reader threads must be joined before their handles are closed.
        collector_.finish(std::chrono::milliseconds(0));
        close_handle(outRead_);
        close_handle(errRead_);
        close_handle(process_);
    }

    HANDLE process() const noexcept { return process_; }
    StreamCollector& collector() noexcept { return collector_; }
    void mark_exited() noexcept { exited_ = true; }

private:
    HANDLE process_;
    HANDLE outRead_;
    HANDLE errRead_;
    bool exited_{false};
    StreamCollector collector_;
};

class SystemElevationBroker final : public ElevationBroker {
public:
    LaunchOutcome launch(const LaunchRequest& req) override {
        return req.elevate ? launch_elevated_(req) : launch_child_(req);
    }

    WaitOutcome wait(ElevationHandle& handle, std::optional<std::chrono::milliseconds> timeout) override {
        WaitOutcome result;
        auto* h = dynamic_cast<WinHandle*>(&handle);
        if (!h) {
            PSRELAY_DBG("WAIT", "handle was not created by this broker");
            return result;
        }

        DWORD waitMs = INFINITE;
        if (timeout) {
            const long long ms = std::max<long long>(0, timeout->count());
            waitMs = static_cast<DWORD>(std::min<long long>(ms, INFINITE - 1));
        }

        const DWORD r = ::WaitForSingleObject(h->process(), waitMs);
        if (r == WAIT_TIMEOUT) {
            PSRELAY_DBG("WAIT", "timed out after %lu ms, terminating", (unsigned long)waitMs);
            result.timedOut = true;
            result.terminated = true;
            ::TerminateProcess(h->process(), 1);
            ::WaitForSingleObject(h->process(), TERMINATE_WAIT_MS);
            h->collector().finish(std::chrono::milliseconds(0));
        } else {
            if (r == WAIT_FAILED) {
                PSRELAY_DBG("WAIT", "WaitForSingleObject failed: %s", system_message((int)::GetLastError()).c_str());
            }
            // A grandchild may still hold a write end; give it a bounded grace.
            h->collector().finish(PIPE_DRAIN_GRACE);
        }
        h->mark_exited();

        if (!result.timedOut) {
            DWORD code = 0;
            if (::GetExitCodeProcess(h->process(), &code) && code != STILL_ACTIVE) {
                result.exitCode = static_cast<int>(code);
            } else {
                PSRELAY_DBG("WAIT", "GetExitCodeProcess failed: %s", system_message((int)::GetLastError()).c_str());
                result.statusLost = true;
            }
        }
        return result;
    }

private:
    LaunchOutcome launch_child_(const LaunchRequest& req) {
        const bool direct = std::holds_alternative<DirectChannels>(req.channels);

        SECURITY_ATTRIBUTES secAttr = {};
        secAttr.nLength = sizeof(SECURITY_ATTRIBUTES);
        secAttr.bInheritHandle = TRUE;
        secAttr.lpSecurityDescriptor = NULL;

        HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
        auto close_pipes = [&] {
            close_handle(outRead); close_handle(outWrite);
            close_handle(errRead); close_handle(errWrite);
        };
        if (direct) {
            if (!::CreatePipe(&outRead, &outWrite, &secAttr, 0) ||
                !::CreatePipe(&errRead, &errWrite, &secAttr, 0)) {
                const DWORD e = ::GetLastError();
                close_pipes();
                return launch_failure("CreatePipe: " + system_message((int)e));
            }
            // Parent read ends must NOT be inheritable.
            ::SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
            ::SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);
        }

        STARTUPINFOW startupInfo = {};
        startupInfo.cb = sizeof(STARTUPINFOW);
        startupInfo.dwFlags = STARTF_USESHOWWINDOW;
        startupInfo.wShowWindow = SW_HIDE;
        if (direct) {
            startupInfo.dwFlags |= STARTF_USESTDHANDLES;
            startupInfo.hStdInput  = NULL;   // no stdin
            startupInfo.hStdOutput = outWrite;
            startupInfo.hStdError  = errWrite;
        }

        std::wstring commandLine = utf8_to_wstring(
            quote_windows_arg(req.interpreterPath) + " " + join_arguments(req.arguments));
        std::wstring workDir = utf8_to_wstring(req.workingDirectory);
        std::vector<wchar_t> env;
        if (!req.environment.empty()) env = environment_block(req.environment);

        PSRELAY_DBG("LAUNCH", "CreateProcessW program='%s' direct=%d", req.interpreterPath.c_str(), int(direct));

        PROCESS_INFORMATION processInfo = {};
        const DWORD flags = CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP | CREATE_UNICODE_ENVIRONMENT;
        BOOL ok = ::CreateProcessW(
            nullptr,
            commandLine.data(),
            nullptr, nullptr,
            direct ? TRUE : FALSE,
            flags,
            env.empty() ? nullptr : env.data(),
            workDir.empty() ? nullptr : workDir.c_str(),
            &startupInfo,
            &processInfo);
        const DWORD e = ::GetLastError();

        // Parent must close its copies of the child's ends to enable EOF signaling.
        close_handle(outWrite);
        close_handle(errWrite);

        if (!ok) {
            close_pipes();
            if (e == ERROR_FILE_NOT_FOUND || e == ERROR_PATH_NOT_FOUND) {
                return launch_failure("interpreter not found: " + req.interpreterPath);
            }
            return launch_failure("CreateProcess failed: " + system_message((int)e));
        }
        ::CloseHandle(processInfo.hThread);

        LaunchOutcome outcome;
        outcome.handle = std::make_unique<WinHandle>(HandleKind::ChildProcess, processInfo.hProcess, outRead, errRead);
        return outcome;
    }

    LaunchOutcome launch_elevated_(const LaunchRequest& req) {
        if (std::holds_alternative<DirectChannels>(req.channels)) {
            return launch_failure("direct capture is not available through the elevation prompt");
        }
        if (!req.environment.empty()) {
            PSRELAY_DBG("LAUNCH", "environment overrides are not passed through the elevation prompt");
        }

        const HRESULT hr = ::CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE);
        const bool comInitialized = SUCCEEDED(hr);

        const std::wstring file = utf8_to_wstring(req.interpreterPath);
        const std::wstring params = utf8_to_wstring(join_arguments(req.arguments));
        const std::wstring workDir = utf8_to_wstring(req.workingDirectory);

        SHELLEXECUTEINFOW shExInfo = {};
        shExInfo.cbSize = sizeof(shExInfo);
        shExInfo.fMask = SEE_MASK_NOCLOSEPROCESS | SEE_MASK_NOASYNC | SEE_MASK_FLAG_NO_UI;
        shExInfo.hwnd = nullptr;
        shExInfo.lpVerb = L"runas";
        shExInfo.lpFile = file.c_str();
        shExInfo.lpParameters = params.c_str();
        shExInfo.lpDirectory = workDir.empty() ? nullptr : workDir.c_str();
        shExInfo.nShow = SW_HIDE;

        PSRELAY_DBG("LAUNCH", "ShellExecuteExW runas program='%s'", req.interpreterPath.c_str());
        const BOOL ok = ::ShellExecuteExW(&shExInfo);
        const DWORD e = ::GetLastError();
        if (comInitialized) ::CoUninitialize();

        if (!ok) {
            if (e == ERROR_CANCELLED) {
                return launch_failure("elevation was declined", FailureHint::UserAborted);
            }
            if (e == ERROR_FILE_NOT_FOUND || e == ERROR_PATH_NOT_FOUND) {
                return launch_failure("interpreter not found: " + req.interpreterPath);
            }
            return launch_failure("ShellExecuteEx failed: " + system_message((int)e));
        }
        if (!shExInfo.hProcess) {
            return launch_failure("elevated process handle is unavailable");
        }

        LaunchOutcome outcome;
        outcome.handle = std::make_unique<WinHandle>(HandleKind::ElevationRequest, shExInfo.hProcess, nullptr, nullptr);
        return outcome;
    }
};

} // namespace

#endif

std::shared_ptr<ElevationBroker> make_system_broker() {
    return std::make_shared<SystemElevationBroker>();
}

} // namespace core
} // namespace psrelay
