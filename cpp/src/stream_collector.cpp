#include "../include/stream_collector.hpp"
#include "../include/dev_debug.hpp"

#include <array>

#ifndef _WIN32
#include <cerrno>
#include <poll.h>
#include <unistd.h>
#endif

namespace psrelay {
namespace core {

namespace {
constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
}

#ifdef _WIN32

namespace {
BOOL cancel_io_ex_optional(HANDLE h) {
    if (!h || h == INVALID_HANDLE_VALUE) {
        return FALSE;
    }
    using Fn = BOOL (WINAPI *)(HANDLE, LPOVERLAPPED);
    static Fn fn = reinterpret_cast<Fn>(
        ::GetProcAddress(::GetModuleHandleW(L"kernel32.dll"), "CancelIoEx"));
    if (!fn) {
        return FALSE;
    }
    return fn(h, nullptr);
}

void cancel_thread_io_optional(std::thread& th) {
    if (!th.joinable()) return;
    using Fn = BOOL (WINAPI *)(HANDLE);
    static Fn fn = reinterpret_cast<Fn>(
        ::GetProcAddress(::GetModuleHandleW(L"kernel32.dll"), "CancelSynchronousIo"));
    if (!fn) return;
    fn(th.native_handle());
}
} // namespace

StreamCollector::~StreamCollector() {
    finish(std::chrono::milliseconds(0));
}

void StreamCollector::start(HANDLE outRead, HANDLE errRead) {
    outRead_ = outRead;
    errRead_ = errRead;
    outDone_ = (outRead_ == nullptr);
    errDone_ = (errRead_ == nullptr);
    if (outRead_) outTh_ = std::thread(&StreamCollector::reader_loop_, this, outRead_, std::ref(sink_.out), std::ref(outDone_));
    if (errRead_) errTh_ = std::thread(&StreamCollector::reader_loop_, this, errRead_, std::ref(sink_.err), std::ref(errDone_));
}

void StreamCollector::reader_loop_(HANDLE h, std::string& dst, std::atomic<bool>& done) {
    // dst is only touched by this thread until join().
    std::array<char, READ_BUFFER_SIZE> buf{};
    for (;;) {
        DWORD got = 0;
        BOOL ok = ::ReadFile(h, buf.data(), (DWORD)buf.size(), &got, NULL);
        if (!ok) {
            // ERROR_BROKEN_PIPE: all writers closed. ERROR_OPERATION_ABORTED: cancelled by finish().
            break;
        }
        if (got == 0) break;
        dst.append(buf.data(), got);
    }
    done.store(true, std::memory_order_release);
}

void StreamCollector::finish(std::chrono::milliseconds grace) {
    if (!outTh_.joinable() && !errTh_.joinable()) return;
    const auto until = Clock::now() + grace;
    while (!(outDone_.load(std::memory_order_acquire) && errDone_.load(std::memory_order_acquire))
           && Clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!outDone_.load() || !errDone_.load()) {
        // A grandchild still holds a write end; stop waiting for its EOF.
        PSRELAY_DBG("WAIT", "cancelling pending pipe reads");
        cancel_io_ex_optional(outRead_);
        cancel_io_ex_optional(errRead_);
        cancel_thread_io_optional(outTh_);
        cancel_thread_io_optional(errTh_);
    }
    if (outTh_.joinable()) outTh_.join();
    if (errTh_.joinable()) errTh_.join();
}

#else

StreamCollector::~StreamCollector() = default;

StreamCollector::Drain StreamCollector::pump(int& outFd, int& errFd,
                                             std::optional<Clock::time_point> deadline,
                                             const std::function<bool()>& childExited) {
    std::array<char, READ_BUFFER_SIZE> buf{};

    auto read_once = [&buf](int& fd, std::string& dst) {
        for (;;) {
            ssize_t got = ::read(fd, buf.data(), buf.size());
            if (got > 0) {
                dst.append(buf.data(), static_cast<size_t>(got));
                return true;
            }
            if (got == -1 && errno == EINTR) continue;
            if (got == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;
            // EOF or fatal read error.
            ::close(fd);
            fd = -1;
            return false;
        }
    };

    bool exited = false;
    for (;;) {
        struct pollfd pfds[2];
        nfds_t n = 0;
        std::string* sinks[2] = {nullptr, nullptr};
        int* fds[2] = {nullptr, nullptr};
        if (outFd != -1) { pfds[n] = {outFd, POLLIN, 0}; sinks[n] = &sink_.out; fds[n] = &outFd; ++n; }
        if (errFd != -1) { pfds[n] = {errFd, POLLIN, 0}; sinks[n] = &sink_.err; fds[n] = &errFd; ++n; }
        if (n == 0) return Drain::Closed;

        // Short slices so the exit check and the deadline are both observed.
        int waitMs = exited ? 0 : 50;
        if (deadline) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
            if (left <= 0) return Drain::Deadline;
            if (left < waitMs) waitMs = static_cast<int>(left);
        }

        int rc = ::poll(pfds, n, waitMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            PSRELAY_DBG("WAIT", "poll failed errno=%d", errno);
            return exited ? Drain::ChildExited : Drain::Closed;
        }

        bool progressed = false;
        for (nfds_t i = 0; i < n; ++i) {
            if (pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (read_once(*fds[i], *sinks[i])) progressed = true;
            }
        }

        if (exited && !progressed) {
            // Child is gone and nothing more is buffered; a grandchild may keep the pipe open.
            return Drain::ChildExited;
        }
        if (!exited && childExited()) {
            exited = true;
        }
    }
}

#endif

} // namespace core
} // namespace psrelay
