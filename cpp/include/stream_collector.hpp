#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace psrelay {
namespace core {

/// Raw bytes as the child wrote them, before any decoding.
struct RawCapture {
    std::string out{};
    std::string err{};
};

/**
 * @brief Drains a child's stdout/stderr pipes into a RawCapture.
 *
 * POSIX: a single-threaded poll() loop run by the waiting thread.
 * Windows: one blocking reader thread per pipe (anonymous pipes cannot be
 * polled); both threads are joined before finish() returns.
 */
class StreamCollector {
public:
    using Clock = std::chrono::steady_clock;

    explicit StreamCollector(RawCapture& sink) : sink_(sink) {}
    ~StreamCollector();

    StreamCollector(const StreamCollector&) = delete;
    StreamCollector& operator=(const StreamCollector&) = delete;

#ifdef _WIN32
    void start(HANDLE outRead, HANDLE errRead);

    /// Wait up to grace for both pipes to reach EOF, then cancel pending reads and join.
    void finish(std::chrono::milliseconds grace);
#else
    enum class Drain {
        Closed,       ///< Both pipes reached EOF
        ChildExited,  ///< Child reaped while a pipe was still open (inherited by a grandchild)
        Deadline      ///< Deadline passed first
    };

    /**
     * Read until both fds hit EOF, the child has exited, or the deadline passes.
     * Closed fds are set to -1. childExited is polled between reads and must not block.
     */
    Drain pump(int& outFd, int& errFd,
               std::optional<Clock::time_point> deadline,
               const std::function<bool()>& childExited);
#endif

private:
#ifdef _WIN32
    void reader_loop_(HANDLE h, std::string& dst, std::atomic<bool>& done);

    HANDLE outRead_{nullptr};
    HANDLE errRead_{nullptr};
    std::thread outTh_;
    std::thread errTh_;
    std::atomic<bool> outDone_{false};
    std::atomic<bool> errDone_{false};
#endif

    RawCapture& sink_;
};

} // namespace core
} // namespace psrelay
