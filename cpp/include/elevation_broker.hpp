#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "error_classifier.hpp"
#include "stream_collector.hpp"
#include "stream_plan.hpp"

namespace psrelay {
namespace core {

enum class HandleKind {
    ChildProcess,     ///< Plain child of this process
    ElevationRequest  ///< Started through the OS elevation facility
};

/**
 * @brief A launched interpreter, owned by the caller for one invocation.
 *
 * Concrete handles belong to the broker that created them and are only
 * valid as arguments to that broker's wait(). Destroying a handle whose
 * child is still running terminates it.
 */
class ElevationHandle {
public:
    virtual ~ElevationHandle() = default;

    ElevationHandle(const ElevationHandle&) = delete;
    ElevationHandle& operator=(const ElevationHandle&) = delete;

    HandleKind kind() const noexcept { return kind_; }

    /// True when stdout/stderr are wired to pipes read by wait().
    bool has_streams() const noexcept { return hasStreams_; }

    /// Bytes drained from the pipes so far (complete once wait() returned).
    RawCapture& capture() noexcept { return capture_; }

protected:
    ElevationHandle(HandleKind kind, bool hasStreams) : kind_(kind), hasStreams_(hasStreams) {}

private:
    HandleKind kind_;
    bool hasStreams_;
    RawCapture capture_{};
};

struct LaunchRequest {
    std::string interpreterPath;                       ///< Name on PATH or full path
    std::vector<std::string> arguments;                ///< Passed verbatim after the program
    bool elevate{false};
    StreamChannels channels{DirectChannels{}};
    std::string workingDirectory{};                    ///< Empty = inherit
    std::map<std::string, std::string> environment{};  ///< Overrides on top of the parent environment
    std::vector<std::string> elevationLauncher{};      ///< POSIX only: program (+ args) that elevates
};

struct LaunchOutcome {
    std::unique_ptr<ElevationHandle> handle{};
    std::string error{};                  ///< Set when handle is empty
    FailureHint hint{FailureHint::None};

    explicit operator bool() const noexcept { return handle != nullptr; }
};

struct WaitOutcome {
    std::optional<int> exitCode{};  ///< Absent after a timeout or when unobtainable
    bool timedOut{false};
    bool terminated{false};         ///< Termination was attempted
    bool statusLost{false};         ///< The child exited but its status could not be collected
};

/**
 * @brief Starts the interpreter, elevated or not, and waits for it.
 *
 * Implementations hold no per-invocation state and may be shared between
 * threads.
 */
class ElevationBroker {
public:
    virtual ~ElevationBroker() = default;

    virtual LaunchOutcome launch(const LaunchRequest& request) = 0;

    /**
     * Block until the child exits or the timeout elapses. Pipes are drained
     * into handle.capture() while waiting. On timeout the child is
     * terminated best-effort before returning.
     */
    virtual WaitOutcome wait(ElevationHandle& handle,
                             std::optional<std::chrono::milliseconds> timeout) = 0;
};

/// Broker backed by the operating system (fork/exec + launcher on POSIX; CreateProcess/ShellExecuteEx on Windows).
std::shared_ptr<ElevationBroker> make_system_broker();

} // namespace core
} // namespace psrelay
