#pragma once

#include <optional>
#include <string>

#include "encoding_normalizer.hpp"
#include "error_classifier.hpp"
#include "stream_plan.hpp"

namespace psrelay {
namespace core {

/// Unified outcome of one invocation.
enum class CommandStatus {
    Success,
    NonZeroExit,
    TerminatingError,
    LaunchFailure,
    Timeout
};

const char* to_string(CommandStatus status) noexcept;

/**
 * @brief Result of one command invocation.
 *
 * Produced exactly once per CommandInvoker::run and owned by the caller.
 */
struct CommandResult {
    std::optional<int> exitCode{};                         ///< Absent when the body set no exit code
    std::string        out{};                              ///< Stdout, UTF-8 without BOM
    std::string        err{};                              ///< Stderr, UTF-8 without BOM
    CommandStatus      status{CommandStatus::LaunchFailure};
    FailureHint        hint{FailureHint::None};            ///< Recognised failure cause, if any
    EncodingWarning    encodingWarning{EncodingWarning::None};
    CaptureStrategy    strategy{CaptureStrategy::DirectPipe};
    bool               terminated{false};                  ///< Child was forcibly terminated
    double             executionTime{};                    ///< Wall time in seconds

    bool success() const noexcept { return status == CommandStatus::Success; }
};

} // namespace core
} // namespace psrelay
