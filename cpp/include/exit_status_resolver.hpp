#pragma once

#include <optional>
#include <string_view>

#include "command_result.hpp"

namespace psrelay {
namespace core {

/// Everything the resolver looks at, gathered after wait().
struct StatusInputs {
    bool               launchFailed{false};
    bool               timedOut{false};
    std::optional<int> exitCode{};
    bool               statusLost{false};   ///< The process exited but its status was not collected
    std::string_view   stderrText{};
};

/**
 * Resolve one status, first matching rule wins:
 *  1. launch failed                      -> LaunchFailure
 *  2. wait timed out                     -> Timeout
 *  3. exit code present and nonzero      -> NonZeroExit
 *  4. exit code present and zero         -> Success
 *  5. no exit code, status was lost     -> NonZeroExit
 *  6. no exit code: stderr non-empty     -> TerminatingError, else Success
 *
 * Rule 6 is a heuristic: the interpreter's exit code is not reliable for pure
 * script failures, and stderr content is the only remaining signal.
 */
CommandStatus resolve_status(const StatusInputs& in) noexcept;

} // namespace core
} // namespace psrelay
