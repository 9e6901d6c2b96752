#include "../include/exit_status_resolver.hpp"

namespace psrelay {
namespace core {

const char* to_string(CommandStatus status) noexcept {
    switch (status) {
        case CommandStatus::Success:          return "success";
        case CommandStatus::NonZeroExit:      return "non-zero-exit";
        case CommandStatus::TerminatingError: return "terminating-error";
        case CommandStatus::LaunchFailure:    return "launch-failure";
        case CommandStatus::Timeout:          return "timeout";
    }
    return "?";
}

CommandStatus resolve_status(const StatusInputs& in) noexcept {
    if (in.launchFailed) return CommandStatus::LaunchFailure;
    if (in.timedOut)     return CommandStatus::Timeout;
    if (in.exitCode) {
        return *in.exitCode != 0 ? CommandStatus::NonZeroExit : CommandStatus::Success;
    }
    if (in.statusLost)   return CommandStatus::NonZeroExit;
    return in.stderrText.empty() ? CommandStatus::Success : CommandStatus::TerminatingError;
}

} // namespace core
} // namespace psrelay
