#pragma once

#include <string_view>

namespace psrelay {
namespace core {

/**
 * @brief Known failure causes recognised in interpreter output.
 *
 * There is no single reliable failure signal: some failures exit 0, some write
 * to stdout instead of stderr. These hints are advisory; the caller decides
 * what to do (for example ask for elevation and run again).
 */
enum class FailureHint {
    None,
    AccessDenied,        ///< Not enough permissions
    UserAborted,         ///< Operation (usually the elevation prompt) cancelled by the user
    CommandNotFound,     ///< "The term 'x' is not recognized ..."
    InterpreterDisabled  ///< Blocked by group policy / administrators
};

const char* to_string(FailureHint hint) noexcept;

/// First matching hint for the given output text, or FailureHint::None.
FailureHint classify_failure(std::string_view output);

} // namespace core
} // namespace psrelay
