#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "command_spec.hpp"
#include "interpreter_capabilities.hpp"
#include "stream_plan.hpp"

namespace psrelay {
namespace core {

// Written by the command text after the body completes. The code part is empty
// when the body never set a native exit code.
inline constexpr std::string_view kExitMarkerBegin = "<<<PSRELAY_RC:";
inline constexpr std::string_view kExitMarkerEnd   = ">>>";

struct ExitMarker {
    bool               found{false};
    std::optional<int> exitCode{};
};

/**
 * @brief Command text for direct pipe capture.
 *
 * Forces UTF-8 console output, applies the error mode, runs the body inside
 * try/catch and finishes by writing the exit marker to stdout.
 */
std::string build_direct_command(const CommandSpec& spec);

/**
 * @brief Command text for indirect file-relay capture.
 *
 * One instruction for the elevated interpreter: run the body with "&",
 * merge streams 3..6 into the success stream, redirect success to the stdout
 * channel and errors to the stderr channel, then write the exit marker to
 * the status channel. Inline bodies must already be spilled to
 * channels.scriptPath.
 */
std::string build_relay_command(const CommandSpec& spec,
                                const RelayChannels& channels,
                                const InterpreterCapabilities& caps);

/// The full interpreter argument list: -NoProfile -Command <text>.
std::vector<std::string> interpreter_arguments(std::string commandText);

/// Find and remove the last exit marker in text.
ExitMarker extract_exit_marker(std::string& text);

} // namespace core
} // namespace psrelay
