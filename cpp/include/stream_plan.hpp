#pragma once

#include <filesystem>
#include <optional>
#include <variant>

#include "interpreter_capabilities.hpp"

namespace psrelay {
namespace core {

enum class CaptureStrategy {
    DirectPipe,  ///< Child streams wired to pipes we read
    FileRelay    ///< Child redirects its own streams to files we read back afterwards
};

const char* to_string(CaptureStrategy strategy) noexcept;

/// Pipes are opened by the broker at spawn time, so nothing is carried here.
struct DirectChannels {};

/// Backing files owned by the invocation's TempChannelAllocator.
struct RelayChannels {
    std::filesystem::path stdoutPath;
    std::filesystem::path stderrPath;
    std::filesystem::path statusPath;
    std::optional<std::filesystem::path> scriptPath;  ///< Set when an inline body was spilled to a script
};

/// Exactly one shape per invocation, fixed before launch.
using StreamChannels = std::variant<DirectChannels, RelayChannels>;

/**
 * @brief Capture wiring for one invocation.
 *
 * | elevate | direct redirect with elevation | strategy                  |
 * |---------|--------------------------------|---------------------------|
 * | false   | -                              | DirectPipe                |
 * | true    | true                           | DirectPipe via elevation  |
 * | true    | false                          | FileRelay                 |
 */
struct StreamPlan {
    CaptureStrategy strategy{CaptureStrategy::DirectPipe};
    bool            elevated{false};

    static StreamPlan decide(bool elevate, const InterpreterCapabilities& caps) noexcept;

    bool relay() const noexcept { return strategy == CaptureStrategy::FileRelay; }
};

} // namespace core
} // namespace psrelay
