#pragma once

#include <memory>
#include <mutex>

#include "command_result.hpp"
#include "command_spec.hpp"
#include "config.hpp"
#include "elevation_broker.hpp"
#include "interpreter_capabilities.hpp"

namespace psrelay {
namespace core {

/**
 * @brief Runs one CommandSpec to completion and returns a CommandResult.
 *
 * Each run() chooses a capture strategy, allocates its own temporary
 * channels, launches through the ElevationBroker, waits, decodes and
 * resolves the status. All channel files are gone when run() returns.
 *
 * Concurrent run() calls are safe: they share only the immutable Config,
 * the broker and the capability cache.
 */
class CommandInvoker {
public:
    explicit CommandInvoker(Config config = {});
    CommandInvoker(Config config, std::shared_ptr<ElevationBroker> broker);

    CommandInvoker(const CommandInvoker&) = delete;
    CommandInvoker& operator=(const CommandInvoker&) = delete;

    /// Never throws; failures are reported through CommandResult::status.
    CommandResult run(const CommandSpec& spec);

    /**
     * Capabilities of the configured interpreter. Probed once on first use
     * (unless Config::capabilities is set); a failed probe yields
     * InterpreterCapabilities::fallback().
     */
    const InterpreterCapabilities& capabilities();

    /// True when the interpreter starts and is not blocked by policy.
    bool interpreter_available();

    const Config& config() const noexcept { return config_; }

private:
    CommandResult execute_(const CommandSpec& spec, const InterpreterCapabilities& caps);
    InterpreterCapabilities probe_();

    const Config config_;
    std::shared_ptr<ElevationBroker> broker_;

    std::once_flag capsOnce_;
    InterpreterCapabilities caps_{};
};

} // namespace core
} // namespace psrelay
