#include "../include/command_invoker.hpp"
#include "../include/command_text.hpp"
#include "../include/dev_debug.hpp"
#include "../include/encoding_normalizer.hpp"
#include "../include/error_classifier.hpp"
#include "../include/exit_status_resolver.hpp"
#include "../include/helpers.hpp"
#include "../include/stream_plan.hpp"
#include "../include/temp_channel_allocator.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

using psrelay::helpers::path_to_utf8;
using psrelay::helpers::trim_inplace;
using psrelay::helpers::utf8_to_path;

namespace psrelay {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto VERSION_PROBE = "$PSVersionTable.PSVersion.ToString()";
constexpr auto AVAILABILITY_PROBE = "echo hello";

CommandResult launch_failure(CaptureStrategy strategy, std::string message, FailureHint hint) {
    StatusInputs inputs;
    inputs.launchFailed = true;
    CommandResult r;
    r.status = resolve_status(inputs);
    r.strategy = strategy;
    r.err = std::move(message);
    r.hint = hint != FailureHint::None ? hint : classify_failure(r.err);
    PSRELAY_DBG("INVOKE", "launch failure: %s", r.err.c_str());
    return r;
}

// Same spec, pointing at an absolute script path.
CommandSpec with_script_path(const CommandSpec& spec, const fs::path& script) {
    return CommandSpec::script_file(path_to_utf8(script), spec.arguments())
        .with_elevation(spec.elevate())
        .with_timeout(spec.timeout())
        .with_error_mode(spec.error_mode());
}

std::string read_channel(const fs::path& path) {
    auto data = TempChannelAllocator::read_back(path);
    if (!data) {
        PSRELAY_DBG("CHANNEL", "could not read back '%s'", path_to_utf8(path).c_str());
        return {};
    }
    return std::move(*data);
}

} // namespace

CommandInvoker::CommandInvoker(Config config)
    : CommandInvoker(std::move(config), make_system_broker()) {}

CommandInvoker::CommandInvoker(Config config, std::shared_ptr<ElevationBroker> broker)
    : config_(std::move(config)), broker_(std::move(broker)) {}

CommandResult CommandInvoker::run(const CommandSpec& spec) {
    const auto t0 = Clock::now();
    CommandResult result;
    try {
        result = execute_(spec, capabilities());
    } catch (const std::exception& e) {
        result = launch_failure(CaptureStrategy::DirectPipe, std::string("internal error: ") + e.what(), FailureHint::None);
    }
    result.executionTime = std::chrono::duration<double>(Clock::now() - t0).count();
    PSRELAY_DBG("INVOKE", "done status=%s exit=%s strategy=%s out=%zu err=%zu t=%.3fs",
                to_string(result.status),
                result.exitCode ? std::to_string(*result.exitCode).c_str() : "none",
                to_string(result.strategy), result.out.size(), result.err.size(), result.executionTime);
    return result;
}

const InterpreterCapabilities& CommandInvoker::capabilities() {
    std::call_once(capsOnce_, [this] {
        caps_ = config_.capabilities ? *config_.capabilities : probe_();
    });
    return caps_;
}

InterpreterCapabilities CommandInvoker::probe_() {
    auto spec = CommandSpec::inline_command(VERSION_PROBE);
    if (config_.probeTimeoutSeconds > 0) {
        spec = spec.with_timeout(std::chrono::seconds(config_.probeTimeoutSeconds));
    }

    CommandResult r = execute_(spec, InterpreterCapabilities::fallback());
    if (r.success()) {
        std::string text = r.out;
        trim_inplace(text);
        if (auto version = InterpreterVersion::parse(text)) {
            auto caps = InterpreterCapabilities::for_version(*version);
            PSRELAY_DBG("PROBE", "version=%s encoding=%s directElevated=%d streams=%d",
                        version->to_string().c_str(), to_string(caps.defaultEncoding),
                        int(caps.supportsDirectRedirectWithElevation), caps.redirectableStreams);
            return caps;
        }
    }
    PSRELAY_DBG("PROBE", "no usable version (status=%s), using fallback capabilities", to_string(r.status));
    return InterpreterCapabilities::fallback();
}

bool CommandInvoker::interpreter_available() {
    auto spec = CommandSpec::inline_command(AVAILABILITY_PROBE);
    if (config_.probeTimeoutSeconds > 0) {
        spec = spec.with_timeout(std::chrono::seconds(config_.probeTimeoutSeconds));
    }
    try {
        CommandResult r = execute_(spec, InterpreterCapabilities::fallback());
        return r.status != CommandStatus::LaunchFailure && r.hint != FailureHint::InterpreterDisabled;
    } catch (const std::exception& e) {
        PSRELAY_DBG("PROBE", "availability check failed: %s", e.what());
        return false;
    }
}

CommandResult CommandInvoker::execute_(const CommandSpec& spec, const InterpreterCapabilities& caps) {
    const StreamPlan plan = StreamPlan::decide(spec.elevate(), caps);
    PSRELAY_DBG("PLAN", "elevate=%d strategy=%s script=%d", int(spec.elevate()),
                to_string(plan.strategy), int(spec.is_script_file()));

    CommandSpec effective = spec;
    if (spec.is_script_file()) {
        fs::path script = utf8_to_path(spec.body());
        if (script.is_relative() && !config_.workingDirectory.empty()) {
            script = utf8_to_path(config_.workingDirectory) / script;
        }
        std::error_code ec;
        if (!fs::is_regular_file(script, ec)) {
            return launch_failure(plan.strategy, "Could not open script file: " + spec.body(), FailureHint::None);
        }
        fs::path absolute = fs::absolute(script, ec);
        effective = with_script_path(spec, ec ? script : absolute);
    }

    // Owns every channel file of this invocation; removes them on all paths.
    TempChannelAllocator channels(utf8_to_path(config_.tempDirectory));

    StreamChannels streamChannels = DirectChannels{};
    std::string commandText;
    if (plan.relay()) {
        auto out = channels.allocate(ChannelKind::Stdout);
        auto err = channels.allocate(ChannelKind::Stderr);
        auto status = channels.allocate(ChannelKind::ExitStatus);
        if (!out || !err || !status) {
            return launch_failure(plan.strategy, "could not create temporary channel files", FailureHint::None);
        }
        RelayChannels relay{*out, *err, *status, std::nullopt};
        if (!effective.is_script_file()) {
            auto script = channels.allocate_script(effective.body(), caps.defaultEncoding);
            if (!script) {
                return launch_failure(plan.strategy, "could not create temporary script file", FailureHint::None);
            }
            relay.scriptPath = *script;
        }
        commandText = build_relay_command(effective, relay, caps);
        streamChannels = std::move(relay);
    } else {
        commandText = build_direct_command(effective);
    }

    LaunchRequest request;
    request.interpreterPath = config_.powershellPath;
    request.arguments = interpreter_arguments(std::move(commandText));
    request.elevate = spec.elevate();
    request.channels = streamChannels;
    request.workingDirectory = config_.workingDirectory;
    request.environment = config_.environment;
    request.elevationLauncher = config_.elevationLauncher;

    LaunchOutcome launched = broker_->launch(request);
    if (!launched) {
        return launch_failure(plan.strategy, launched.error, launched.hint);
    }

    CommandSpec::Timeout timeout = spec.timeout();
    if (!timeout && config_.timeoutSeconds > 0) {
        timeout = std::chrono::seconds(config_.timeoutSeconds);
    }
    const WaitOutcome waited = broker_->wait(*launched.handle, timeout);

    CommandResult result;
    result.strategy = plan.strategy;
    result.terminated = waited.terminated;

    std::string rawOut, rawErr;
    TextEncoding hint = TextEncoding::Utf8NoBom;   // direct pipes: the preamble forces UTF-8
    std::optional<ExitMarker> marker;
    if (const auto* relay = std::get_if<RelayChannels>(&streamChannels)) {
        rawOut = read_channel(relay->stdoutPath);
        rawErr = read_channel(relay->stderrPath);
        hint = caps.defaultEncoding;
        // WriteAllText always writes UTF-8 without a BOM.
        std::string statusText = to_canonical(read_channel(relay->statusPath), TextEncoding::Utf8NoBom).text;
        marker = extract_exit_marker(statusText);
    } else {
        rawOut = std::move(launched.handle->capture().out);
        rawErr = std::move(launched.handle->capture().err);
    }
    launched.handle.reset();

    DecodedText out = to_canonical(rawOut, hint);
    DecodedText err = to_canonical(rawErr, hint);
    result.encodingWarning = worst_of(out.warning, err.warning);
    if (result.encodingWarning != EncodingWarning::None) {
        PSRELAY_DBG("ENCODING", "warning=%s hint=%s", to_string(result.encodingWarning), to_string(hint));
    }
    result.out = std::move(out.text);
    result.err = std::move(err.text);

    if (!marker) marker = extract_exit_marker(result.out);
    std::optional<int> exitCode = marker->found ? marker->exitCode : waited.exitCode;
    if (waited.timedOut) exitCode.reset();

    StatusInputs inputs;
    inputs.timedOut = waited.timedOut;
    inputs.exitCode = exitCode;
    // A marker, even an empty one, is the interpreter's own report.
    inputs.statusLost = waited.statusLost && !marker->found;
    inputs.stderrText = result.err;
    result.status = resolve_status(inputs);
    result.exitCode = exitCode;
    PSRELAY_DBG("RESOLVE", "marker=%d exit=%s status=%s", int(marker->found),
                exitCode ? std::to_string(*exitCode).c_str() : "none", to_string(result.status));

    if (result.status != CommandStatus::Success) {
        result.hint = classify_failure(result.err + "\n" + result.out);
    }

    if (!channels.release_all()) {
        PSRELAY_DBG("CHANNEL", "%zu channel file(s) could not be removed yet", channels.live().size());
    }
    return result;
}

} // namespace core
} // namespace psrelay
