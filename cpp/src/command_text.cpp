#include "../include/command_text.hpp"
#include "../include/helpers.hpp"

#include <charconv>

using psrelay::helpers::path_to_utf8;
using psrelay::helpers::ps_array;
using psrelay::helpers::ps_quote;

namespace psrelay {
namespace core {

namespace {

// Run-this-file operator. Dot-sourcing or Import-Module would change scope and
// failure semantics and do not compose with inline redirection.
constexpr auto CALL_OPERATOR = "& ";

constexpr auto UTF8_OUTPUT_PREAMBLE =
    "try { [Console]::OutputEncoding = New-Object System.Text.UTF8Encoding $false } catch {}\n";

constexpr auto STOP_PREAMBLE =
    "$ErrorActionPreference = 'Stop'\n"
    "try { $PSDefaultParameterValues['*:ErrorAction'] = 'Stop' } catch {}\n";

constexpr auto BYPASS_PREAMBLE =
    "try { Set-ExecutionPolicy -Scope Process -ExecutionPolicy Bypass -Force } catch {}\n";

std::string marker_literal_with(std::string_view codeExpr) {
    std::string s;
    s += ps_quote(kExitMarkerBegin);
    s += " + ";
    s += codeExpr;
    s += " + ";
    s += ps_quote(kExitMarkerEnd);
    return s;
}

// "& 'path' @__args" (with the argument array stashed first when present).
std::string call_script(std::string_view pathUtf8, const std::vector<std::string>& args) {
    std::string s;
    if (!args.empty()) {
        s += "$__psrelay_args = " + ps_array(args) + "\n";
    }
    s += CALL_OPERATOR;
    s += ps_quote(pathUtf8);
    if (!args.empty()) s += " @__psrelay_args";
    return s;
}

std::string stream_merges(const InterpreterCapabilities& caps) {
    std::string s;
    for (int n = 6; n >= 3; --n) {
        if (n <= caps.redirectableStreams) {
            s += std::to_string(n) + ">&1 ";
        }
    }
    return s;
}

} // namespace

std::string build_direct_command(const CommandSpec& spec) {
    std::string body = spec.is_script_file()
        ? call_script(spec.body(), spec.arguments())
        : spec.body();

    std::string text;
    text.reserve(body.size() + 512);
    text += UTF8_OUTPUT_PREAMBLE;
    if (spec.error_mode() == ErrorMode::Stop) text += STOP_PREAMBLE;

    text += "try {\n";
    text += body;
    if (text.back() != '\n') text.push_back('\n');
    text += "} catch {\n";
    text += "[Console]::Error.WriteLine(($_ | Out-String).TrimEnd())\n";
    text += "[Console]::Out.Write(" + marker_literal_with("''") + ")\n";
    text += "exit 1\n";
    text += "}\n";
    text += "[Console]::Out.Write(" + marker_literal_with("[string]$LASTEXITCODE") + ")\n";
    return text;
}

std::string build_relay_command(const CommandSpec& spec,
                                const RelayChannels& channels,
                                const InterpreterCapabilities& caps) {
    std::string invocation;
    if (spec.is_script_file()) {
        invocation = call_script(spec.body(), spec.arguments());
    } else if (channels.scriptPath) {
        invocation = call_script(path_to_utf8(*channels.scriptPath), {});
    } else {
        // Callers spill inline bodies first; an empty block keeps the text well-formed.
        invocation = "& {}";
    }

    const std::string out    = ps_quote(path_to_utf8(channels.stdoutPath));
    const std::string err    = ps_quote(path_to_utf8(channels.stderrPath));
    const std::string status = ps_quote(path_to_utf8(channels.statusPath));

    std::string text;
    text.reserve(invocation.size() + 768);
    text += BYPASS_PREAMBLE;
    if (spec.error_mode() == ErrorMode::Stop) text += STOP_PREAMBLE;

    text += "$__psrelay_rc = ''\n";
    text += "try {\n";
    text += invocation;
    text += " " + stream_merges(caps) + "> " + out + " 2> " + err + "\n";
    text += "$__psrelay_rc = [string]$LASTEXITCODE\n";
    text += "} catch {\n";
    text += "($_ | Out-String) | Out-File -LiteralPath " + err + " -Append\n";
    text += "}\n";
    text += "[IO.File]::WriteAllText(" + status + ", " + marker_literal_with("$__psrelay_rc") + ")\n";
    text += "if ($__psrelay_rc) { exit [int]$__psrelay_rc }\n";
    return text;
}

std::vector<std::string> interpreter_arguments(std::string commandText) {
    return {"-NoProfile", "-Command", std::move(commandText)};
}

ExitMarker extract_exit_marker(std::string& text) {
    ExitMarker marker;
    const size_t begin = text.rfind(kExitMarkerBegin);
    if (begin == std::string::npos) return marker;

    const size_t codeStart = begin + kExitMarkerBegin.size();
    const size_t end = text.find(kExitMarkerEnd, codeStart);
    if (end == std::string::npos) return marker;

    std::string_view code(text.data() + codeStart, end - codeStart);
    if (!code.empty()) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), value);
        if (ec != std::errc{} || ptr != code.data() + code.size()) {
            return marker;
        }
        marker.exitCode = value;
    }
    marker.found = true;
    text.erase(begin, end + kExitMarkerEnd.size() - begin);
    return marker;
}

} // namespace core
} // namespace psrelay
