#include "../include/command_invoker.hpp"
#include "../include/command_result.hpp"
#include "../include/command_spec.hpp"
#include "../include/config.hpp"
#include "../include/dev_debug.hpp"
#include "../include/interpreter_capabilities.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>

namespace py = pybind11;

using namespace psrelay::core;

namespace {

std::string repr(const CommandResult& r) {
    std::string s = "CommandResult(status=";
    s += to_string(r.status);
    s += ", exit_code=";
    s += r.exitCode ? std::to_string(*r.exitCode) : "None";
    s += ", strategy=";
    s += to_string(r.strategy);
    s += ")";
    return s;
}

} // namespace

PYBIND11_MODULE(_psrelay, m) {
    m.doc() = "Run PowerShell commands, optionally elevated, and capture their output";

    py::enum_<TextEncoding>(m, "TextEncoding")
        .value("Utf16LeBom", TextEncoding::Utf16LeBom)
        .value("Utf8NoBom", TextEncoding::Utf8NoBom);

    py::enum_<ErrorMode>(m, "ErrorMode")
        .value("Continue", ErrorMode::Continue)
        .value("Stop", ErrorMode::Stop);

    py::enum_<CaptureStrategy>(m, "CaptureStrategy")
        .value("DirectPipe", CaptureStrategy::DirectPipe)
        .value("FileRelay", CaptureStrategy::FileRelay);

    py::enum_<CommandStatus>(m, "CommandStatus")
        .value("Success", CommandStatus::Success)
        .value("NonZeroExit", CommandStatus::NonZeroExit)
        .value("TerminatingError", CommandStatus::TerminatingError)
        .value("LaunchFailure", CommandStatus::LaunchFailure)
        .value("Timeout", CommandStatus::Timeout);

    py::enum_<FailureHint>(m, "FailureHint")
        .value("None_", FailureHint::None)
        .value("AccessDenied", FailureHint::AccessDenied)
        .value("UserAborted", FailureHint::UserAborted)
        .value("CommandNotFound", FailureHint::CommandNotFound)
        .value("InterpreterDisabled", FailureHint::InterpreterDisabled);

    py::enum_<EncodingWarning>(m, "EncodingWarning")
        .value("None_", EncodingWarning::None)
        .value("InvalidSequence", EncodingWarning::InvalidSequence)
        .value("MissingByteOrderMark", EncodingWarning::MissingByteOrderMark);

    py::class_<InterpreterVersion>(m, "InterpreterVersion")
        .def(py::init<>())
        .def_readwrite("major", &InterpreterVersion::major)
        .def_readwrite("minor", &InterpreterVersion::minor)
        .def_readwrite("patch", &InterpreterVersion::patch)
        .def_static("parse", &InterpreterVersion::parse, py::arg("text"))
        .def("__str__", &InterpreterVersion::to_string);

    py::class_<InterpreterCapabilities>(m, "InterpreterCapabilities")
        .def(py::init<>())
        .def_readwrite("supports_direct_redirect_with_elevation",
                       &InterpreterCapabilities::supportsDirectRedirectWithElevation)
        .def_readwrite("has_redirect_standard_flags", &InterpreterCapabilities::hasRedirectStandardFlags)
        .def_readwrite("default_encoding", &InterpreterCapabilities::defaultEncoding)
        .def_readwrite("redirectable_streams", &InterpreterCapabilities::redirectableStreams)
        .def_readwrite("version", &InterpreterCapabilities::version)
        .def_static("for_version", &InterpreterCapabilities::for_version, py::arg("version"))
        .def_static("fallback", &InterpreterCapabilities::fallback);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("powershell_path", &Config::powershellPath)
        .def_readwrite("working_directory", &Config::workingDirectory)
        .def_readwrite("environment", &Config::environment)
        .def_readwrite("temp_directory", &Config::tempDirectory)
        .def_readwrite("timeout_seconds", &Config::timeoutSeconds)
        .def_readwrite("probe_timeout_seconds", &Config::probeTimeoutSeconds)
        .def_readwrite("elevation_launcher", &Config::elevationLauncher)
        .def_readwrite("capabilities", &Config::capabilities);

    py::class_<CommandSpec>(m, "CommandSpec")
        .def_static("inline_command", &CommandSpec::inline_command, py::arg("text"))
        .def_static("script_file", &CommandSpec::script_file,
                    py::arg("path"), py::arg("arguments") = std::vector<std::string>{})
        .def("with_elevation", &CommandSpec::with_elevation, py::arg("elevate"))
        .def("with_timeout", &CommandSpec::with_timeout, py::arg("timeout"))
        .def("with_error_mode", &CommandSpec::with_error_mode, py::arg("mode"))
        .def_property_readonly("body", &CommandSpec::body)
        .def_property_readonly("is_script_file", &CommandSpec::is_script_file)
        .def_property_readonly("arguments", &CommandSpec::arguments)
        .def_property_readonly("elevate", &CommandSpec::elevate)
        .def_property_readonly("timeout", &CommandSpec::timeout)
        .def_property_readonly("error_mode", &CommandSpec::error_mode);

    py::class_<CommandResult>(m, "CommandResult")
        .def_readonly("exit_code", &CommandResult::exitCode)
        .def_readonly("out", &CommandResult::out)
        .def_readonly("err", &CommandResult::err)
        .def_readonly("status", &CommandResult::status)
        .def_readonly("hint", &CommandResult::hint)
        .def_readonly("encoding_warning", &CommandResult::encodingWarning)
        .def_readonly("strategy", &CommandResult::strategy)
        .def_readonly("terminated", &CommandResult::terminated)
        .def_readonly("execution_time", &CommandResult::executionTime)
        .def_property_readonly("success", &CommandResult::success)
        .def("__repr__", &repr);

    py::class_<CommandInvoker, std::shared_ptr<CommandInvoker>>(m, "CommandInvoker")
        .def(py::init<Config>(), py::arg("config") = Config{})
        .def("run", &CommandInvoker::run, py::arg("spec"),
             py::call_guard<py::gil_scoped_release>())
        .def("capabilities", &CommandInvoker::capabilities,
             py::return_value_policy::copy,
             py::call_guard<py::gil_scoped_release>())
        .def("interpreter_available", &CommandInvoker::interpreter_available,
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("config", &CommandInvoker::config, py::return_value_policy::copy);

    m.def("enable_debug_log", [](bool on, const std::string& path) {
        psrelay::dev::Logger::instance().enable(on, path);
    }, py::arg("on") = true, py::arg("path") = std::string{});
}
