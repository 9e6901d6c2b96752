#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "interpreter_capabilities.hpp"

namespace psrelay {
namespace core {
struct Config {
#ifdef _WIN32
	std::string powershellPath{"powershell"};   ///< Path to the PowerShell executable
#else
	std::string powershellPath{"pwsh"};         ///< Path to the PowerShell executable
#endif
	std::string workingDirectory{""};           ///< Working directory (empty = current directory)
	std::map<std::string, std::string> environment;   ///< Extra environment variables (not passed through UAC)
	std::string tempDirectory{""};              ///< Where relay channels live (empty = OS temp dir)
	int  timeoutSeconds{0};                     ///< Per-command timeout when CommandSpec sets none (0 = unbounded)
	int  probeTimeoutSeconds{15};               ///< Timeout for the version probe
	std::vector<std::string> elevationLauncher{"pkexec"};  ///< POSIX: program that runs the interpreter elevated
	std::optional<InterpreterCapabilities> capabilities;   ///< Skip the version probe and use these
};
} // namespace core
} // namespace psrelay
