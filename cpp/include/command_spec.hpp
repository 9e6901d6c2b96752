#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace psrelay {
namespace core {

/// How non-terminating errors inside the body are treated for one invocation.
enum class ErrorMode {
    Continue,  ///< Interpreter default: report and keep going
    Stop       ///< Every error is terminating (ErrorAction Stop for this invocation only)
};

/**
 * @brief One unit of work: an inline command or a script file.
 *
 * Immutable once constructed. The with_* members return modified copies.
 */
class CommandSpec {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    static CommandSpec inline_command(std::string text) {
        return CommandSpec(std::move(text), false, {});
    }

    static CommandSpec script_file(std::string path, std::vector<std::string> arguments = {}) {
        return CommandSpec(std::move(path), true, std::move(arguments));
    }

    CommandSpec with_elevation(bool elevate) const {
        CommandSpec copy(*this);
        copy.elevate_ = elevate;
        return copy;
    }

    CommandSpec with_timeout(Timeout timeout) const {
        CommandSpec copy(*this);
        copy.timeout_ = timeout;
        return copy;
    }

    CommandSpec with_error_mode(ErrorMode mode) const {
        CommandSpec copy(*this);
        copy.errorMode_ = mode;
        return copy;
    }

    const std::string& body() const noexcept { return body_; }
    bool is_script_file() const noexcept { return isScriptFile_; }
    const std::vector<std::string>& arguments() const noexcept { return arguments_; }
    bool elevate() const noexcept { return elevate_; }
    const Timeout& timeout() const noexcept { return timeout_; }
    ErrorMode error_mode() const noexcept { return errorMode_; }

private:
    CommandSpec(std::string body, bool isScriptFile, std::vector<std::string> arguments)
        : body_(std::move(body)),
          isScriptFile_(isScriptFile),
          arguments_(std::move(arguments)) {}

    std::string              body_;
    bool                     isScriptFile_{false};
    std::vector<std::string> arguments_{};
    bool                     elevate_{false};
    Timeout                  timeout_{};
    ErrorMode                errorMode_{ErrorMode::Continue};
};

} // namespace core
} // namespace psrelay
