#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace psrelay {
namespace core {

/// Text encoding an interpreter uses by default for redirected output and script files.
enum class TextEncoding {
    Utf16LeBom,   ///< Windows PowerShell (5.1 and older): "Unicode", BOM-prefixed
    Utf8NoBom     ///< PowerShell 6+ (pwsh)
};

const char* to_string(TextEncoding encoding) noexcept;

struct InterpreterVersion {
    int major{};
    int minor{};
    int patch{};

    /// Parse "7.4.1", "5.1.19041.4170" or "2.0". Leading/trailing whitespace is ignored.
    static std::optional<InterpreterVersion> parse(std::string_view text);
    std::string to_string() const;
};

/**
 * @brief What one interpreter version can do.
 *
 * Resolved once from a version probe and then passed around as data, so that
 * no call site has to compare version strings.
 */
struct InterpreterCapabilities {
    bool supportsDirectRedirectWithElevation{false}; ///< Elevated child can write to our pipes
    bool hasRedirectStandardFlags{true};             ///< Start-Process -RedirectStandard* exists
    TextEncoding defaultEncoding{TextEncoding::Utf8NoBom};
    int redirectableStreams{6};                       ///< Highest stream N usable in "N>&1"
    std::optional<InterpreterVersion> version{};      ///< Probed version, if any

    /// Capability table for a version on the current platform.
    static InterpreterCapabilities for_version(const InterpreterVersion& version);

    /// Used when the probe could not determine a version.
    static InterpreterCapabilities fallback();
};

} // namespace core
} // namespace psrelay
