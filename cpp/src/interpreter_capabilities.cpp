#include "../include/interpreter_capabilities.hpp"

#include <charconv>

namespace psrelay {
namespace core {

const char* to_string(TextEncoding encoding) noexcept {
    switch (encoding) {
        case TextEncoding::Utf16LeBom: return "utf-16le+bom";
        case TextEncoding::Utf8NoBom:  return "utf-8";
    }
    return "?";
}

std::optional<InterpreterVersion> InterpreterVersion::parse(std::string_view text) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    int parts[3] = {0, 0, 0};
    size_t count = 0;
    const char* p   = text.data();
    const char* end = text.data() + text.size();
    while (p < end && count < 3) {
        int value = 0;
        auto [next, ec] = std::from_chars(p, end, value);
        if (ec != std::errc{} || next == p) break;
        parts[count++] = value;
        p = next;
        if (p == end || *p != '.') break;
        ++p;
    }
    // At least "major.minor"; pre-release tags such as "7.5.0-preview.2" are accepted.
    if (count < 2) return std::nullopt;

    InterpreterVersion v;
    v.major = parts[0];
    v.minor = parts[1];
    v.patch = parts[2];
    return v;
}

std::string InterpreterVersion::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

InterpreterCapabilities InterpreterCapabilities::for_version(const InterpreterVersion& version) {
    InterpreterCapabilities caps;
    caps.version = version;

#ifdef _WIN32
    // Elevation goes through the shell's "runas" verb, which cannot hand over our pipe handles.
    caps.supportsDirectRedirectWithElevation = false;
#else
    // pkexec/sudo exec the interpreter in place and keep the inherited descriptors.
    caps.supportsDirectRedirectWithElevation = true;
#endif

    caps.hasRedirectStandardFlags = version.major >= 2;
    caps.defaultEncoding = version.major >= 6 ? TextEncoding::Utf8NoBom : TextEncoding::Utf16LeBom;

    if (version.major >= 5) {
        caps.redirectableStreams = 6;     // Information stream
    } else if (version.major >= 3) {
        caps.redirectableStreams = 5;     // Warning/Verbose/Debug
    } else {
        caps.redirectableStreams = 2;
    }
    return caps;
}

InterpreterCapabilities InterpreterCapabilities::fallback() {
    InterpreterCapabilities caps;
#ifdef _WIN32
    caps.supportsDirectRedirectWithElevation = false;
    caps.defaultEncoding = TextEncoding::Utf16LeBom;
    caps.redirectableStreams = 5;
#else
    caps.supportsDirectRedirectWithElevation = true;
    caps.defaultEncoding = TextEncoding::Utf8NoBom;
    caps.redirectableStreams = 6;
#endif
    caps.hasRedirectStandardFlags = true;
    return caps;
}

} // namespace core
} // namespace psrelay
