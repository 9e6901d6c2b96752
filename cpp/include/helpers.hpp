#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace psrelay {
namespace helpers {

/**
 * Quote a string for a PowerShell single-quoted literal.
 * Encloses with single quotes and doubles internal single quotes (' -> '').
 * PowerShell also ends a literal on U+2018..U+201B, so those are doubled too.
 */
inline std::string ps_quote(std::string_view s) {
    std::string t;
    t.reserve(s.size() + 2);
    t.push_back('\'');
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\'') {
            t += "''";
            continue;
        }
        // UTF-8 E2 80 98..9B
        if (static_cast<unsigned char>(c) == 0xE2 && i + 2 < s.size() &&
            static_cast<unsigned char>(s[i + 1]) == 0x80 &&
            static_cast<unsigned char>(s[i + 2]) >= 0x98 &&
            static_cast<unsigned char>(s[i + 2]) <= 0x9B) {
            const std::string_view quote = s.substr(i, 3);
            t.append(quote);
            t.append(quote);
            i += 2;
            continue;
        }
        t.push_back(c);
    }
    t.push_back('\'');
    return t;
}

/// Build a PowerShell array literal of quoted strings: @('a', 'b').
inline std::string ps_array(const std::vector<std::string>& items) {
    std::string out = "@(";
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += ", ";
        first = false;
        out += ps_quote(item);
    }
    out += ")";
    return out;
}

inline void trim_inplace(std::string& s) {
    auto is_space = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    size_t a = 0, b = s.size();
    while (a < b && is_space(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && is_space(static_cast<unsigned char>(s[b - 1]))) --b;
    if (a == 0 && b == s.size()) return;
    s.assign(s.begin() + a, s.begin() + b);
}

/**
 * Quote one argument for a Windows command line so that CommandLineToArgvW
 * (and the MSVC runtime) splits it back into the same string.
 * Backslashes are only special when they precede a double quote.
 */
inline std::string quote_windows_arg(std::string_view arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string_view::npos) {
        return std::string(arg);
    }
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('"');
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out.push_back(c);
    }
    out.append(backslashes * 2, '\\');
    out.push_back('"');
    return out;
}

#ifdef _WIN32

/**
 * Convert UTF-16 (Windows wide string) to UTF-8.
 * Failure returns empty string.
 */
inline std::string wstring_to_utf8(const std::wstring& w) {
    if (w.empty()) return {};
    int n = ::WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), nullptr, 0, nullptr, nullptr);
    if (n <= 0) return {};
    std::string out(n, '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), out.data(), n, nullptr, nullptr);
    return out;
}

inline std::wstring utf8_to_wstring(std::string_view s) {
    if (s.empty()) return {};
    int n = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
    if (n <= 0) return {};
    std::wstring out(n, L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), out.data(), n);
    return out;
}

#endif

/// Path as UTF-8 text, suitable for ps_quote().
inline std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    return wstring_to_utf8(p.native());
#else
    return p.native();
#endif
}

inline std::filesystem::path utf8_to_path(std::string_view s) {
#ifdef _WIN32
    return std::filesystem::path(utf8_to_wstring(s));
#else
    return std::filesystem::path(std::string(s));
#endif
}

} // namespace helpers
} // namespace psrelay
