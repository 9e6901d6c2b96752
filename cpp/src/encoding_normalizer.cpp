#include "../include/encoding_normalizer.hpp"
#include "../include/dev_debug.hpp"

#include <cstdint>

namespace psrelay {
namespace core {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Re-emits valid UTF-8 and replaces every malformed sequence with U+FFFD.
std::string sanitize_utf8(std::string_view in, bool& invalid) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    const size_t n = in.size();
    while (i < n) {
        const auto b0 = static_cast<unsigned char>(in[i]);
        if (b0 < 0x80) {
            out.push_back(static_cast<char>(b0));
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; min = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }

        bool ok = len != 0 && i + len <= n;
        for (size_t k = 1; ok && k < len; ++k) {
            const auto b = static_cast<unsigned char>(in[i + k]);
            if ((b & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (b & 0x3F);
        }
        if (ok && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) ok = false;

        if (!ok) {
            invalid = true;
            append_utf8(out, kReplacement);
            ++i;
            continue;
        }
        out.append(in.substr(i, len));
        i += len;
    }
    return out;
}

std::string decode_utf16(std::string_view in, bool bigEndian, bool& invalid) {
    std::string out;
    out.reserve(in.size());
    const size_t units = in.size() / 2;
    auto unit_at = [&](size_t idx) -> char16_t {
        const auto lo = static_cast<unsigned char>(in[idx * 2]);
        const auto hi = static_cast<unsigned char>(in[idx * 2 + 1]);
        return bigEndian ? static_cast<char16_t>((lo << 8) | hi)
                         : static_cast<char16_t>((hi << 8) | lo);
    };

    for (size_t i = 0; i < units; ++i) {
        const char16_t u = unit_at(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 1 < units) {
                const char16_t next = unit_at(i + 1);
                if (next >= 0xDC00 && next <= 0xDFFF) {
                    const char32_t cp = 0x10000 + ((char32_t(u) - 0xD800) << 10) + (char32_t(next) - 0xDC00);
                    append_utf8(out, cp);
                    ++i;
                    continue;
                }
            }
            invalid = true;
            append_utf8(out, kReplacement);
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
            invalid = true;
            append_utf8(out, kReplacement);
        } else {
            append_utf8(out, u);
        }
    }
    if (in.size() % 2 != 0) {
        // Dangling half code unit.
        invalid = true;
        append_utf8(out, kReplacement);
    }
    return out;
}

void normalize_newlines(std::string& s) {
    if (s.find('\r') == std::string::npos) return;
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
        out.push_back(s[i]);
    }
    s.swap(out);
}

} // namespace

const char* to_string(EncodingWarning warning) noexcept {
    switch (warning) {
        case EncodingWarning::None:                 return "none";
        case EncodingWarning::MissingByteOrderMark: return "missing-byte-order-mark";
        case EncodingWarning::InvalidSequence:      return "invalid-sequence";
    }
    return "?";
}

EncodingWarning worst_of(EncodingWarning a, EncodingWarning b) noexcept {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

DecodedText to_canonical(std::string_view raw, TextEncoding hint) {
    static constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF", 3};
    static constexpr std::string_view kUtf16LeBom{"\xFF\xFE", 2};
    static constexpr std::string_view kUtf16BeBom{"\xFE\xFF", 2};

    DecodedText result;
    bool invalid = false;

    if (starts_with(raw, kUtf8Bom)) {
        result.detected = DetectedEncoding::Utf8Bom;
        result.text = sanitize_utf8(raw.substr(kUtf8Bom.size()), invalid);
    } else if (starts_with(raw, kUtf16LeBom)) {
        result.detected = DetectedEncoding::Utf16Le;
        result.text = decode_utf16(raw.substr(kUtf16LeBom.size()), false, invalid);
    } else if (starts_with(raw, kUtf16BeBom)) {
        result.detected = DetectedEncoding::Utf16Be;
        result.text = decode_utf16(raw.substr(kUtf16BeBom.size()), true, invalid);
    } else if (hint == TextEncoding::Utf16LeBom && !raw.empty()) {
        // No marker: the interpreter's own tools disagree on what this is.
        result.warning = EncodingWarning::MissingByteOrderMark;
        if (raw.size() % 2 == 0) {
            result.detected = DetectedEncoding::Utf16Le;
            result.text = decode_utf16(raw, false, invalid);
        } else {
            result.detected = DetectedEncoding::Utf8;
            result.text = sanitize_utf8(raw, invalid);
        }
        PSRELAY_DBG("ENCODING", "no BOM on %zu bytes with utf-16 hint, decoded as %s",
                    raw.size(), result.detected == DetectedEncoding::Utf16Le ? "utf-16le" : "utf-8");
    } else {
        result.detected = DetectedEncoding::Utf8;
        result.text = sanitize_utf8(raw, invalid);
    }

    if (invalid) {
        result.warning = worst_of(result.warning, EncodingWarning::InvalidSequence);
        PSRELAY_DBG("ENCODING", "replaced malformed input (%zu raw bytes)", raw.size());
    }

    normalize_newlines(result.text);
    return result;
}

std::string encode_native(std::string_view utf8, TextEncoding encoding) {
    if (encoding == TextEncoding::Utf8NoBom) {
        return std::string(utf8);
    }

    bool invalid = false;
    const std::string clean = sanitize_utf8(utf8, invalid);

    std::string out;
    out.reserve(2 + clean.size() * 2);
    out.push_back('\xFF');
    out.push_back('\xFE');

    auto put_unit = [&out](char16_t u) {
        out.push_back(static_cast<char>(u & 0xFF));
        out.push_back(static_cast<char>((u >> 8) & 0xFF));
    };

    size_t i = 0;
    while (i < clean.size()) {
        const auto b0 = static_cast<unsigned char>(clean[i]);
        char32_t cp = 0;
        size_t len = 1;
        if (b0 < 0x80)                { cp = b0; }
        else if ((b0 & 0xE0) == 0xC0) { cp = b0 & 0x1F; len = 2; }
        else if ((b0 & 0xF0) == 0xE0) { cp = b0 & 0x0F; len = 3; }
        else                          { cp = b0 & 0x07; len = 4; }
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(clean[i + k]) & 0x3F);
        }
        i += len;

        if (cp >= 0x10000) {
            const char32_t v = cp - 0x10000;
            put_unit(static_cast<char16_t>(0xD800 + (v >> 10)));
            put_unit(static_cast<char16_t>(0xDC00 + (v & 0x3FF)));
        } else {
            put_unit(static_cast<char16_t>(cp));
        }
    }
    return out;
}

} // namespace core
} // namespace psrelay
