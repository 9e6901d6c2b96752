#pragma once

#include <string>
#include <string_view>

#include "interpreter_capabilities.hpp"

namespace psrelay {
namespace core {

/// Data-quality flag raised while converting captured bytes.
enum class EncodingWarning {
    None,
    InvalidSequence,       ///< Malformed input replaced by U+FFFD
    MissingByteOrderMark   ///< 16-bit encoding expected but no BOM present; endianness was guessed
};

const char* to_string(EncodingWarning warning) noexcept;

/// Encoding actually used to decode a buffer.
enum class DetectedEncoding {
    Utf8,
    Utf8Bom,
    Utf16Le,
    Utf16Be
};

struct DecodedText {
    std::string      text{};                          ///< UTF-8, no BOM, LF line endings
    EncodingWarning  warning{EncodingWarning::None};
    DetectedEncoding detected{DetectedEncoding::Utf8};
};

/**
 * @brief Convert raw interpreter output to the canonical in-process form.
 *
 * A byte-order mark, when present, always wins over the hint. Without one,
 * a UTF-16 hint cannot be decoded reliably: the text is decoded best-effort
 * and the result carries EncodingWarning::MissingByteOrderMark.
 */
DecodedText to_canonical(std::string_view raw, TextEncoding hint);

/// Encode UTF-8 text the way the interpreter expects a script file (UTF-16LE gets a BOM).
std::string encode_native(std::string_view utf8, TextEncoding encoding);

/// Keep the more severe of two warnings (a missing BOM outranks replaced sequences).
EncodingWarning worst_of(EncodingWarning a, EncodingWarning b) noexcept;

} // namespace core
} // namespace psrelay
