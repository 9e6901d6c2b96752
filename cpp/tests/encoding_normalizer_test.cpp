#include <string>

#include <gtest/gtest.h>

#include "encoding_normalizer.hpp"

using namespace psrelay::core;

namespace
{

    // "hi é" + CRLF, in the byte layouts the interpreter produces.
    const std::string kUtf8Text = "hi \xC3\xA9\r\n";
    const std::string kUtf16LeText = std::string("h\0i\0 \0\xE9\0\r\0\n\0", 12);
    const std::string kUtf16BeText = std::string("\0h\0i\0 \0\xE9\0\r\0\n", 12);

} // namespace

TEST(EncodingNormalizer, PlainUtf8PassesThrough)
{
    const auto decoded = to_canonical("hello\nworld", TextEncoding::Utf8NoBom);
    EXPECT_EQ(decoded.text, "hello\nworld");
    EXPECT_EQ(decoded.warning, EncodingWarning::None);
    EXPECT_EQ(decoded.detected, DetectedEncoding::Utf8);
}

TEST(EncodingNormalizer, StripsUtf8Bom)
{
    const auto decoded = to_canonical("\xEF\xBB\xBF" + kUtf8Text, TextEncoding::Utf16LeBom);
    EXPECT_EQ(decoded.text, "hi \xC3\xA9\n");
    EXPECT_EQ(decoded.warning, EncodingWarning::None);
    EXPECT_EQ(decoded.detected, DetectedEncoding::Utf8Bom);
}

TEST(EncodingNormalizer, DecodesUtf16LeWithBom)
{
    const auto decoded = to_canonical(std::string("\xFF\xFE") + kUtf16LeText, TextEncoding::Utf8NoBom);
    EXPECT_EQ(decoded.text, "hi \xC3\xA9\n");
    EXPECT_EQ(decoded.warning, EncodingWarning::None);
    EXPECT_EQ(decoded.detected, DetectedEncoding::Utf16Le);
}

TEST(EncodingNormalizer, DecodesUtf16BeWithBom)
{
    const auto decoded = to_canonical(std::string("\xFE\xFF") + kUtf16BeText, TextEncoding::Utf8NoBom);
    EXPECT_EQ(decoded.text, "hi \xC3\xA9\n");
    EXPECT_EQ(decoded.detected, DetectedEncoding::Utf16Be);
}

TEST(EncodingNormalizer, DecodesSurrogatePairs)
{
    // U+1F600 as UTF-16LE: 3D D8 00 DE
    const auto decoded = to_canonical(std::string("\xFF\xFE\x3D\xD8\x00\xDE", 6), TextEncoding::Utf16LeBom);
    EXPECT_EQ(decoded.text, "\xF0\x9F\x98\x80");
    EXPECT_EQ(decoded.warning, EncodingWarning::None);
}

TEST(EncodingNormalizer, MissingBomWithUtf16HintIsFlagged)
{
    const auto even = to_canonical(kUtf16LeText, TextEncoding::Utf16LeBom);
    EXPECT_EQ(even.warning, EncodingWarning::MissingByteOrderMark);
    EXPECT_EQ(even.detected, DetectedEncoding::Utf16Le);
    EXPECT_EQ(even.text, "hi \xC3\xA9\n");

    const auto odd = to_canonical("abc", TextEncoding::Utf16LeBom);
    EXPECT_EQ(odd.warning, EncodingWarning::MissingByteOrderMark);
    EXPECT_EQ(odd.detected, DetectedEncoding::Utf8);
    EXPECT_EQ(odd.text, "abc");
}

TEST(EncodingNormalizer, EmptyInputNeedsNoBom)
{
    const auto decoded = to_canonical("", TextEncoding::Utf16LeBom);
    EXPECT_TRUE(decoded.text.empty());
    EXPECT_EQ(decoded.warning, EncodingWarning::None);
}

TEST(EncodingNormalizer, InvalidUtf8IsReplaced)
{
    const auto decoded = to_canonical("ok\xFF!", TextEncoding::Utf8NoBom);
    EXPECT_EQ(decoded.text, "ok\xEF\xBF\xBD!");
    EXPECT_EQ(decoded.warning, EncodingWarning::InvalidSequence);
}

TEST(EncodingNormalizer, UnpairedSurrogateIsReplaced)
{
    const auto decoded = to_canonical(std::string("\xFF\xFE\x3D\xD8" "a\0", 6), TextEncoding::Utf16LeBom);
    EXPECT_EQ(decoded.text, "\xEF\xBF\xBD" "a");
    EXPECT_EQ(decoded.warning, EncodingWarning::InvalidSequence);
}

TEST(EncodingNormalizer, LoneCarriageReturnIsKept)
{
    EXPECT_EQ(to_canonical("a\rb\r\n", TextEncoding::Utf8NoBom).text, "a\rb\n");
}

TEST(EncodingNormalizer, NativeScriptEncoding)
{
    EXPECT_EQ(encode_native("Write-Output 1", TextEncoding::Utf8NoBom), "Write-Output 1");

    const std::string utf16 = encode_native("h\xC3\xA9\xF0\x9F\x98\x80", TextEncoding::Utf16LeBom);
    EXPECT_EQ(utf16, std::string("\xFF\xFE" "h\0\xE9\0\x3D\xD8\x00\xDE", 10));
    EXPECT_EQ(to_canonical(utf16, TextEncoding::Utf8NoBom).text, "h\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(EncodingNormalizer, MissingBomOutranksInvalidSequence)
{
    EXPECT_EQ(worst_of(EncodingWarning::None, EncodingWarning::InvalidSequence), EncodingWarning::InvalidSequence);
    EXPECT_EQ(worst_of(EncodingWarning::MissingByteOrderMark, EncodingWarning::InvalidSequence),
              EncodingWarning::MissingByteOrderMark);
    EXPECT_EQ(worst_of(EncodingWarning::None, EncodingWarning::None), EncodingWarning::None);
}
