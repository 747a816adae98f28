/// @file text_utils.h
/// @brief UTF-8 aware string helpers shared by the checks and the snapshot
///
/// Paragraph text in a word-processing document is arbitrary UTF-8 and is
/// frequently padded with non-breaking or typographic spaces, so trimming
/// and blank tests operate on decoded code points rather than bytes.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_TEXT_UTILS_H
#define BLANKLINE_CPP_TEXT_UTILS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blankline_cpp {

namespace utf8 {

constexpr unsigned char kAsciiMask           = 0x80; // 1000 0000
constexpr unsigned char kLeadPayloadMask     = 0x7F; // 0111 1111
constexpr unsigned char kContinuationMask    = 0xC0; // 1100 0000
constexpr unsigned char kContinuationSig     = 0x80; // 1000 0000
constexpr unsigned char kContinuationPayload = 0x3F; // 0011 1111
constexpr std::array<std::uint32_t, 5> kMinValues = {0, 0, 0x80, 0x800, 0x10000};
constexpr std::uint32_t kUnicodeMax = 0x10FFFF;

// Infers the sequence length from the lead byte; 1 for ASCII or a bad lead.
constexpr std::size_t expectedLength(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

constexpr bool isContinuation(unsigned char byte) {
    return (byte & kContinuationMask) == kContinuationSig;
}

/// @brief A decoded character and the byte span it came from
struct Utf8Char {
    std::uint32_t codepoint;
    std::size_t start;
    std::size_t length;
};

/// @brief Decode @p text into code points
///
/// Malformed sequences decode as a single byte each so that no input is
/// silently skipped.
std::vector<Utf8Char> decode(std::string_view text);

} // namespace utf8

/// @brief True for ASCII and Unicode space separators (U+00A0, U+2000..U+200A, ...)
bool isUnicodeWhitespace(std::uint32_t codepoint);

/// @brief Trim Unicode whitespace from both ends of a UTF-8 string
std::string trimStr(std::string_view s);

/// @brief True when @p s is empty or consists only of Unicode whitespace
bool isBlankText(std::string_view s);

/// @brief ASCII lowercase copy; non-ASCII bytes pass through unchanged
std::string toLower(std::string_view s);

/// @brief First @p count characters of @p s, never splitting a UTF-8 sequence
std::string utf8Prefix(std::string_view s, std::size_t count);

bool startsWith(std::string_view s, std::string_view prefix);

/// @brief Case-insensitive (ASCII) substring test
bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_TEXT_UTILS_H
