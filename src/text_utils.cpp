/// @file text_utils.cpp
/// @brief UTF-8 aware string helpers
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "text_utils.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blankline_cpp {

namespace utf8 {

std::vector<Utf8Char> decode(std::string_view text) {
    std::vector<Utf8Char> result;
    result.reserve(text.size());

    auto decodeOne = [&](std::size_t i) -> Utf8Char {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if ((lead & kAsciiMask) == 0) {
            return Utf8Char{lead, i, 1};
        }

        std::size_t length = expectedLength(lead);
        if (length == 1 || i + length > text.size()) {
            return Utf8Char{lead, i, 1};
        }

        std::uint32_t codepoint = lead & (kLeadPayloadMask >> length);
        for (std::size_t j = 1; j < length; ++j) {
            unsigned char cont = static_cast<unsigned char>(text[i + j]);
            if (!isContinuation(cont)) {
                return Utf8Char{lead, i, 1};
            }
            codepoint = (codepoint << 6) | (cont & kContinuationPayload);
        }

        bool overlong = codepoint < kMinValues[length];
        bool surrogate = codepoint >= 0xD800 && codepoint <= 0xDFFF;
        if (overlong || surrogate || codepoint > kUnicodeMax) {
            return Utf8Char{lead, i, 1};
        }
        return Utf8Char{codepoint, i, length};
    };

    for (std::size_t i = 0; i < text.size();) {
        Utf8Char decoded = decodeOne(i);
        result.push_back(decoded);
        i += decoded.length;
    }
    return result;
}

} // namespace utf8

bool isUnicodeWhitespace(std::uint32_t cp) {
    if (cp == 0x20 || (cp >= 0x09 && cp <= 0x0D)) return true;
    switch (cp) {
        case 0x0085:  // NEXT LINE
        case 0x00A0:  // NO-BREAK SPACE
        case 0x1680:  // OGHAM SPACE MARK
        case 0x2028:  // LINE SEPARATOR
        case 0x2029:  // PARAGRAPH SEPARATOR
        case 0x202F:  // NARROW NO-BREAK SPACE
        case 0x205F:  // MEDIUM MATHEMATICAL SPACE
        case 0x3000:  // IDEOGRAPHIC SPACE
        case 0xFEFF:  // BYTE ORDER MARK
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string trimStr(std::string_view s) {
    auto chars = utf8::decode(s);
    auto isContent = [](utf8::Utf8Char const& ch) { return !isUnicodeWhitespace(ch.codepoint); };

    auto front = std::find_if(chars.begin(), chars.end(), isContent);
    if (front == chars.end()) {
        return "";
    }
    auto back = std::find_if(chars.rbegin(), chars.rend(), isContent);

    std::size_t startByte = front->start;
    std::size_t endByte = back->start + back->length;
    return std::string(s.substr(startByte, endByte - startByte));
}

bool isBlankText(std::string_view s) {
    auto chars = utf8::decode(s);
    return std::all_of(chars.begin(), chars.end(), [](utf8::Utf8Char const& ch) {
        return isUnicodeWhitespace(ch.codepoint);
    });
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string utf8Prefix(std::string_view s, std::size_t count) {
    auto chars = utf8::decode(s);
    if (chars.size() <= count) {
        return std::string(s);
    }
    return std::string(s.substr(0, chars[count].start));
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

} // namespace blankline_cpp
