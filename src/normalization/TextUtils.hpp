#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace normalization
{

/// UTF-8 to UTF-32 conversion; stops at the first malformed sequence
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// Encode a single codepoint as UTF-8 (empty for invalid codepoints)
std::string encodeCodepoint(char32_t cp);

/// Decode the codepoint starting at byte pos. Returns its length in bytes;
/// a malformed sequence yields U+FFFD with length 1 so callers can copy the byte through.
std::size_t decodeCodepoint(std::string_view text, std::size_t pos, char32_t& cp);

/// Unicode space separator (category Zs), e.g. U+00A0, U+3000
bool isSpaceSeparator(char32_t cp);

/// ASCII-only helpers; bytes >= 0x80 are never letters or digits here
inline bool isAsciiDigit(char c) { return c >= '0' && c <= '9'; }
inline bool isAsciiUpper(char c) { return c >= 'A' && c <= 'Z'; }
inline bool isAsciiLower(char c) { return c >= 'a' && c <= 'z'; }
inline bool isAsciiAlpha(char c) { return isAsciiUpper(c) || isAsciiLower(c); }
inline bool isAsciiAlnum(char c) { return isAsciiAlpha(c) || isAsciiDigit(c); }

std::string toLowerAscii(std::string_view text);

std::string trimWhitespace(std::string_view text);

void replaceAll(std::string& text, std::string_view from, std::string_view to);

/// Escape a literal so it can be embedded in an ECMAScript regex
std::string escapeRegex(std::string_view literal);

} // namespace normalization
