#pragma once

#include <cstddef>
#include <string>

namespace processing
{

inline constexpr char32_t kReplacementChar = U'\uFFFD';

/// UTF-8 to UTF-32 conversion. Each byte of an invalid sequence decodes to kReplacementChar.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Number of bytes the code points occupy once encoded as UTF-8
std::size_t utf8ByteLength(const std::u32string& s);

/// Chinese/Japanese blocks: CJK Unified (U+4E00-U+9FFF), Extension A (U+3400-U+4DBF),
/// Hiragana and Katakana (U+3040-U+30FF)
bool isCJChar(char32_t cp);

/// Hangul Syllables (U+AC00-U+D7AF)
bool isKoreanChar(char32_t cp);

bool isWhitespaceChar(char32_t cp);

/// Strip leading and trailing Unicode whitespace
std::u32string trimWhitespace(const std::u32string& s);

/// Lowercase ASCII letters only; other code points are left untouched
std::u32string asciiToLower(const std::u32string& s);

} // namespace processing
