#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    result.reserve(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Skip one byte of the bad sequence so the rest of the text survives
            result.push_back(kReplacementChar);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::size_t utf8ByteLength(const std::u32string& s)
{
    std::size_t bytes = 0;
    for (char32_t cp : s)
    {
        if (cp < 0x80)
            bytes += 1;
        else if (cp < 0x800)
            bytes += 2;
        else if (cp < 0x10000)
            bytes += 3;
        else
            bytes += 4;
    }
    return bytes;
}

bool isCJChar(char32_t cp)
{
    return (cp >= U'\u4E00' && cp <= U'\u9FFF') ||
           (cp >= U'\u3400' && cp <= U'\u4DBF') ||
           (cp >= U'\u3040' && cp <= U'\u30FF');
}

bool isKoreanChar(char32_t cp)
{
    return (cp >= U'\uAC00' && cp <= U'\uD7AF');
}

bool isWhitespaceChar(char32_t cp)
{
    switch (cp)
    {
    case 0x09:
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        // U+2000..U+200A: en quad through hair space
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::u32string trimWhitespace(const std::u32string& s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && isWhitespaceChar(s[begin]))
        ++begin;
    while (end > begin && isWhitespaceChar(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

std::u32string asciiToLower(const std::u32string& s)
{
    std::u32string out(s);
    for (auto& cp : out)
    {
        if (cp >= U'A' && cp <= U'Z')
            cp = cp - U'A' + U'a';
    }
    return out;
}

} // namespace processing
