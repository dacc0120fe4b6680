#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <vector>

namespace processing
{

namespace
{

constexpr std::size_t npos = std::u32string::npos;

template <std::size_t N>
bool contains(const std::array<char32_t, N>& set, char32_t cp)
{
    return std::find(set.begin(), set.end(), cp) != set.end();
}

// Last index < end holding end-of-sentence punctuation, or npos
std::size_t find_last_eos(const std::u32string& s, std::size_t end)
{
    for (std::size_t i = std::min(end, s.size()); i > 0; --i)
    {
        if (is_eos_punctuation(s[i - 1]))
            return i - 1;
    }
    return npos;
}

std::u32string tail_after(const std::u32string& s, std::size_t pos)
{
    return pos == npos ? s : s.substr(pos + 1);
}

} // namespace

std::string normalize_line_endings(const std::string& text)
{
    if (text.empty())
        return text;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // "\r\n" and a lone '\r' both become a single '\n'
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

bool is_eos_punctuation(char32_t cp) { return contains(PUNC_EOS, cp); }

bool is_comma_punctuation(char32_t cp) { return contains(PUNC_COMMA, cp); }

std::string shorten_display_sentence(const std::string& text, std::size_t max_byte_length)
{
    if (text.size() < max_byte_length)
        return text;

    const std::u32string chars = utf8ToUtf32(text);
    std::size_t start = 0;
    std::size_t bytes = utf8ByteLength(chars);

    while (bytes >= max_byte_length)
    {
        std::size_t sep = npos;
        for (std::size_t i = start; i < chars.size(); ++i)
        {
            if (is_comma_punctuation(chars[i]))
            {
                sep = i;
                break;
            }
        }
        if (sep == npos || sep + 1 >= chars.size())
            break;

        bytes -= utf8ByteLength(chars.substr(start, sep + 1 - start));
        start = sep + 1;
    }

    if (start == 0)
        return text;
    return utf32ToUtf8(chars.substr(start));
}

std::string replace_newlines(const std::string& text, std::size_t byte_threshold)
{
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (true)
    {
        std::size_t nl = text.find('\n', begin);
        if (nl == std::string::npos)
        {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, nl - begin));
        begin = nl + 1;
    }

    std::string result;
    result.reserve(text.size() + lines.size() * 6);

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::u32string line = trimWhitespace(utf8ToUtf32(lines[i]));
        result += utf32ToUtf8(line);
        if (i == lines.size() - 1)
            continue;

        bool is_cj = false;
        if (!line.empty())
        {
            char32_t last = line.back();
            is_cj = isCJChar(last) && !isKoreanChar(last);
        }

        if (utf8ByteLength(line) >= byte_threshold)
            result += is_cj ? "。" : ". ";
        else
            result += is_cj ? "——" : "—";
    }

    return result;
}

std::size_t levenshtein_distance(const std::u32string& s1, const std::u32string& s2)
{
    if (s1.empty())
        return s2.size();
    if (s2.empty())
        return s1.size();

    // The shorter string sizes the rows
    const std::u32string& shorter = s1.size() <= s2.size() ? s1 : s2;
    const std::u32string& longer = s1.size() <= s2.size() ? s2 : s1;

    const std::size_t len1 = shorter.size();
    const std::size_t len2 = longer.size();

    std::vector<std::size_t> previous(len1 + 1);
    std::vector<std::size_t> current(len1 + 1);

    for (std::size_t i = 0; i <= len1; ++i)
        previous[i] = i;

    for (std::size_t j = 1; j <= len2; ++j)
    {
        current[0] = j;
        for (std::size_t i = 1; i <= len1; ++i)
        {
            std::size_t cost = (shorter[i - 1] == longer[j - 1]) ? 0 : 1;
            current[i] = std::min({ current[i - 1] + 1, previous[i] + 1, previous[i - 1] + cost });
        }
        previous.swap(current);
    }

    return previous[len1];
}

std::size_t levenshtein_distance(const std::string& s1, const std::string& s2)
{
    return levenshtein_distance(utf8ToUtf32(s1), utf8ToUtf32(s2));
}

double similarity(const std::string& s1, const std::string& s2)
{
    // A growing live caption still matches its earlier snapshot
    if (s1.starts_with(s2) || s2.starts_with(s1))
        return 1.0;

    const std::u32string a = utf8ToUtf32(s1);
    const std::u32string b = utf8ToUtf32(s2);

    const std::size_t max_len = std::max(a.size(), b.size());
    if (max_len == 0)
        return 1.0;

    const std::size_t distance = levenshtein_distance(a, b);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(max_len);
}

std::string normalize_url(const std::string& url)
{
    std::string scheme;
    if (url.starts_with("https://"))
        scheme = "https://";
    else if (url.starts_with("http://"))
        scheme = "http://";

    std::string rest;
    rest.reserve(url.size() - scheme.size());
    for (std::size_t i = scheme.size(); i < url.size(); ++i)
    {
        char c = url[i];
        if (c == '/' && !rest.empty() && rest.back() == '/')
            continue;
        rest.push_back(c);
    }

    while (!rest.empty() && rest.back() == '/')
        rest.pop_back();

    return scheme + rest;
}

bool is_meaningful_for_translation(const std::string& text)
{
    if (text.empty())
        return false;

    const std::u32string chars = utf8ToUtf32(text);
    if (!chars.empty() && is_eos_punctuation(chars.back()))
        return true;

    const std::u32string lowered = asciiToLower(chars);
    for (const auto& word : SEMANTIC_EOS_WORDS)
    {
        if (lowered.find(utf8ToUtf32(std::string(word))) != npos)
            return true;
    }

    return text.size() > LONG_THRESHOLD;
}

std::string extract_meaningful_segment(const std::string& full_text)
{
    const std::u32string chars = utf8ToUtf32(full_text);
    if (chars.empty())
        return std::string();

    // A terminator at the very end belongs to the sentence being extracted
    std::size_t last_eos = is_eos_punctuation(chars.back()) ? find_last_eos(chars, chars.size() - 1)
                                                            : find_last_eos(chars, chars.size());
    std::u32string latest = tail_after(chars, last_eos);

    if (last_eos != npos && last_eos > 0 && utf8ByteLength(latest) < SHORT_THRESHOLD)
    {
        last_eos = find_last_eos(chars, last_eos);
        latest = tail_after(chars, last_eos);
    }

    const std::u32string lowered = asciiToLower(chars);
    for (const auto& word : SEMANTIC_EOS_WORDS)
    {
        const std::u32string needle = utf8ToUtf32(std::string(word));
        std::size_t pos = lowered.rfind(needle);
        if (pos != npos && (last_eos == npos || pos > last_eos))
        {
            latest = chars.substr(pos + needle.size());
            break;
        }
    }

    return utf32ToUtf8(latest);
}

std::string ensure_sentence_completeness(const std::string& text)
{
    if (text.empty())
        return text;

    const std::u32string chars = utf8ToUtf32(text);
    if (chars.empty() || is_eos_punctuation(chars.back()))
        return text;

    // Enough text after the last terminator means a new sentence has started
    std::size_t last_eos = find_last_eos(chars, chars.size());
    if (last_eos != npos && last_eos + SHORT_THRESHOLD < chars.size())
        return utf32ToUtf8(chars.substr(last_eos + 1));

    return text;
}

std::string get_added_content(const std::string& old_text, const std::string& new_text)
{
    if (old_text.empty())
        return new_text;

    if (new_text.starts_with(old_text))
        return new_text.substr(old_text.size());

    const std::u32string old_chars = utf8ToUtf32(old_text);
    const std::u32string new_chars = utf8ToUtf32(new_text);

    std::size_t i = 0;
    while (i < old_chars.size() && i < new_chars.size() && old_chars[i] == new_chars[i])
        ++i;

    return utf32ToUtf8(new_chars.substr(i));
}

} // namespace processing
