#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// End-of-sentence punctuation: . ? ! 。 ？ ！
inline constexpr std::array<char32_t, 6> PUNC_EOS = { U'.', U'?', U'!', U'。', U'？', U'！' };

// Clause separators: , ， 、 — and newline
inline constexpr std::array<char32_t, 5> PUNC_COMMA = { U',', U'，', U'、', U'—', U'\n' };

// Sentence length classes, in UTF-8 bytes
inline constexpr std::size_t SHORT_THRESHOLD = 12;
inline constexpr std::size_t MEDIUM_THRESHOLD = 32;
inline constexpr std::size_t LONG_THRESHOLD = 160;
inline constexpr std::size_t VERYLONG_THRESHOLD = 200;

// Phrases that close an utterance even without terminal punctuation (matched lowercase)
inline constexpr std::array<std::string_view, 11> SEMANTIC_EOS_WORDS = {
    "thank you", "thanks for", "in conclusion", "to summarize",
    "谢谢", "总结", "结论", "最后", "以上", "ありがとう", "まとめ"
};

// Converts \r\n and lone \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

[[nodiscard]] bool is_eos_punctuation(char32_t cp);
[[nodiscard]] bool is_comma_punctuation(char32_t cp);

/**
 * @brief Drop leading clauses until the text fits the display budget.
 *
 * While the UTF-8 byte length is >= max_byte_length, everything up to and including the
 * first PUNC_COMMA code point is removed. Stops when no separator remains or the separator
 * is the final character, so words are never cut in half and the result may still exceed
 * the budget.
 */
[[nodiscard]] std::string shorten_display_sentence(const std::string& text, std::size_t max_byte_length);

/**
 * @brief Join caption lines into one line, marking each break with punctuation.
 *
 * Each line is trimmed. Every line but the last gets a terminator chosen by its final
 * character and its byte length:
 *   - Chinese/Japanese, >= byte_threshold: "。"     otherwise "——"
 *   - anything else,    >= byte_threshold: ". "    otherwise "—"
 * Hangul is never treated as Chinese/Japanese.
 */
[[nodiscard]] std::string replace_newlines(const std::string& text, std::size_t byte_threshold);

/// Edit distance over code points (unit costs), using O(min(len)) memory.
[[nodiscard]] std::size_t levenshtein_distance(const std::u32string& s1, const std::u32string& s2);
[[nodiscard]] std::size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/// 1.0 when one text is a prefix of the other, else 1 - distance / max code-point length.
[[nodiscard]] double similarity(const std::string& s1, const std::string& s2);

/// Keep an http:// or https:// scheme as is, collapse repeated '/' and strip trailing '/'.
[[nodiscard]] std::string normalize_url(const std::string& url);

// Whether a caption fragment is complete enough to be worth sending to a translator
[[nodiscard]] bool is_meaningful_for_translation(const std::string& text);

// Latest sentence of a running transcript, merged with the previous one when too short
[[nodiscard]] std::string extract_meaningful_segment(const std::string& full_text);

[[nodiscard]] std::string ensure_sentence_completeness(const std::string& text);

// Suffix of new_text that follows the longest common prefix with old_text
[[nodiscard]] std::string get_added_content(const std::string& old_text, const std::string& new_text);

} // namespace processing
