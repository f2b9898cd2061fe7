#pragma once

#include <string>
#include <vector>

namespace lodbook {

/**
 * @brief Byte range of one token inside a string
 */
struct TokenSpan {
    size_t begin = 0;
    size_t end = 0;

    size_t length() const { return end - begin; }
};

/**
 * @brief Word-character test used for whole-word matching
 *
 * ASCII letters, digits and '_' are word characters. Every byte of a UTF-8
 * multi-byte sequence also counts as a word character, so accented names
 * are never split, independent of the process locale.
 */
bool is_word_byte(unsigned char c);

/**
 * @brief Offsets of every whole-word occurrence of `needle` in `text`
 *
 * Occurrences are found left to right and never overlap. An occurrence is
 * whole-word when the byte before it (if the needle starts with a word
 * character) and the byte after it (if the needle ends with a word
 * character) are not word characters. "Art" matches in "Art was exhibited"
 * but not in "The Article".
 */
std::vector<size_t> find_whole_word(const std::string& text, const std::string& needle);

/**
 * @brief Split text into whitespace-delimited words
 */
std::vector<TokenSpan> split_words(const std::string& text);

/**
 * @brief Remove every markup tag (`<...>`) from an HTML string
 *
 * Character references are left as they are; the result is still HTML text.
 */
std::string strip_tags(const std::string& html);

/**
 * @brief The last `count` words of `text`, joined by single spaces
 */
std::string last_words(const std::string& text, size_t count);

/**
 * @brief The first `count` words of `text`, joined by single spaces
 */
std::string first_words(const std::string& text, size_t count);

std::string trim(const std::string& s);

} // namespace lodbook
