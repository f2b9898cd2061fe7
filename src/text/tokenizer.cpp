#include "text/tokenizer.hpp"
#include <cctype>

namespace lodbook {

namespace {

bool is_space_byte(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string join_spans(const std::string& text, const std::vector<TokenSpan>& spans,
                       size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i < last; ++i) {
        if (!out.empty()) out += ' ';
        out.append(text, spans[i].begin, spans[i].length());
    }
    return out;
}

}  // namespace

bool is_word_byte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) || c == '_';
}

std::vector<size_t> find_whole_word(const std::string& text, const std::string& needle) {
    std::vector<size_t> offsets;
    if (needle.empty() || needle.size() > text.size()) {
        return offsets;
    }

    bool check_front = is_word_byte(static_cast<unsigned char>(needle.front()));
    bool check_back = is_word_byte(static_cast<unsigned char>(needle.back()));

    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        bool front_ok = !check_front || pos == 0 ||
                        !is_word_byte(static_cast<unsigned char>(text[pos - 1]));
        bool back_ok = !check_back || after == text.size() ||
                       !is_word_byte(static_cast<unsigned char>(text[after]));

        if (front_ok && back_ok) {
            offsets.push_back(pos);
            pos = text.find(needle, after);
        } else {
            pos = text.find(needle, pos + 1);
        }
    }

    return offsets;
}

std::vector<TokenSpan> split_words(const std::string& text) {
    std::vector<TokenSpan> spans;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space_byte(static_cast<unsigned char>(text[i]))) i++;
        if (i >= text.size()) break;
        TokenSpan span;
        span.begin = i;
        while (i < text.size() && !is_space_byte(static_cast<unsigned char>(text[i]))) i++;
        span.end = i;
        spans.push_back(span);
    }
    return spans;
}

std::string strip_tags(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    size_t i = 0;
    while (i < html.size()) {
        if (html[i] == '<') {
            size_t close = html.find('>', i);
            if (close == std::string::npos) {
                // Unterminated tag is not markup, keep it as text
                out.append(html, i, std::string::npos);
                break;
            }
            i = close + 1;
            continue;
        }
        out += html[i++];
    }
    return out;
}

std::string last_words(const std::string& text, size_t count) {
    auto spans = split_words(text);
    size_t first = spans.size() > count ? spans.size() - count : 0;
    return join_spans(text, spans, first, spans.size());
}

std::string first_words(const std::string& text, size_t count) {
    auto spans = split_words(text);
    size_t last = spans.size() < count ? spans.size() : count;
    return join_spans(text, spans, 0, last);
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

} // namespace lodbook
