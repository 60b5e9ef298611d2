#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

// Half-open byte range [start, end) into some source text.
struct TextSpan {
    size_t start = 0;
    size_t end = 0;
};

std::string to_lower_ascii(std::string s);
std::string trim(const std::string& s);

// Up to `window` bytes before `start` / after `end`, never splitting a UTF-8 sequence.
std::string context_before(const std::string& text, size_t start, size_t window);
std::string context_after(const std::string& text, size_t end, size_t window);

// Same windows, but word-trimmed and marked with "..." where the text continues.
std::string clipped_context_before(const std::string& text, size_t start, size_t window);
std::string clipped_context_after(const std::string& text, size_t end, size_t window);

// Sentences end at '.', '!' or '?' followed by whitespace/end, or at a blank line.
// Spans exclude surrounding whitespace; empty sentences are dropped.
std::vector<TextSpan> split_sentences(const std::string& text);

// Alphanumeric runs (plus '\'' and '-' inside a word) in [start, end).
std::vector<TextSpan> word_spans(const std::string& text, size_t start, size_t end);

// True when [start, end) is not glued to a letter/digit on either side.
bool is_word_boundary(const std::string& text, size_t start, size_t end);

}
