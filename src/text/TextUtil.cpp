#include "text/TextUtil.hpp"
#include <algorithm>
#include <cctype>

namespace textutil {

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// bytes >= 0x80 are part of some non-ASCII letter; treat them as word characters
static bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

static bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_space((unsigned char)s[i])) ++i;
    while (j > i && is_space((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string context_before(const std::string& text, size_t start, size_t window) {
    start = std::min(start, text.size());
    size_t from = start > window ? start - window : 0;
    while (from < start && is_utf8_continuation((unsigned char)text[from])) ++from;
    return text.substr(from, start - from);
}

std::string context_after(const std::string& text, size_t end, size_t window) {
    end = std::min(end, text.size());
    size_t to = std::min(text.size(), end + window);
    while (to < text.size() && to > end && is_utf8_continuation((unsigned char)text[to])) --to;
    return text.substr(end, to - end);
}

std::string clipped_context_before(const std::string& text, size_t start, size_t window) {
    std::string ctx = context_before(text, start, window);
    const bool truncated = std::min(start, text.size()) > window;
    if (truncated) {
        // drop the partial word at the cut
        size_t sp = 0;
        while (sp < ctx.size() && !is_space((unsigned char)ctx[sp])) ++sp;
        if (sp < ctx.size()) ctx = ctx.substr(sp);
    }
    ctx = trim(ctx);
    return truncated ? "..." + ctx : ctx;
}

std::string clipped_context_after(const std::string& text, size_t end, size_t window) {
    std::string ctx = context_after(text, end, window);
    const bool truncated = std::min(end, text.size()) + window < text.size();
    if (truncated) {
        size_t sp = ctx.size();
        while (sp > 0 && !is_space((unsigned char)ctx[sp - 1])) --sp;
        if (sp > 0) ctx = ctx.substr(0, sp);
    }
    ctx = trim(ctx);
    return truncated ? ctx + "..." : ctx;
}

std::vector<TextSpan> split_sentences(const std::string& text) {
    std::vector<TextSpan> out;

    auto push = [&](size_t a, size_t b) {
        while (a < b && is_space((unsigned char)text[a])) ++a;
        while (b > a && is_space((unsigned char)text[b - 1])) --b;
        if (b > a) out.push_back({a, b});
    };

    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.' || c == '!' || c == '?') {
            // "Node.js", "3.5": only a terminator when followed by space or end
            if (i + 1 == text.size() || is_space((unsigned char)text[i + 1])) {
                push(start, i + 1);
                start = i + 1;
            }
        } else if (c == '\n' && i + 1 < text.size()) {
            // blank line
            size_t j = i + 1;
            while (j < text.size() && (text[j] == ' ' || text[j] == '\t' || text[j] == '\r')) ++j;
            if (j < text.size() && text[j] == '\n') {
                push(start, i);
                start = j + 1;
                i = j;
            }
        }
    }
    push(start, text.size());
    return out;
}

std::vector<TextSpan> word_spans(const std::string& text, size_t start, size_t end) {
    std::vector<TextSpan> out;
    end = std::min(end, text.size());

    size_t i = start;
    while (i < end) {
        while (i < end && !is_word_char((unsigned char)text[i])) ++i;
        if (i >= end) break;

        size_t j = i;
        while (j < end) {
            unsigned char c = (unsigned char)text[j];
            if (is_word_char(c)) {
                ++j;
            } else if ((c == '\'' || c == '-') && j + 1 < end && is_word_char((unsigned char)text[j + 1])) {
                ++j;
            } else {
                break;
            }
        }
        out.push_back({i, j});
        i = j;
    }
    return out;
}

bool is_word_boundary(const std::string& text, size_t start, size_t end) {
    if (start > end || end > text.size()) return false;
    if (start > 0 && start < text.size() && is_word_char((unsigned char)text[start - 1]) &&
        is_word_char((unsigned char)text[start])) {
        return false;
    }
    if (end > start && end < text.size() && is_word_char((unsigned char)text[end - 1]) &&
        is_word_char((unsigned char)text[end])) {
        return false;
    }
    return true;
}

}
