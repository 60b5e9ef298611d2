#include "nlp/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace nlp {

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    return !m_id_to_tok.empty();
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

bool WordPieceTokenizer::is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool WordPieceTokenizer::is_punct(char c) {
    unsigned char uc = (unsigned char)c;
    return ((uc >= 33 && uc <= 47) || (uc >= 58 && uc <= 64) ||
            (uc >= 91 && uc <= 96) || (uc >= 123 && uc <= 126));
}

std::string WordPieceTokenizer::lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<WordPieceTokenizer::BasicToken> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<BasicToken> out;

    size_t cur_start = 0;
    std::string cur;
    auto flush = [&](size_t end) {
        if (!cur.empty()) {
            out.push_back({m_lowercase ? lower_ascii(cur) : cur, cur_start, end});
            cur.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_ws(c)) {
            flush(i);
        } else if (is_punct(c)) {
            flush(i);
            out.push_back({std::string(1, c), i, i + 1});
        } else {
            if (cur.empty()) cur_start = i;
            cur.push_back(c);
        }
    }
    flush(text.size());
    return out;
}

std::vector<std::pair<std::string, size_t>> WordPieceTokenizer::wordpiece(const std::string& token) const {
    std::vector<std::pair<std::string, size_t>> pieces;
    if (token.empty()) return pieces;

    size_t start = 0;
    while (start < token.size()) {
        size_t end = token.size();
        std::string best;

        while (end > start) {
            std::string sub = token.substr(start, end - start);
            if (start > 0) sub = "##" + sub;

            if (m_tok_to_id.find(sub) != m_tok_to_id.end()) {
                best = sub;
                break;
            }
            --end;
        }

        if (best.empty()) return {};
        pieces.push_back({best, end - start});
        start = end;
    }

    return pieces;
}

std::vector<WordPiece> WordPieceTokenizer::encode_with_offsets(const std::string& text, size_t max_len) const {
    const int64_t cls = cls_id(), sep = sep_id(), unk = unk_id();

    std::vector<WordPiece> out;
    if (max_len < 2) return out; // no room for [CLS] and [SEP]

    out.reserve(max_len);
    out.push_back({cls, 0, 0, false, true});

    for (const auto& t : basic_tokenize(text)) {
        if (out.size() + 1 >= max_len) break; // keep room for [SEP]

        auto pieces = wordpiece(t.text);
        if (pieces.empty()) {
            out.push_back({unk, t.start, t.end, false, false});
            continue;
        }

        size_t pos = t.start;
        for (size_t i = 0; i < pieces.size(); ++i) {
            if (out.size() + 1 >= max_len) break;
            out.push_back({id_or(unk, pieces[i].first), pos, pos + pieces[i].second, i > 0, false});
            pos += pieces[i].second;
        }
    }

    out.push_back({sep, 0, 0, false, true});
    return out;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids;
    for (const auto& wp : encode_with_offsets(text, max_len)) ids.push_back(wp.id);
    return ids;
}

} // namespace nlp
