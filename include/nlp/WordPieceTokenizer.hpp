#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nlp {

// One vocabulary piece with the byte range of source text it covers.
// Special tokens ([CLS], [SEP]) carry an empty range at 0.
struct WordPiece {
    int64_t id = 0;
    size_t start = 0;
    size_t end = 0;
    bool continuation = false;  // "##" piece inside a word
    bool special = false;
};

class WordPieceTokenizer {
public:
    // lowercase: true for uncased vocabularies
    explicit WordPieceTokenizer(bool lowercase = true) : m_lowercase(lowercase) {}

    bool load_vocab(const std::string& vocab_path);
    void set_lowercase(bool lowercase) { m_lowercase = lowercase; }

    // [CLS] ... [SEP], truncated to max_len; empty when max_len < 2
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;
    std::vector<WordPiece> encode_with_offsets(const std::string& text, size_t max_len) const;

    int64_t pad_id() const { return id_or(-1, "[PAD]"); }
    int64_t unk_id() const { return id_or(-1, "[UNK]"); }
    int64_t cls_id() const { return id_or(-1, "[CLS]"); }
    int64_t sep_id() const { return id_or(-1, "[SEP]"); }

    size_t vocab_size() const { return m_id_to_tok.size(); }

private:
    struct BasicToken {
        std::string text;
        size_t start;
        size_t end;
    };

    bool m_lowercase;
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    static bool is_ws(char c);
    static bool is_punct(char c);
    static std::string lower_ascii(std::string s);

    std::vector<BasicToken> basic_tokenize(const std::string& text) const;
    // piece lengths in bytes of the original token; empty when the token is unknown
    std::vector<std::pair<std::string, size_t>> wordpiece(const std::string& token) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};

} // namespace nlp
