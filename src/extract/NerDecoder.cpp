#include "extract/TokenClassifier.hpp"

#include <optional>

namespace extract {

namespace {

struct Tag {
    char scheme = 'O';  // 'B', 'I', 'E', 'S' or 'O'
    std::string type;
};

Tag parse_label(const std::string& label) {
    if (label.empty() || label == "O") return {};
    if (label.size() > 2 && label[1] == '-' &&
        (label[0] == 'B' || label[0] == 'I' || label[0] == 'E' || label[0] == 'S')) {
        return {label[0], label.substr(2)};
    }
    // IO scheme: bare type
    return {'I', label};
}

struct OpenSpan {
    NerSpan span;
    double score_sum = 0.0;
    size_t tokens = 0;

    void add(const TokenPrediction& p) {
        span.end = p.end;
        score_sum += p.score;
        ++tokens;
    }
};

} // namespace

std::vector<NerSpan> decode_bio(const std::vector<TokenPrediction>& predictions) {
    std::vector<NerSpan> out;
    std::optional<OpenSpan> cur;

    auto close = [&]() {
        if (!cur) return;
        cur->span.score = cur->tokens ? cur->score_sum / (double)cur->tokens : 0.0;
        out.push_back(std::move(cur->span));
        cur.reset();
    };

    auto open = [&](const std::string& type, const TokenPrediction& p) {
        close();
        OpenSpan s;
        s.span.label = type;
        s.span.start = p.start;
        s.span.end = p.end;
        s.score_sum = p.score;
        s.tokens = 1;
        cur = std::move(s);
    };

    for (const auto& p : predictions) {
        if (p.continuation && cur) {
            cur->add(p);
            continue;
        }

        Tag tag = parse_label(p.label);
        switch (tag.scheme) {
            case 'O':
                close();
                break;
            case 'B':
                open(tag.type, p);
                break;
            case 'S':
                open(tag.type, p);
                close();
                break;
            case 'I':
            case 'E':
                if (cur && cur->span.label == tag.type) {
                    cur->add(p);
                } else {
                    open(tag.type, p);
                }
                if (tag.scheme == 'E') close();
                break;
        }
    }
    close();
    return out;
}

} // namespace extract
