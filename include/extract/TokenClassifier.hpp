#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace extract {

// Label for one sub-word token, with the byte range it covers in the input text.
struct TokenPrediction {
    size_t start = 0;
    size_t end = 0;
    std::string label;          // "O", "B-PER", "I-ORG", ...
    float score = 0.0f;         // probability of `label`
    bool continuation = false;  // word piece inside a word ("##...")
};

// A contiguous entity mention decoded from token labels.
struct NerSpan {
    std::string label;  // bare type, e.g. "PER"
    size_t start = 0;
    size_t end = 0;
    double score = 0.0; // mean token score
};

// Sequence labelling model (NER). Implementations own their model resources.
class TokenClassifier {
public:
    virtual ~TokenClassifier() = default;

    virtual bool ready() const = 0;
    virtual std::string model_name() const = 0;

    // Throws on inference failure.
    virtual std::vector<TokenPrediction> classify(const std::string& text) const = 0;
};

// BIO / BIOES / IO decoding:
// - B-X (or S-X) opens a span; S-X and E-X close it after the token
// - I-X (or bare X) extends an open X span, otherwise opens one
// - continuation pieces extend whatever span is open
// - O closes
std::vector<NerSpan> decode_bio(const std::vector<TokenPrediction>& predictions);

} // namespace extract
