#pragma once
#include "extract/TokenClassifier.hpp"
#include "nlp/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace nlp {

struct OnnxNerConfig {
    std::string model_path;
    std::string vocab_path;
    // index -> label, must match the model's output width; empty = CoNLL-2003 BIO
    std::vector<std::string> labels;
    size_t max_len = 512;
    bool lowercase = false;  // cased BERT NER vocabularies
    int intra_op_threads = 1;

    static std::vector<std::string> conll_labels();
};

// BERT-style token classification model run with ONNX Runtime.
class OnnxTokenClassifier final : public extract::TokenClassifier {
public:
    explicit OnnxTokenClassifier(OnnxNerConfig cfg);

    // Loads vocab and model; logs and returns false on failure.
    bool init();

    bool ready() const override { return (bool)m_session; }
    std::string model_name() const override;

    std::vector<extract::TokenPrediction> classify(const std::string& text) const override;

private:
    OnnxNerConfig m_cfg;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "entity-extractor"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_in_names;
    std::string m_out_name;
};

} // namespace nlp
