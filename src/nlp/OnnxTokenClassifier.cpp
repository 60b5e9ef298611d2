#include "nlp/OnnxTokenClassifier.hpp"
#include "extract/EntityExtractor.hpp"
#include "util/Logging.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace nlp {

std::vector<std::string> OnnxNerConfig::conll_labels() {
    return {"O", "B-MISC", "I-MISC", "B-PER", "I-PER", "B-ORG", "I-ORG", "B-LOC", "I-LOC"};
}

OnnxTokenClassifier::OnnxTokenClassifier(OnnxNerConfig cfg) : m_cfg(std::move(cfg)), m_tok(m_cfg.lowercase) {
    if (m_cfg.labels.empty()) m_cfg.labels = OnnxNerConfig::conll_labels();
}

std::string OnnxTokenClassifier::model_name() const {
    return std::filesystem::path(m_cfg.model_path).stem().string();
}

bool OnnxTokenClassifier::init() {
    if (!m_tok.load_vocab(m_cfg.vocab_path)) {
        EXTRACTOR_LOG_ERROR("failed to load vocab", {logging::StringField("path", m_cfg.vocab_path)});
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(m_cfg.intra_op_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        std::basic_string<ORTCHAR_T> model_path(m_cfg.model_path.begin(), m_cfg.model_path.end());
        auto session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        std::vector<std::string> in_names;
        for (size_t i = 0; i < session->GetInputCount(); ++i) {
            auto name = session->GetInputNameAllocated(i, allocator);
            in_names.emplace_back(name.get());
        }
        auto out_name = session->GetOutputNameAllocated(0, allocator);

        for (const auto& n : in_names) {
            if (n != "input_ids" && n != "attention_mask" && n != "token_type_ids") {
                EXTRACTOR_LOG_ERROR("unsupported model input",
                                    {logging::StringField("input", n),
                                     logging::StringField("model", m_cfg.model_path)});
                return false;
            }
        }

        m_in_names = std::move(in_names);
        m_out_name = out_name.get();
        m_session = std::move(session);
    } catch (const Ort::Exception& e) {
        EXTRACTOR_LOG_ERROR("onnxruntime failed to load model",
                            {logging::StringField("model", m_cfg.model_path),
                             logging::StringField("error", e.what())});
        return false;
    }

    EXTRACTOR_LOG_INFO("ner model loaded",
                       {logging::StringField("model", m_cfg.model_path),
                        logging::IntField("vocab", static_cast<std::int64_t>(m_tok.vocab_size())),
                        logging::IntField("labels", static_cast<std::int64_t>(m_cfg.labels.size()))});
    return true;
}

std::vector<extract::TokenPrediction> OnnxTokenClassifier::classify(const std::string& text) const {
    if (!m_session) throw extract::ExtractionError("onnx model not loaded: " + m_cfg.model_path);

    std::vector<WordPiece> pieces = m_tok.encode_with_offsets(text, m_cfg.max_len);
    if (pieces.empty()) return {};
    const size_t seq_len = pieces.size();

    std::vector<int64_t> ids(seq_len);
    for (size_t i = 0; i < seq_len; ++i) ids[i] = pieces[i].id;
    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);

    std::vector<int64_t> shape{1, (int64_t)seq_len};
    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<const char*> in_names;
    std::vector<Ort::Value> in_vals;
    for (const auto& n : m_in_names) {
        std::vector<int64_t>* src = &ids;
        if (n == "attention_mask") src = &mask;
        else if (n == "token_type_ids") src = &type_ids;

        in_names.push_back(n.c_str());
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, src->data(), src->size(), shape.data(), shape.size()));
    }

    const char* out_names[1] = { m_out_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        throw extract::ExtractionError(std::string("onnx inference failed: ") + e.what());
    }

    auto shp = outs[0].GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, labels]
    if (shp.size() != 3 || (size_t)shp[1] != seq_len) {
        throw extract::ExtractionError("unexpected logits shape from " + m_cfg.model_path);
    }
    const size_t num_labels = (size_t)shp[2];
    if (num_labels != m_cfg.labels.size()) {
        throw extract::ExtractionError("model has " + std::to_string(num_labels) + " labels, config lists " +
                                       std::to_string(m_cfg.labels.size()));
    }

    const float* logits = outs[0].GetTensorData<float>();

    std::vector<extract::TokenPrediction> out;
    out.reserve(seq_len);
    for (size_t t = 0; t < seq_len; ++t) {
        if (pieces[t].special) continue;

        const float* row = logits + t * num_labels;
        const size_t best = (size_t)(std::max_element(row, row + num_labels) - row);

        // softmax probability of the argmax
        double denom = 0.0;
        for (size_t k = 0; k < num_labels; ++k) denom += std::exp((double)row[k] - (double)row[best]);

        extract::TokenPrediction p;
        p.start = pieces[t].start;
        p.end = pieces[t].end;
        p.label = m_cfg.labels[best];
        p.score = (float)(1.0 / denom);
        p.continuation = pieces[t].continuation;
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace nlp
