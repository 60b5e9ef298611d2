#include "commands/extract.hpp"
#include "commands/CliArgs.hpp"

#include "extract/CompositeExtractor.hpp"
#include "extract/NerExtractor.hpp"
#include "extract/PatternExtractor.hpp"
#include "extract/ReplayExtractor.hpp"
#include "io/JsonIO.hpp"
#include "model/Observation.hpp"
#include "nlp/OnnxTokenClassifier.hpp"
#include "util/Logging.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static std::vector<std::shared_ptr<const extract::EntityExtractor>> build_extractors(const io::ExtractorConfig& cfg) {
    std::vector<std::shared_ptr<const extract::EntityExtractor>> out;

    if (cfg.pattern) {
        out.push_back(std::make_shared<extract::PatternExtractor>(*cfg.pattern));
    }

    if (cfg.ner_model) {
        nlp::OnnxNerConfig onnx;
        onnx.model_path = cfg.ner_model->model_path;
        onnx.vocab_path = cfg.ner_model->vocab_path;
        onnx.labels = cfg.ner_model->labels;
        onnx.max_len = cfg.ner_model->max_len;
        onnx.lowercase = cfg.ner_model->lowercase;
        onnx.intra_op_threads = cfg.ner_model->threads;

        auto classifier = std::make_shared<nlp::OnnxTokenClassifier>(onnx);
        if (!classifier->init()) {
            // kept in the pipeline: the merge reports it as a failed capability
            EXTRACTOR_LOG_WARN("ner model unavailable", {logging::StringField("model", onnx.model_path)});
        }
        out.push_back(std::make_shared<extract::NerExtractor>(classifier, cfg.ner));
    }

    if (!cfg.replay_dir.empty()) {
        out.push_back(std::make_shared<extract::ReplayExtractor>(cfg.replay_dir));
    }

    return out;
}

static void print_collection(std::ostream& os, const model::EntityCollection& c) {
    os << "Entities (" << c.entities().size() << "):\n";
    for (const auto& e : c.entities()) {
        os << "  - " << e.name << " (Type: " << e.type << ", Confidence: "
           << std::fixed << std::setprecision(2) << e.confidence << ")\n";
        size_t n = model::observation_count(e.metadata);
        if (n) os << "    Observations: " << n << "\n";
    }

    os << "\nRelationships (" << c.relationships().size() << "):\n";
    for (const auto& r : c.relationships()) {
        const model::Entity* src = c.get_entity_by_id(r.source_entity);
        const model::Entity* dst = c.get_entity_by_id(r.target_entity);
        if (!src || !dst) continue;
        os << "  - " << src->name << " --[" << r.type << "]--> " << dst->name
           << " (Confidence: " << std::fixed << std::setprecision(2) << r.confidence << ")\n";
    }
}

int cmd_extract(int argc, char** argv) {
    const std::string config_path = cli::get_arg(argc, argv, "--config", "");
    const std::string text_path   = cli::get_arg(argc, argv, "--text", "");
    const std::string inline_text = cli::get_arg(argc, argv, "--input", "");
    const std::string source_id   = cli::get_arg(argc, argv, "--source_id", "");
    const std::string out_path    = cli::get_arg(argc, argv, "--out", "");
    const std::string replay_dir  = cli::get_arg(argc, argv, "--replay", "");

    if (config_path.empty()) {
        std::cerr << "extract: --config is required\n";
        return 1;
    }

    io::ExtractorConfig cfg;
    try {
        cfg = io::load_extractor_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "extract: bad config: " << e.what() << "\n";
        return 1;
    }
    if (!replay_dir.empty()) cfg.replay_dir = replay_dir;
    if (cli::has_flag(argc, argv, "--parallel")) cfg.composite.parallel = true;

    logging::init(cfg.logging);

    std::string text = inline_text;
    if (!text_path.empty() && !read_text_file(text_path, text)) {
        std::cerr << "extract: cannot read text file: " << text_path << "\n";
        return 1;
    }
    if (text.empty()) {
        std::cerr << "extract: nothing to extract from (use --text <file> or --input <str>)\n";
        return 1;
    }

    auto extractors = build_extractors(cfg);
    if (extractors.empty()) {
        std::cerr << "extract: config enables no extractor (patterns, ner or replay)\n";
        return 1;
    }

    extract::ExtractParams params;
    if (!source_id.empty()) params.source_id = source_id;

    extract::CompositeExtractor composite(std::move(extractors), cfg.composite);
    extract::MergeResult result = composite.merge(text, params);

    print_collection(std::cout, result.collection);

    for (const auto& f : result.failures) {
        std::cerr << "warning: " << f.extractor << " failed: " << f.message << "\n";
    }
    for (const auto& c : result.id_conflicts) {
        std::cerr << "warning: " << c.extractor << ": entity id " << c.entity_id << " ("
                  << c.name << ", " << c.type << ") already taken, stored as " << c.reissued_id << "\n";
    }

    if (!out_path.empty()) {
        try {
            io::save_collection(fs::path(out_path), result.collection);
        } catch (const std::exception& e) {
            std::cerr << "extract: " << e.what() << "\n";
            return 1;
        }
        std::cout << "\nSaved collection to " << out_path << "\n";
    }

    logging::shutdown();
    return 0;
}
