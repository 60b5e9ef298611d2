#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "extract/CompositeExtractor.hpp"
#include "extract/NerExtractor.hpp"
#include "extract/PatternExtractor.hpp"
#include "model/EntityCollection.hpp"
#include "nlohmann/json.hpp"
#include "util/Logging.hpp"

namespace io {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Throws std::runtime_error when unreadable / not JSON.
nlohmann::json read_json_file(const std::filesystem::path& path);

// Throws std::runtime_error (unreadable) or model::SerializationError (bad content).
model::EntityCollection load_collection(const std::filesystem::path& path);

// Pretty printed, parent directories created.
void save_collection(const std::filesystem::path& path, const model::EntityCollection& collection);

// Paths and model shape for the ONNX NER capability.
struct NerModelSettings {
    std::string model_path;
    std::string vocab_path;
    std::vector<std::string> labels;  // empty = CoNLL-2003
    size_t max_len = 512;
    bool lowercase = false;
    int threads = 1;
};

struct ExtractorConfig {
    logging::LoggingConfig logging;
    std::optional<extract::PatternConfig> pattern;
    std::optional<NerModelSettings> ner_model;
    extract::NerConfig ner;
    std::string replay_dir;  // empty = no replay capability
    extract::CompositeOptions composite;
};

/*
  {
    "logging":   {"level": "info", "pattern": "..."},
    "patterns":  {"Person": ["Omar", "Alice"], "Organization": ["Acme"]},
    "pattern":   {"base_confidence": 0.8, "relation_type": "relatesTo",
                  "relation_strength": 0.875, "context_window": 50, "whole_words": false},
    "ner":       {"model": "ner.onnx", "vocab": "vocab.txt", "labels": [...], "max_len": 512,
                  "lowercase": false, "threads": 1, "min_confidence": 0.5,
                  "context_window": 50, "relation_strength": 0.7, "type_mapping": {"PER": "Person"}},
    "replay":    {"dir": "out/extractions"},
    "composite": {"parallel": false}
  }
  Every section is optional. Key order of "patterns" is kept.
*/
ExtractorConfig parse_extractor_config(const nlohmann::ordered_json& j);
ExtractorConfig load_extractor_config(const std::filesystem::path& path);

} // namespace io
