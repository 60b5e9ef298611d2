#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;
using ojson = nlohmann::ordered_json;

namespace io {

template <typename Json>
static Json parse_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }

    Json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON " + path.string() + ": " + e.what());
    }
    return j;
}

json read_json_file(const fs::path& path) {
    return parse_file<json>(path);
}

model::EntityCollection load_collection(const fs::path& path) {
    return model::EntityCollection::from_json(read_json_file(path));
}

void save_collection(const fs::path& path, const model::EntityCollection& collection) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    out << collection.to_json().dump(2) << "\n";
}

// ---------- config validation ----------

static const ojson* optional_object(const ojson& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    if (!it->is_object()) throw ConfigError(where + "." + key + " must be an object");
    return &*it;
}

static void read_string(const ojson& j, const char* key, const std::string& where, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw ConfigError(where + "." + key + " must be a string");
    out = it->get<std::string>();
}

static void read_number(const ojson& j, const char* key, const std::string& where, double& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number()) throw ConfigError(where + "." + key + " must be a number");
    out = it->get<double>();
}

static void read_size(const ojson& j, const char* key, const std::string& where, size_t& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw ConfigError(where + "." + key + " must be a non-negative integer");
    }
    out = it->get<size_t>();
}

static void read_bool(const ojson& j, const char* key, const std::string& where, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) throw ConfigError(where + "." + key + " must be a boolean");
    out = it->get<bool>();
}

static std::vector<std::string> require_string_array(const ojson& arr, const std::string& where) {
    if (!arr.is_array()) throw ConfigError(where + " must be an array");

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw ConfigError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static extract::PatternConfig parse_patterns(const ojson& patterns, const ojson* tuning) {
    extract::PatternConfig pc;
    for (auto it = patterns.begin(); it != patterns.end(); ++it) {
        pc.patterns.push_back({it.key(), require_string_array(it.value(), "root.patterns." + it.key())});
    }

    if (tuning) {
        const std::string where = "root.pattern";
        read_number(*tuning, "base_confidence", where, pc.base_confidence);
        read_string(*tuning, "relation_type", where, pc.relation_type);
        read_number(*tuning, "relation_strength", where, pc.relation_strength);
        read_size(*tuning, "context_window", where, pc.context_window);
        read_bool(*tuning, "whole_words", where, pc.whole_words);
    }
    return pc;
}

static void parse_ner(const ojson& j, ExtractorConfig& cfg) {
    const std::string where = "root.ner";

    NerModelSettings m;
    read_string(j, "model", where, m.model_path);
    read_string(j, "vocab", where, m.vocab_path);
    if (m.model_path.empty()) throw ConfigError(where + " missing required field: model");
    if (m.vocab_path.empty()) throw ConfigError(where + " missing required field: vocab");

    if (j.contains("labels")) m.labels = require_string_array(j.at("labels"), where + ".labels");
    read_size(j, "max_len", where, m.max_len);
    if (m.max_len < 2) throw ConfigError(where + ".max_len must be at least 2");
    read_bool(j, "lowercase", where, m.lowercase);

    size_t threads = (size_t)m.threads;
    read_size(j, "threads", where, threads);
    m.threads = (int)threads;

    read_number(j, "min_confidence", where, cfg.ner.min_confidence);
    read_size(j, "context_window", where, cfg.ner.context_window);
    read_number(j, "relation_strength", where, cfg.ner.relation_strength);

    if (const ojson* mapping = optional_object(j, "type_mapping", where)) {
        cfg.ner.type_mapping.clear();
        for (auto it = mapping->begin(); it != mapping->end(); ++it) {
            if (!it.value().is_string()) throw ConfigError(where + ".type_mapping." + it.key() + " must be a string");
            cfg.ner.type_mapping[it.key()] = it.value().get<std::string>();
        }
    }

    cfg.ner_model = std::move(m);
}

ExtractorConfig parse_extractor_config(const ojson& j) {
    if (!j.is_object()) throw ConfigError("root must be an object");

    ExtractorConfig cfg;

    if (const ojson* lg = optional_object(j, "logging", "root")) {
        read_string(*lg, "level", "root.logging", cfg.logging.level);
        read_string(*lg, "pattern", "root.logging", cfg.logging.pattern);
    }

    if (const ojson* patterns = optional_object(j, "patterns", "root")) {
        cfg.pattern = parse_patterns(*patterns, optional_object(j, "pattern", "root"));
    }

    if (const ojson* ner = optional_object(j, "ner", "root")) {
        parse_ner(*ner, cfg);
    }

    if (const ojson* replay = optional_object(j, "replay", "root")) {
        read_string(*replay, "dir", "root.replay", cfg.replay_dir);
    }

    if (const ojson* composite = optional_object(j, "composite", "root")) {
        read_bool(*composite, "parallel", "root.composite", cfg.composite.parallel);
    }

    return cfg;
}

ExtractorConfig load_extractor_config(const fs::path& path) {
    return parse_extractor_config(parse_file<ojson>(path));
}

} // namespace io
