#include "model/Entity.hpp"
#include "model/Errors.hpp"

#include <cstdint>
#include <sstream>

using json = nlohmann::json;

namespace model {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw SerializationError(where + " must be an object");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw SerializationError(where + " missing required field: " + std::string(key));
    }
    return *it;
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw SerializationError(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static std::size_t require_position(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (v.is_number_unsigned()) return v.get<std::size_t>();
    if (!v.is_number_integer()) {
        throw SerializationError(where + "." + std::string(key) + " must be an integer");
    }
    if (v.get<std::int64_t>() < 0) {
        throw SerializationError(where + "." + std::string(key) + " must not be negative");
    }
    return static_cast<std::size_t>(v.get<std::int64_t>());
}

static double require_confidence(const json& j, const std::string& where) {
    const json& v = require_field(j, "confidence", where);
    if (!v.is_number()) {
        throw SerializationError(where + ".confidence must be a number");
    }
    double c = v.get<double>();
    if (!(c >= 0.0 && c <= 1.0)) {
        std::ostringstream oss;
        oss << where << ".confidence out of range [0,1]: " << c;
        throw SerializationError(oss.str());
    }
    return c;
}

static Metadata optional_metadata(const json& j, const std::string& where) {
    auto it = j.find("metadata");
    if (it == j.end() || it->is_null()) return Metadata::object();
    if (!it->is_object()) {
        throw SerializationError(where + ".metadata must be an object");
    }
    return *it;
}

json Entity::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"type", type},
        {"source_text", source_text},
        {"start_position", start_position},
        {"end_position", end_position},
        {"confidence", confidence},
        {"metadata", metadata},
    };
}

Entity Entity::from_json(const json& j, const std::string& where) {
    require_object(j, where);

    Entity e;
    e.id             = require_string(j, "id", where);
    e.name           = require_string(j, "name", where);
    e.type           = require_string(j, "type", where);
    e.source_text    = require_string(j, "source_text", where);
    e.start_position = require_position(j, "start_position", where);
    e.end_position   = require_position(j, "end_position", where);
    e.confidence     = require_confidence(j, where);
    e.metadata       = optional_metadata(j, where);

    if (e.start_position > e.end_position) {
        throw SerializationError(where + " start_position is after end_position");
    }
    return e;
}

json Relationship::to_json() const {
    return {
        {"id", id},
        {"source_entity", source_entity},
        {"target_entity", target_entity},
        {"type", type},
        {"confidence", confidence},
        {"metadata", metadata},
    };
}

Relationship Relationship::from_json(const json& j, const std::string& where) {
    require_object(j, where);

    Relationship r;
    r.id            = require_string(j, "id", where);
    r.source_entity = require_string(j, "source_entity", where);
    r.target_entity = require_string(j, "target_entity", where);
    r.type          = require_string(j, "type", where);
    r.confidence    = require_confidence(j, where);
    r.metadata      = optional_metadata(j, where);
    return r;
}

void merge_metadata(Metadata& into, const Metadata& from) {
    if (!from.is_object()) return;
    if (!into.is_object()) {
        into = from;
        return;
    }

    for (auto it = from.begin(); it != from.end(); ++it) {
        auto existing = into.find(it.key());
        if (existing == into.end()) {
            into[it.key()] = it.value();
            continue;
        }

        if (existing->is_array() && it.value().is_array()) {
            for (const auto& v : it.value()) existing->push_back(v);
        } else if (existing->is_object() && it.value().is_object()) {
            merge_metadata(*existing, it.value());
        } else if (it.key() == "created_at") {
            continue;
        } else {
            *existing = it.value();
        }
    }
}

} // namespace model
