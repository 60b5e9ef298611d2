#pragma once

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

namespace model {

// Open metadata bag: null / bool / number / string / array / object, nested freely.
using Metadata = nlohmann::json;

struct Entity {
    std::string id;             // minted by EntityFactory, never reassigned
    std::string name;
    std::string type;           // open-ended category tag, e.g. "Person"
    std::string source_text;    // exact mention text
    std::size_t start_position = 0;
    std::size_t end_position = 0;
    double confidence = 0.0;    // 0..1
    Metadata metadata = Metadata::object();

    nlohmann::json to_json() const;
    static Entity from_json(const nlohmann::json& j, const std::string& where = "entity");
};

struct Relationship {
    std::string id;
    std::string source_entity;  // Entity id
    std::string target_entity;  // Entity id
    std::string type;
    double confidence = 0.0;
    Metadata metadata = Metadata::object();

    nlohmann::json to_json() const;
    static Relationship from_json(const nlohmann::json& j, const std::string& where = "relationship");
};

// Key-wise union of `from` into `into`:
// - array + array: elements of `from` are appended
// - object + object: merged recursively
// - anything else: `from` wins, except an existing "created_at"
// A non-object `into` is replaced by `from`.
void merge_metadata(Metadata& into, const Metadata& from);

} // namespace model
