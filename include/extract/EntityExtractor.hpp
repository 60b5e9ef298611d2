#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "model/EntityCollection.hpp"
#include "nlohmann/json.hpp"

namespace extract {

// Per-call parameters, forwarded verbatim to every capability of a composite.
struct ExtractParams {
    std::optional<std::string> source_id;            // text/message the extraction is about
    // per-call knobs; a capability reads the keys it knows ("min_confidence" for NER)
    nlohmann::json options = nlohmann::json::object();

    // source_id or "unknown", for provenance records
    std::string source_or_unknown() const { return source_id ? *source_id : "unknown"; }
};

// A capability could not produce a collection (model unavailable, bad input...).
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
  One extraction capability: text -> EntityCollection.

  Implementations must be pure with respect to their inputs (same text and
  params give equivalent entities, modulo fresh ids) and report failure by
  throwing.
*/
class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;

    // Recorded as "extractor" in observations and in merge diagnostics.
    virtual std::string name() const = 0;

    virtual model::EntityCollection extract_entities(const std::string& text,
                                                     const ExtractParams& params) const = 0;
};

class NullEntityExtractor final : public EntityExtractor {
public:
    std::string name() const override { return "NullEntityExtractor"; }
    model::EntityCollection extract_entities(const std::string&, const ExtractParams& params) const override {
        return model::EntityCollection(params.source_id);
    }
};

} // namespace extract
