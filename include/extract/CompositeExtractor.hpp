#pragma once

#include <memory>
#include <string>
#include <vector>

#include "extract/EntityExtractor.hpp"

namespace extract {

struct CompositeOptions {
    // Run capabilities concurrently. Results are still committed in list order,
    // so the merged collection is identical to a sequential run.
    bool parallel = false;
};

// A capability that threw during a merge; its contribution counted as empty.
struct CapabilityFailure {
    std::string extractor;
    std::string message;
};

// An incoming entity whose id was already taken by a different (name, type).
// It joins the result under `reissued_id`; its relationships follow it.
struct IdConflict {
    std::string extractor;
    std::string entity_id;
    std::string reissued_id;
    std::string name;
    std::string type;
};

struct MergeResult {
    model::EntityCollection collection;
    std::vector<CapabilityFailure> failures;
    std::vector<IdConflict> id_conflicts;
};

/*
  Runs every capability over the same text and merges their collections.

  Entities converge: a later entity with the same (name, type) as one already
  in the result confirms it instead of being added. The surviving record keeps
  its id, takes the higher confidence and unions the metadata (observations
  accumulate). Only (name, type) decides a duplicate, never the id.
  Relationships accumulate: every one is appended, duplicates included.
  Endpoints that named a dropped duplicate are pointed at the surviving record.

  Capability order decides which id survives for a duplicate.
*/
class CompositeExtractor final : public EntityExtractor {
public:
    explicit CompositeExtractor(std::vector<std::shared_ptr<const EntityExtractor>> extractors,
                                CompositeOptions options = {});

    std::string name() const override { return "CompositeExtractor"; }

    model::EntityCollection extract_entities(const std::string& text,
                                             const ExtractParams& params) const override;

    MergeResult merge(const std::string& text, const ExtractParams& params) const;

private:
    std::vector<std::shared_ptr<const EntityExtractor>> m_extractors;
    CompositeOptions m_options;
};

// Folds `part` into `result`. The merge step of CompositeExtractor, usable on
// collections obtained elsewhere. `origin` names the part in diagnostics.
std::vector<IdConflict> merge_into(model::EntityCollection& result,
                                   const model::EntityCollection& part,
                                   const std::string& origin = "merge");

} // namespace extract
