#pragma once

#include <string>

#include "model/Entity.hpp"

namespace model {

// Provenance ledger. The only writers of metadata["observations"].
// Each call appends one record; existing records are never touched.

// {timestamp, source, extractor, context:{before, exact, after},
//  position:{start, end}, confidence}
void record_entity_observation(Entity& entity,
                               const std::string& source,
                               const std::string& context_before = "",
                               const std::string& context_after = "",
                               const std::string& extractor = "unknown");

// {timestamp, source, extractor, context, confidence}
void record_relationship_observation(Relationship& relationship,
                                     const std::string& source,
                                     const std::string& context = "",
                                     const std::string& extractor = "unknown");

// Number of recorded observations (0 when none or malformed).
std::size_t observation_count(const Metadata& metadata);

} // namespace model
