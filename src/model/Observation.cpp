#include "model/Observation.hpp"
#include "util/Time.hpp"

namespace model {

static nlohmann::json& observations_of(Metadata& metadata) {
    if (!metadata.is_object()) metadata = Metadata::object();

    auto it = metadata.find("observations");
    if (it == metadata.end()) {
        metadata["observations"] = nlohmann::json::array();
    } else if (!it->is_array()) {
        // keep whatever was there as the first record
        nlohmann::json wrapped = nlohmann::json::array();
        wrapped.push_back(std::move(*it));
        *it = std::move(wrapped);
    }
    return metadata["observations"];
}

void record_entity_observation(Entity& entity,
                               const std::string& source,
                               const std::string& context_before,
                               const std::string& context_after,
                               const std::string& extractor) {
    nlohmann::json observation = {
        {"timestamp", util::iso_now()},
        {"source", source},
        {"extractor", extractor},
        {"context", {
            {"before", context_before},
            {"exact", entity.source_text},
            {"after", context_after},
        }},
        {"position", {
            {"start", entity.start_position},
            {"end", entity.end_position},
        }},
        {"confidence", entity.confidence},
    };
    observations_of(entity.metadata).push_back(std::move(observation));
}

void record_relationship_observation(Relationship& relationship,
                                     const std::string& source,
                                     const std::string& context,
                                     const std::string& extractor) {
    nlohmann::json observation = {
        {"timestamp", util::iso_now()},
        {"source", source},
        {"extractor", extractor},
        {"context", context},
        {"confidence", relationship.confidence},
    };
    observations_of(relationship.metadata).push_back(std::move(observation));
}

std::size_t observation_count(const Metadata& metadata) {
    if (!metadata.is_object()) return 0;
    auto it = metadata.find("observations");
    if (it == metadata.end() || !it->is_array()) return 0;
    return it->size();
}

} // namespace model
