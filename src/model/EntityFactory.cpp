#include "model/EntityFactory.hpp"
#include "model/Confidence.hpp"
#include "util/Time.hpp"
#include "util/Uuid.hpp"

#include <stdexcept>

namespace model {

static void stamp_created_at(Metadata& metadata) {
    if (!metadata.is_object()) metadata = Metadata::object();
    if (!metadata.contains("created_at")) metadata["created_at"] = util::iso_now();
}

Entity create_entity(const std::string& name,
                     const std::string& type,
                     const std::string& source_text,
                     std::size_t start_position,
                     std::size_t end_position,
                     double confidence,
                     Metadata metadata) {
    if (start_position > end_position) {
        throw std::invalid_argument("entity '" + name + "' starts after it ends");
    }
    stamp_created_at(metadata);

    Entity e;
    e.id = util::new_id();
    e.name = name;
    e.type = type;
    e.source_text = source_text;
    e.start_position = start_position;
    e.end_position = end_position;
    e.confidence = clamp_confidence(confidence);
    e.metadata = std::move(metadata);
    return e;
}

Relationship create_relationship(const std::string& source_entity,
                                 const std::string& target_entity,
                                 const std::string& type,
                                 double confidence,
                                 Metadata metadata) {
    stamp_created_at(metadata);

    Relationship r;
    r.id = util::new_id();
    r.source_entity = source_entity;
    r.target_entity = target_entity;
    r.type = type;
    r.confidence = clamp_confidence(confidence);
    r.metadata = std::move(metadata);
    return r;
}

Entity reissue_entity(Entity entity) {
    entity.id = util::new_id();
    return entity;
}

} // namespace model
