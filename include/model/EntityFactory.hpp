#pragma once

#include <cstddef>
#include <string>

#include "model/Entity.hpp"

namespace model {

// The only place ids are minted. Both stamp metadata.created_at when absent.

Entity create_entity(const std::string& name,
                     const std::string& type,
                     const std::string& source_text,
                     std::size_t start_position,
                     std::size_t end_position,
                     double confidence,
                     Metadata metadata = Metadata::object());

Relationship create_relationship(const std::string& source_entity,
                                 const std::string& target_entity,
                                 const std::string& type,
                                 double confidence,
                                 Metadata metadata = Metadata::object());

// Same record under a freshly minted id, for an entity whose id is already
// taken by a different record in the collection it is joining.
Entity reissue_entity(Entity entity);

} // namespace model
