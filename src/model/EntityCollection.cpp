#include "model/EntityCollection.hpp"
#include "model/Errors.hpp"

#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace model {

EntityCollection::EntityCollection(std::optional<std::string> source_id)
    : m_source_id(std::move(source_id)) {}

void EntityCollection::add_entity(Entity entity) {
    const std::size_t idx = m_entities.size();
    if (!m_entity_index.emplace(entity.id, idx).second) {
        throw std::invalid_argument("duplicate entity id: " + entity.id);
    }
    m_entities_by_type[entity.type].push_back(idx);
    m_entities.push_back(std::move(entity));
}

void EntityCollection::add_relationship(Relationship relationship) {
    const std::size_t idx = m_relationships.size();
    // a relationship id may repeat after merges; the index keeps the first
    m_relationship_index.emplace(relationship.id, idx);
    m_relationships_by_type[relationship.type].push_back(idx);
    m_relationships_by_entity[relationship.source_entity].push_back(idx);
    if (relationship.target_entity != relationship.source_entity) {
        m_relationships_by_entity[relationship.target_entity].push_back(idx);
    }
    m_relationships.push_back(std::move(relationship));
}

const Entity* EntityCollection::get_entity_by_id(const std::string& id) const {
    auto it = m_entity_index.find(id);
    return it == m_entity_index.end() ? nullptr : &m_entities[it->second];
}

Entity* EntityCollection::get_entity_by_id(const std::string& id) {
    auto it = m_entity_index.find(id);
    return it == m_entity_index.end() ? nullptr : &m_entities[it->second];
}

const Relationship* EntityCollection::get_relationship_by_id(const std::string& id) const {
    auto it = m_relationship_index.find(id);
    return it == m_relationship_index.end() ? nullptr : &m_relationships[it->second];
}

std::vector<const Entity*> EntityCollection::get_entities_by_type(const std::string& type) const {
    std::vector<const Entity*> out;
    auto it = m_entities_by_type.find(type);
    if (it == m_entities_by_type.end()) return out;

    out.reserve(it->second.size());
    for (std::size_t idx : it->second) out.push_back(&m_entities[idx]);
    return out;
}

std::vector<const Relationship*> EntityCollection::get_relationships_by_type(const std::string& type) const {
    std::vector<const Relationship*> out;
    auto it = m_relationships_by_type.find(type);
    if (it == m_relationships_by_type.end()) return out;

    out.reserve(it->second.size());
    for (std::size_t idx : it->second) out.push_back(&m_relationships[idx]);
    return out;
}

std::vector<const Relationship*> EntityCollection::get_relationships_for_entity(const std::string& entity_id) const {
    std::vector<const Relationship*> out;
    auto it = m_relationships_by_entity.find(entity_id);
    if (it == m_relationships_by_entity.end()) return out;

    out.reserve(it->second.size());
    for (std::size_t idx : it->second) out.push_back(&m_relationships[idx]);
    return out;
}

std::vector<DanglingReference> EntityCollection::find_dangling_relationships() const {
    std::vector<DanglingReference> out;
    for (const auto& r : m_relationships) {
        DanglingReference d;
        d.relationship_id = r.id;
        d.source_missing = m_entity_index.find(r.source_entity) == m_entity_index.end();
        d.target_missing = m_entity_index.find(r.target_entity) == m_entity_index.end();
        if (d.source_missing || d.target_missing) out.push_back(std::move(d));
    }
    return out;
}

json EntityCollection::to_json() const {
    json entities = json::array();
    for (const auto& e : m_entities) entities.push_back(e.to_json());

    json relationships = json::array();
    for (const auto& r : m_relationships) relationships.push_back(r.to_json());

    json j;
    j["entities"] = std::move(entities);
    j["relationships"] = std::move(relationships);
    j["source_id"] = m_source_id ? json(*m_source_id) : json(nullptr);
    return j;
}

static const json* optional_array(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        throw SerializationError("root." + std::string(key) + " must be an array");
    }
    return &*it;
}

EntityCollection EntityCollection::from_json(const json& j) {
    if (!j.is_object()) {
        throw SerializationError("root must be an object");
    }

    std::optional<std::string> source_id;
    auto sid = j.find("source_id");
    if (sid != j.end() && !sid->is_null()) {
        if (!sid->is_string()) throw SerializationError("root.source_id must be a string or null");
        source_id = sid->get<std::string>();
    }

    // built locally, handed out only when every record decoded
    EntityCollection c(std::move(source_id));

    if (const json* entities = optional_array(j, "entities")) {
        for (std::size_t i = 0; i < entities->size(); ++i) {
            std::ostringstream where;
            where << "root.entities[" << i << "]";
            Entity e = Entity::from_json(entities->at(i), where.str());
            if (c.get_entity_by_id(e.id)) {
                throw SerializationError(where.str() + " duplicate id: " + e.id);
            }
            c.add_entity(std::move(e));
        }
    }

    if (const json* relationships = optional_array(j, "relationships")) {
        for (std::size_t i = 0; i < relationships->size(); ++i) {
            std::ostringstream where;
            where << "root.relationships[" << i << "]";
            c.add_relationship(Relationship::from_json(relationships->at(i), where.str()));
        }
    }

    return c;
}

} // namespace model
