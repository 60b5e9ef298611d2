#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/Entity.hpp"
#include "nlohmann/json.hpp"

namespace model {

// A relationship whose endpoint ids do not resolve inside its collection.
struct DanglingReference {
    std::string relationship_id;
    bool source_missing = false;
    bool target_missing = false;
};

/*
  Entities and relationships extracted from one source text.

  Owns its records by value. Sequences keep insertion order; lookups by id are
  O(1) through indexes maintained on every add. Records are never removed.
*/
class EntityCollection {
public:
    EntityCollection() = default;
    explicit EntityCollection(std::optional<std::string> source_id);

    // Throws std::invalid_argument if the id is already present.
    void add_entity(Entity entity);
    // Always appends. Relationships accumulate, so an id may occur more than once;
    // get_relationship_by_id returns the first.
    void add_relationship(Relationship relationship);

    // nullptr when absent. The mutable overload is for in-place updates of
    // confidence and metadata; id, name and type are indexed and must not change.
    const Entity* get_entity_by_id(const std::string& id) const;
    Entity* get_entity_by_id(const std::string& id);

    const Relationship* get_relationship_by_id(const std::string& id) const;

    std::vector<const Entity*> get_entities_by_type(const std::string& type) const;
    std::vector<const Relationship*> get_relationships_by_type(const std::string& type) const;

    // Relationships with the entity as source or target, each once.
    std::vector<const Relationship*> get_relationships_for_entity(const std::string& entity_id) const;

    // Integrity check: every relationship with a missing endpoint. Never throws.
    std::vector<DanglingReference> find_dangling_relationships() const;

    const std::vector<Entity>& entities() const { return m_entities; }
    const std::vector<Relationship>& relationships() const { return m_relationships; }

    const std::optional<std::string>& source_id() const { return m_source_id; }
    void set_source_id(std::optional<std::string> source_id) { m_source_id = std::move(source_id); }

    bool empty() const { return m_entities.empty() && m_relationships.empty(); }

    // {entities: [...], relationships: [...], source_id: string|null}
    nlohmann::json to_json() const;

    // All-or-nothing: throws SerializationError on the first malformed field.
    static EntityCollection from_json(const nlohmann::json& j);

private:
    std::vector<Entity> m_entities;
    std::vector<Relationship> m_relationships;
    std::optional<std::string> m_source_id;

    std::unordered_map<std::string, std::size_t> m_entity_index;
    std::unordered_map<std::string, std::size_t> m_relationship_index;
    std::unordered_map<std::string, std::vector<std::size_t>> m_entities_by_type;
    std::unordered_map<std::string, std::vector<std::size_t>> m_relationships_by_type;
    std::unordered_map<std::string, std::vector<std::size_t>> m_relationships_by_entity;
};

} // namespace model
