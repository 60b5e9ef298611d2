#include "extract/CompositeExtractor.hpp"
#include "model/EntityFactory.hpp"
#include "util/Logging.hpp"

#include <exception>
#include <future>
#include <unordered_map>
#include <utility>
#include <vector>

namespace extract {

namespace {

// Dedup key index over a result collection: (name, type) -> entity id.
class Merger {
public:
    explicit Merger(model::EntityCollection& result) : m_result(result) {
        for (const auto& e : m_result.entities()) m_by_key.emplace(key_of(e), e.id);
    }

    void fold(const model::EntityCollection& part, const std::string& origin) {
        m_renamed.clear();
        for (const auto& entity : part.entities()) fold_entity(entity, origin);
        for (const auto& rel : part.relationships()) fold_relationship(rel);
    }

    std::vector<IdConflict> take_conflicts() { return std::move(m_conflicts); }

private:
    model::EntityCollection& m_result;
    std::unordered_map<std::string, std::string> m_by_key;
    // ids of the current part -> id the record has in the result
    std::unordered_map<std::string, std::string> m_renamed;
    std::vector<IdConflict> m_conflicts;

    static std::string key_of(const model::Entity& e) {
        // '\x1f' cannot collide with a plain name/type pair
        return e.name + '\x1f' + e.type;
    }

    void fold_entity(const model::Entity& entity, const std::string& origin) {
        auto it = m_by_key.find(key_of(entity));
        if (it != m_by_key.end()) {
            model::Entity* existing = m_result.get_entity_by_id(it->second);
            if (existing->id != entity.id) m_renamed[entity.id] = existing->id;

            // confirmation: confidence only rises, metadata is unioned
            if (entity.confidence > existing->confidence) existing->confidence = entity.confidence;
            model::merge_metadata(existing->metadata, entity.metadata);
            return;
        }

        if (!m_result.get_entity_by_id(entity.id)) {
            m_by_key.emplace(key_of(entity), entity.id);
            m_result.add_entity(entity);
            return;
        }

        // new key, taken id: keep the record under a fresh id
        model::Entity reissued = model::reissue_entity(entity);
        IdConflict conflict{origin, entity.id, reissued.id, entity.name, entity.type};
        EXTRACTOR_LOG_WARN("entity id already used by another record, reissued",
                           {logging::StringField("extractor", origin),
                            logging::StringField("entity_id", conflict.entity_id),
                            logging::StringField("reissued_id", conflict.reissued_id),
                            logging::StringField("name", conflict.name),
                            logging::StringField("type", conflict.type)});

        m_renamed[entity.id] = reissued.id;
        m_by_key.emplace(key_of(reissued), reissued.id);
        m_result.add_entity(std::move(reissued));
        m_conflicts.push_back(std::move(conflict));
    }

    void fold_relationship(const model::Relationship& rel) {
        if (m_renamed.empty()) {
            m_result.add_relationship(rel);
            return;
        }

        model::Relationship copy = rel;
        copy.source_entity = canonical(copy.source_entity);
        copy.target_entity = canonical(copy.target_entity);
        m_result.add_relationship(std::move(copy));
    }

    const std::string& canonical(const std::string& id) const {
        auto it = m_renamed.find(id);
        return it == m_renamed.end() ? id : it->second;
    }
};

std::string describe(std::exception_ptr ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace

CompositeExtractor::CompositeExtractor(std::vector<std::shared_ptr<const EntityExtractor>> extractors,
                                       CompositeOptions options)
    : m_extractors(std::move(extractors)), m_options(options) {}

model::EntityCollection CompositeExtractor::extract_entities(const std::string& text,
                                                             const ExtractParams& params) const {
    return merge(text, params).collection;
}

MergeResult CompositeExtractor::merge(const std::string& text, const ExtractParams& params) const {
    MergeResult out;
    out.collection.set_source_id(params.source_id);

    Merger merger(out.collection);

    auto record_failure = [&](const EntityExtractor& ex, std::exception_ptr ep) {
        CapabilityFailure f{ex.name(), describe(ep)};
        EXTRACTOR_LOG_WARN("extractor failed, contributing nothing",
                           {logging::StringField("extractor", f.extractor),
                            logging::StringField("source", params.source_or_unknown()),
                            logging::StringField("error", f.message)});
        out.failures.push_back(std::move(f));
    };

    if (m_options.parallel) {
        std::vector<std::future<model::EntityCollection>> pending;
        pending.reserve(m_extractors.size());
        for (const auto& ex : m_extractors) {
            const EntityExtractor* raw = ex.get();
            pending.push_back(std::async(std::launch::async, [raw, &text, &params]() {
                if (!raw) throw ExtractionError("null extractor");
                return raw->extract_entities(text, params);
            }));
        }

        // commit strictly in list order
        for (std::size_t i = 0; i < pending.size(); ++i) {
            if (!m_extractors[i]) {
                pending[i].wait();
                out.failures.push_back({"null", "null extractor"});
                continue;
            }

            model::EntityCollection part;
            try {
                part = pending[i].get();
            } catch (...) {
                record_failure(*m_extractors[i], std::current_exception());
                continue;
            }
            merger.fold(part, m_extractors[i]->name());
        }
    } else {
        for (const auto& ex : m_extractors) {
            if (!ex) {
                out.failures.push_back({"null", "null extractor"});
                continue;
            }

            model::EntityCollection part;
            try {
                part = ex->extract_entities(text, params);
            } catch (...) {
                record_failure(*ex, std::current_exception());
                continue;
            }
            merger.fold(part, ex->name());
        }
    }
    out.id_conflicts = merger.take_conflicts();

    EXTRACTOR_LOG_DEBUG("merge complete",
                        {logging::IntField("extractors", static_cast<std::int64_t>(m_extractors.size())),
                         logging::BoolField("parallel", m_options.parallel),
                         logging::IntField("entities", static_cast<std::int64_t>(out.collection.entities().size())),
                         logging::IntField("relationships", static_cast<std::int64_t>(out.collection.relationships().size())),
                         logging::IntField("failures", static_cast<std::int64_t>(out.failures.size())),
                         logging::IntField("id_conflicts", static_cast<std::int64_t>(out.id_conflicts.size()))});
    return out;
}

std::vector<IdConflict> merge_into(model::EntityCollection& result,
                                   const model::EntityCollection& part,
                                   const std::string& origin) {
    Merger merger(result);
    merger.fold(part, origin);
    return merger.take_conflicts();
}

} // namespace extract
