#include "extract/PatternExtractor.hpp"
#include "model/Confidence.hpp"
#include "model/EntityFactory.hpp"
#include "model/Observation.hpp"
#include "text/TextUtil.hpp"
#include "util/Logging.hpp"

#include <unordered_set>

namespace extract {

PatternExtractor::PatternExtractor(PatternConfig cfg) : m_cfg(std::move(cfg)) {}

std::vector<size_t> PatternExtractor::find_occurrences(const std::string& text, const std::string& pattern) const {
    std::vector<size_t> hits;
    if (pattern.empty()) return hits;

    size_t from = 0;
    while (true) {
        size_t idx = text.find(pattern, from);
        if (idx == std::string::npos) break;

        if (!m_cfg.whole_words || textutil::is_word_boundary(text, idx, idx + pattern.size())) {
            hits.push_back(idx);
            from = idx + pattern.size();
        } else {
            from = idx + 1;
        }
    }
    return hits;
}

model::EntityCollection PatternExtractor::extract_entities(const std::string& text,
                                                           const ExtractParams& params) const {
    model::EntityCollection collection(params.source_id);
    const std::string source = params.source_or_unknown();

    // entity ids per type, in creation order, for the pairwise pass
    std::vector<std::pair<std::string, std::vector<std::string>>> ids_by_type;

    for (const auto& [type, patterns] : m_cfg.patterns) {
        std::vector<std::string> ids;
        std::unordered_set<std::string> seen;

        for (const auto& pattern : patterns) {
            if (!seen.insert(pattern).second) continue;

            auto hits = find_occurrences(text, pattern);
            if (hits.empty()) continue;

            const double frequency = static_cast<double>(hits.size() - 1);
            const double confidence = model::entity_confidence(m_cfg.base_confidence, 1.0, frequency, 1.0);

            model::Entity entity = model::create_entity(pattern, type, pattern,
                                                        hits.front(), hits.front() + pattern.size(),
                                                        confidence, {{"extractor", name()}});

            for (size_t idx : hits) {
                // each observation carries the position of its own mention
                entity.start_position = idx;
                entity.end_position = idx + pattern.size();
                model::record_entity_observation(entity, source,
                                                 textutil::context_before(text, idx, m_cfg.context_window),
                                                 textutil::context_after(text, idx + pattern.size(), m_cfg.context_window),
                                                 name());
            }
            entity.start_position = hits.front();
            entity.end_position = hits.front() + pattern.size();

            ids.push_back(entity.id);
            collection.add_entity(std::move(entity));
        }

        if (!ids.empty()) ids_by_type.push_back({type, std::move(ids)});
    }

    for (const auto& [type, ids] : ids_by_type) {
        for (size_t i = 0; i + 1 < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                const model::Entity* a = collection.get_entity_by_id(ids[i]);
                const model::Entity* b = collection.get_entity_by_id(ids[j]);

                model::Relationship rel = model::create_relationship(
                    a->id, b->id, m_cfg.relation_type,
                    model::relationship_confidence(a->confidence, b->confidence, m_cfg.relation_strength),
                    {{"extractor", name()}});

                model::record_relationship_observation(rel, source, "Both entities are of type " + type, name());
                collection.add_relationship(std::move(rel));
            }
        }
    }

    EXTRACTOR_LOG_DEBUG("pattern extraction done",
                        {logging::StringField("source", source),
                         logging::IntField("entities", static_cast<std::int64_t>(collection.entities().size())),
                         logging::IntField("relationships", static_cast<std::int64_t>(collection.relationships().size()))});
    return collection;
}

} // namespace extract
