#include "extract/NerExtractor.hpp"
#include "extract/RelationCues.hpp"
#include "model/Confidence.hpp"
#include "model/EntityFactory.hpp"
#include "model/Observation.hpp"
#include "text/TextUtil.hpp"
#include "util/Logging.hpp"

#include <algorithm>

namespace extract {

std::map<std::string, std::string> NerConfig::default_type_mapping() {
    return {
        {"PER", "Person"},
        {"PERSON", "Person"},
        {"ORG", "Organization"},
        {"LOC", "Location"},
        {"GPE", "Location"},
        {"MISC", "Miscellaneous"},
        {"PRODUCT", "Product"},
        {"EVENT", "Event"},
        {"WORK_OF_ART", "CreativeWork"},
        {"LAW", "Resource"},
        {"LANGUAGE", "Technology"},
        {"DATE", "Time"},
        {"TIME", "Time"},
        {"MONEY", "Value"},
        {"QUANTITY", "Value"},
        {"PERCENT", "Value"},
        {"CARDINAL", "Value"},
        {"ORDINAL", "Value"},
    };
}

NerExtractor::NerExtractor(std::shared_ptr<const TokenClassifier> classifier, NerConfig cfg)
    : m_classifier(std::move(classifier)), m_cfg(std::move(cfg)) {}

std::string NerExtractor::name() const {
    return "NerExtractor(" + (m_classifier ? m_classifier->model_name() : std::string("none")) + ")";
}

double NerExtractor::length_factor(size_t length) {
    return std::min(1.0, std::max(0.7, (double)length / 5.0));
}

model::EntityCollection NerExtractor::extract_entities(const std::string& text,
                                                       const ExtractParams& params) const {
    if (!m_classifier || !m_classifier->ready()) {
        throw ExtractionError(name() + ": token classifier is not loaded");
    }

    double min_confidence = m_cfg.min_confidence;
    auto opt = params.options.find("min_confidence");
    if (opt != params.options.end()) {
        if (!opt->is_number()) throw ExtractionError(name() + ": options.min_confidence must be a number");
        min_confidence = opt->get<double>();
    }

    model::EntityCollection collection(params.source_id);
    const std::string source = params.source_or_unknown();
    const std::string extractor = name();

    auto spans = decode_bio(m_classifier->classify(text));

    std::vector<std::string> ids;
    std::vector<textutil::TextSpan> mentions;

    for (const auto& span : spans) {
        auto mapped = m_cfg.type_mapping.find(span.label);
        if (mapped == m_cfg.type_mapping.end()) continue;
        if (span.end > text.size() || span.start >= span.end) continue;

        const std::string mention = text.substr(span.start, span.end - span.start);
        const double confidence = model::entity_confidence(span.score, length_factor(mention.size()), 0.0, 1.0);
        if (confidence < min_confidence) continue;

        model::Entity entity = model::create_entity(mention, mapped->second, mention,
                                                    span.start, span.end, confidence,
                                                    {{"ner_label", span.label}});
        model::record_entity_observation(entity, source,
                                         textutil::clipped_context_before(text, span.start, m_cfg.context_window),
                                         textutil::clipped_context_after(text, span.end, m_cfg.context_window),
                                         extractor);

        ids.push_back(entity.id);
        mentions.push_back({span.start, span.end});
        collection.add_entity(std::move(entity));
    }

    for (const auto& cue : find_cue_relations(text, mentions)) {
        const model::Entity* subject = collection.get_entity_by_id(ids[cue.subject]);
        const model::Entity* object = collection.get_entity_by_id(ids[cue.object]);
        const std::string sentence = text.substr(cue.sentence.start, cue.sentence.end - cue.sentence.start);

        model::Relationship rel = model::create_relationship(
            subject->id, object->id, cue.type,
            model::relationship_confidence(subject->confidence, object->confidence, m_cfg.relation_strength),
            {{"verb", cue.verb}, {"sentence", sentence}});
        model::record_relationship_observation(rel, source, sentence, extractor);
        collection.add_relationship(std::move(rel));
    }

    EXTRACTOR_LOG_DEBUG("ner extraction done",
                        {logging::StringField("extractor", extractor),
                         logging::StringField("source", source),
                         logging::DoubleField("min_confidence", min_confidence),
                         logging::IntField("spans", static_cast<std::int64_t>(spans.size())),
                         logging::IntField("entities", static_cast<std::int64_t>(collection.entities().size())),
                         logging::IntField("relationships", static_cast<std::int64_t>(collection.relationships().size()))});
    return collection;
}

} // namespace extract
