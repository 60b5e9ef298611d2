#pragma once
#include <map>
#include <memory>
#include <string>

#include "extract/EntityExtractor.hpp"
#include "extract/TokenClassifier.hpp"

namespace extract {

struct NerConfig {
    // model label -> entity type; labels not listed are dropped
    std::map<std::string, std::string> type_mapping = default_type_mapping();

    double min_confidence = 0.5;
    size_t context_window = 50;
    // strength of a verb-cue relationship before the weakest-link rule
    double relation_strength = 0.7;

    // CoNLL (PER/ORG/LOC/MISC) plus OntoNotes-style labels
    static std::map<std::string, std::string> default_type_mapping();
};

/*
  Model-based extraction: a TokenClassifier labels word pieces, spans are
  decoded from the labels, and verb cues between mentions give relationships.

  params.options["min_confidence"] overrides the configured floor for one call.
  Throws ExtractionError when the classifier is missing or not loaded.
*/
class NerExtractor final : public EntityExtractor {
public:
    NerExtractor(std::shared_ptr<const TokenClassifier> classifier, NerConfig cfg = {});

    std::string name() const override;

    model::EntityCollection extract_entities(const std::string& text,
                                             const ExtractParams& params) const override;

private:
    std::shared_ptr<const TokenClassifier> m_classifier;
    NerConfig m_cfg;

    // length of the mention in bytes, short mentions are less reliable
    static double length_factor(size_t length);
};

} // namespace extract
