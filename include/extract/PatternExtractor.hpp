#pragma once
#include <string>
#include <utility>
#include <vector>

#include "extract/EntityExtractor.hpp"

namespace extract {

struct PatternConfig {
    // ordered (entity type, literal patterns); order decides entity order
    std::vector<std::pair<std::string, std::vector<std::string>>> patterns;

    double base_confidence = 0.8;
    std::string relation_type = "relatesTo";
    // 0.7 for two single-mention entities at the default base confidence
    double relation_strength = 0.875;
    size_t context_window = 50;
    bool whole_words = false;  // reject matches glued to letters/digits
};

/*
  Literal pattern matching.

  Each (pattern, type) found in the text becomes one entity anchored at its
  first occurrence; every occurrence is recorded as an observation and repeat
  mentions raise the confidence. Entities of the same type are then linked
  pairwise with `relation_type`.
*/
class PatternExtractor final : public EntityExtractor {
public:
    explicit PatternExtractor(PatternConfig cfg);

    std::string name() const override { return "PatternExtractor"; }

    model::EntityCollection extract_entities(const std::string& text,
                                             const ExtractParams& params) const override;

private:
    PatternConfig m_cfg;

    std::vector<size_t> find_occurrences(const std::string& text, const std::string& pattern) const;
};

} // namespace extract
