#pragma once
#include <string>
#include <vector>

#include "text/TextUtil.hpp"

namespace extract {

// subject -[type]-> object, found around a verb cue inside one sentence
struct CueRelation {
    size_t subject = 0;   // index into the mentions passed in
    size_t object = 0;
    std::string type;     // uses | worksOn | has | dependsOn | creates
    std::string verb;     // the cue as written
    textutil::TextSpan sentence;
};

// Relationship type for a verb form ("built" -> "creates"), or "" if not a cue.
std::string relation_type_for_verb(const std::string& word);

/*
  Verb-mediated relationships between entity mentions.

  For each sentence, the first cue verb that has a mention before it and one
  after it links the nearest mention on its left (subject) to the nearest on
  its right (object). At most one relation per sentence; words inside a
  mention are never cues.
*/
std::vector<CueRelation> find_cue_relations(const std::string& text,
                                            const std::vector<textutil::TextSpan>& mentions);

} // namespace extract
