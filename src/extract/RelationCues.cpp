#include "extract/RelationCues.hpp"

#include <unordered_map>

namespace extract {

std::string relation_type_for_verb(const std::string& word) {
    static const std::unordered_map<std::string, std::string> cues = {
        {"use", "uses"}, {"uses", "uses"}, {"used", "uses"}, {"using", "uses"},
        {"utilize", "uses"}, {"utilizes", "uses"}, {"utilized", "uses"}, {"utilizing", "uses"},
        {"employ", "uses"}, {"employs", "uses"}, {"employed", "uses"}, {"employing", "uses"},

        {"work", "worksOn"}, {"works", "worksOn"}, {"worked", "worksOn"}, {"working", "worksOn"},
        {"collaborate", "worksOn"}, {"collaborates", "worksOn"}, {"collaborated", "worksOn"},
        {"collaborating", "worksOn"},

        {"have", "has"}, {"has", "has"}, {"had", "has"}, {"having", "has"},
        {"own", "has"}, {"owns", "has"}, {"owned", "has"}, {"owning", "has"},
        {"possess", "has"}, {"possesses", "has"}, {"possessed", "has"},

        {"depend", "dependsOn"}, {"depends", "dependsOn"}, {"depended", "dependsOn"},
        {"depending", "dependsOn"}, {"rely", "dependsOn"}, {"relies", "dependsOn"},
        {"relied", "dependsOn"}, {"relying", "dependsOn"},

        {"create", "creates"}, {"creates", "creates"}, {"created", "creates"}, {"creating", "creates"},
        {"make", "creates"}, {"makes", "creates"}, {"made", "creates"}, {"making", "creates"},
        {"develop", "creates"}, {"develops", "creates"}, {"developed", "creates"}, {"developing", "creates"},
        {"build", "creates"}, {"builds", "creates"}, {"built", "creates"}, {"building", "creates"},
    };

    auto it = cues.find(textutil::to_lower_ascii(word));
    return it == cues.end() ? std::string() : it->second;
}

std::vector<CueRelation> find_cue_relations(const std::string& text,
                                            const std::vector<textutil::TextSpan>& mentions) {
    std::vector<CueRelation> out;

    for (const auto& sentence : textutil::split_sentences(text)) {
        std::vector<size_t> inside;
        for (size_t i = 0; i < mentions.size(); ++i) {
            if (mentions[i].start >= sentence.start && mentions[i].end <= sentence.end) inside.push_back(i);
        }
        if (inside.size() < 2) continue;

        auto in_mention = [&](const textutil::TextSpan& w) {
            for (size_t i : inside) {
                if (w.start < mentions[i].end && mentions[i].start < w.end) return true;
            }
            return false;
        };

        for (const auto& word : textutil::word_spans(text, sentence.start, sentence.end)) {
            if (in_mention(word)) continue;

            const std::string verb = text.substr(word.start, word.end - word.start);
            const std::string type = relation_type_for_verb(verb);
            if (type.empty()) continue;

            bool have_subject = false, have_object = false;
            size_t subject = 0, object = 0;
            for (size_t i : inside) {
                const auto& m = mentions[i];
                if (m.end <= word.start && (!have_subject || m.end > mentions[subject].end)) {
                    subject = i;
                    have_subject = true;
                }
                if (m.start >= word.end && (!have_object || m.start < mentions[object].start)) {
                    object = i;
                    have_object = true;
                }
            }
            if (!have_subject || !have_object) continue;

            out.push_back({subject, object, type, verb, sentence});
            break;
        }
    }
    return out;
}

} // namespace extract
