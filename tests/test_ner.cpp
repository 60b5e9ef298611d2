#include <gtest/gtest.h>
#include "extract/NerExtractor.hpp"
#include "extract/RelationCues.hpp"
#include "extract/TokenClassifier.hpp"
#include "model/Observation.hpp"

#include <memory>

using namespace extract;

namespace {

TokenPrediction tok(size_t start, size_t end, const std::string& label, float score, bool cont = false) {
    TokenPrediction p;
    p.start = start;
    p.end = end;
    p.label = label;
    p.score = score;
    p.continuation = cont;
    return p;
}

// Labels whole words from a fixed list, everything else "O".
class FakeClassifier : public TokenClassifier {
public:
    explicit FakeClassifier(std::vector<TokenPrediction> out, bool ready = true)
        : m_out(std::move(out)), m_ready(ready) {}

    bool ready() const override { return m_ready; }
    std::string model_name() const override { return "fake"; }
    std::vector<TokenPrediction> classify(const std::string&) const override { return m_out; }

private:
    std::vector<TokenPrediction> m_out;
    bool m_ready;
};

} // namespace

// ─── BIO decoding ──────────────────────────────────────────────

TEST(DecodeBioTest, BeginInsideOutside) {
    // "Omar Khan works at Acme Corp"
    auto spans = decode_bio({
        tok(0, 4, "B-PER", 0.9f), tok(5, 8, "I-PER", 0.7f),
        tok(9, 14, "O", 0.99f), tok(15, 17, "O", 0.99f),
        tok(18, 22, "B-ORG", 0.8f), tok(23, 27, "I-ORG", 0.6f),
    });

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].label, "PER");
    EXPECT_EQ(spans[0].start, 0u);
    EXPECT_EQ(spans[0].end, 8u);
    EXPECT_NEAR(spans[0].score, 0.8, 1e-6);
    EXPECT_EQ(spans[1].label, "ORG");
    EXPECT_EQ(spans[1].end, 27u);
}

TEST(DecodeBioTest, ContinuationPiecesExtendSpan) {
    auto spans = decode_bio({
        tok(0, 3, "B-ORG", 1.0f), tok(3, 6, "O", 0.5f, true), tok(7, 9, "O", 0.9f),
    });
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].end, 6u);
    EXPECT_NEAR(spans[0].score, 0.75, 1e-6);
}

TEST(DecodeBioTest, TypeChangeOpensNewSpan) {
    auto spans = decode_bio({tok(0, 4, "I-PER", 0.9f), tok(5, 9, "I-LOC", 0.9f)});
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].label, "PER");
    EXPECT_EQ(spans[1].label, "LOC");
}

TEST(DecodeBioTest, BioesAndBareLabels) {
    auto spans = decode_bio({
        tok(0, 5, "S-LOC", 0.9f), tok(6, 10, "B-ORG", 0.9f), tok(11, 15, "E-ORG", 0.9f),
        tok(16, 20, "I-ORG", 0.9f), tok(21, 25, "PER", 0.9f), tok(26, 30, "PER", 0.9f),
    });
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[0].label, "LOC");
    EXPECT_EQ(spans[1].end, 15u);
    EXPECT_EQ(spans[2].start, 16u);
    EXPECT_EQ(spans[3].label, "PER");
    EXPECT_EQ(spans[3].start, 21u);
    EXPECT_EQ(spans[3].end, 30u);
}

// ─── Verb cues ─────────────────────────────────────────────────

TEST(RelationCuesTest, VerbLexicon) {
    EXPECT_EQ(relation_type_for_verb("uses"), "uses");
    EXPECT_EQ(relation_type_for_verb("Built"), "creates");
    EXPECT_EQ(relation_type_for_verb("relies"), "dependsOn");
    EXPECT_EQ(relation_type_for_verb("works"), "worksOn");
    EXPECT_EQ(relation_type_for_verb("owns"), "has");
    EXPECT_EQ(relation_type_for_verb("likes"), "");
}

TEST(RelationCuesTest, NearestMentionsAroundFirstCue) {
    const std::string text = "Omar and Alice built Acme. Berlin is nice.";
    std::vector<textutil::TextSpan> mentions = {{0, 4}, {9, 14}, {21, 25}, {27, 33}};

    auto rels = find_cue_relations(text, mentions);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].subject, 1u);
    EXPECT_EQ(rels[0].object, 2u);
    EXPECT_EQ(rels[0].type, "creates");
    EXPECT_EQ(rels[0].verb, "built");
    EXPECT_EQ(text.substr(rels[0].sentence.start, rels[0].sentence.end - rels[0].sentence.start),
              "Omar and Alice built Acme.");
}

TEST(RelationCuesTest, CueInsideMentionIsIgnored) {
    const std::string text = "Build Corp hired Omar.";
    std::vector<textutil::TextSpan> mentions = {{0, 10}, {17, 21}};
    EXPECT_TRUE(find_cue_relations(text, mentions).empty());
}

// ─── NerExtractor ──────────────────────────────────────────────

TEST(NerExtractorTest, MapsLabelsAndLinksByVerb) {
    const std::string text = "Alice uses TensorFlow at Google.";
    auto classifier = std::make_shared<FakeClassifier>(std::vector<TokenPrediction>{
        tok(0, 5, "B-PER", 0.9f), tok(6, 10, "O", 0.99f),
        tok(11, 21, "B-MISC", 0.8f), tok(22, 24, "O", 0.99f),
        tok(25, 31, "B-ORG", 0.95f), tok(31, 32, "O", 0.99f),
    });
    NerExtractor ex(classifier);
    ExtractParams params;
    params.source_id = "doc";

    auto c = ex.extract_entities(text, params);
    ASSERT_EQ(c.entities().size(), 3u);

    const model::Entity& alice = c.entities()[0];
    EXPECT_EQ(alice.name, "Alice");
    EXPECT_EQ(alice.type, "Person");
    EXPECT_NEAR(alice.confidence, 0.9, 1e-6);
    EXPECT_EQ(alice.metadata["ner_label"], "PER");
    EXPECT_EQ(model::observation_count(alice.metadata), 1u);
    EXPECT_EQ(alice.metadata["observations"][0]["extractor"], "NerExtractor(fake)");
    EXPECT_EQ(alice.metadata["observations"][0]["context"]["after"], "uses TensorFlow at Google.");

    EXPECT_EQ(c.entities()[1].type, "Miscellaneous");
    EXPECT_EQ(c.entities()[2].type, "Organization");

    ASSERT_EQ(c.relationships().size(), 1u);
    const model::Relationship& rel = c.relationships()[0];
    EXPECT_EQ(rel.type, "uses");
    EXPECT_EQ(rel.source_entity, alice.id);
    EXPECT_EQ(rel.target_entity, c.entities()[1].id);
    EXPECT_NEAR(rel.confidence, 0.8 * 0.7, 1e-6);
    EXPECT_EQ(rel.metadata["verb"], "uses");
    EXPECT_EQ(rel.metadata["sentence"], text);
}

TEST(NerExtractorTest, ShortLowScoreMentionsDropped) {
    // "Al" scores 0.6 * 0.7 = 0.42, below the 0.5 floor
    auto classifier = std::make_shared<FakeClassifier>(std::vector<TokenPrediction>{
        tok(0, 2, "B-PER", 0.6f), tok(3, 9, "B-DATE", 0.9f), tok(10, 14, "B-FOO", 0.99f),
    });
    NerExtractor ex(classifier);

    auto c = ex.extract_entities("Al Monday Blah", {});
    ASSERT_EQ(c.entities().size(), 1u);
    EXPECT_EQ(c.entities()[0].type, "Time");
}

TEST(NerExtractorTest, PerCallMinConfidenceOption) {
    const std::string text = "Alice uses TensorFlow at Google.";
    auto classifier = std::make_shared<FakeClassifier>(std::vector<TokenPrediction>{
        tok(0, 5, "B-PER", 0.9f), tok(11, 21, "B-MISC", 0.8f), tok(25, 31, "B-ORG", 0.95f),
    });
    NerExtractor ex(classifier);

    EXPECT_EQ(ex.extract_entities(text, {}).entities().size(), 3u);

    ExtractParams strict;
    strict.options["min_confidence"] = 0.85;
    auto c = ex.extract_entities(text, strict);
    ASSERT_EQ(c.entities().size(), 2u);
    EXPECT_EQ(c.entities()[0].name, "Alice");
    EXPECT_EQ(c.entities()[1].name, "Google");

    ASSERT_EQ(c.relationships().size(), 1u);
    EXPECT_EQ(c.relationships()[0].target_entity, c.entities()[1].id);

    ExtractParams bad;
    bad.options["min_confidence"] = "high";
    EXPECT_THROW(ex.extract_entities(text, bad), ExtractionError);
}

TEST(NerExtractorTest, UnloadedClassifierThrows) {
    NerExtractor missing(nullptr);
    EXPECT_EQ(missing.name(), "NerExtractor(none)");
    EXPECT_THROW(missing.extract_entities("x", {}), ExtractionError);

    NerExtractor not_ready(std::make_shared<FakeClassifier>(std::vector<TokenPrediction>{}, false));
    EXPECT_THROW(not_ready.extract_entities("x", {}), ExtractionError);
}
