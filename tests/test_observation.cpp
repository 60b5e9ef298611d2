#include <gtest/gtest.h>
#include "model/EntityFactory.hpp"
#include "model/Observation.hpp"

using namespace model;

TEST(ObservationTest, FirstEntityObservationCreatesList) {
    Entity e = create_entity("Omar", "Person", "Omar", 0, 4, 0.8);
    ASSERT_FALSE(e.metadata.contains("observations"));

    record_entity_observation(e, "msg-1", "", " works at Acme", "PatternExtractor");

    ASSERT_EQ(observation_count(e.metadata), 1u);
    const auto& obs = e.metadata["observations"][0];
    EXPECT_EQ(obs["source"], "msg-1");
    EXPECT_EQ(obs["extractor"], "PatternExtractor");
    EXPECT_EQ(obs["context"]["before"], "");
    EXPECT_EQ(obs["context"]["exact"], "Omar");
    EXPECT_EQ(obs["context"]["after"], " works at Acme");
    EXPECT_EQ(obs["position"]["start"], 0);
    EXPECT_EQ(obs["position"]["end"], 4);
    EXPECT_DOUBLE_EQ(obs["confidence"].get<double>(), 0.8);
    EXPECT_TRUE(obs["timestamp"].is_string());
}

TEST(ObservationTest, ObservationsAppendInOrder) {
    Entity e = create_entity("Acme", "Organization", "Acme", 14, 18, 0.9);
    record_entity_observation(e, "a");
    record_entity_observation(e, "b");
    record_entity_observation(e, "c");

    ASSERT_EQ(observation_count(e.metadata), 3u);
    EXPECT_EQ(e.metadata["observations"][0]["source"], "a");
    EXPECT_EQ(e.metadata["observations"][2]["source"], "c");
    EXPECT_EQ(e.metadata["observations"][0]["extractor"], "unknown");
}

TEST(ObservationTest, ConfidenceIsRecordedAtObservationTime) {
    Entity e = create_entity("Acme", "Organization", "Acme", 0, 4, 0.5);
    record_entity_observation(e, "s");
    e.confidence = 0.9;
    record_entity_observation(e, "s");

    EXPECT_DOUBLE_EQ(e.metadata["observations"][0]["confidence"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(e.metadata["observations"][1]["confidence"].get<double>(), 0.9);
}

TEST(ObservationTest, NonArrayObservationsAreWrappedNotLost) {
    Entity e = create_entity("X", "T", "X", 0, 1, 0.5, {{"observations", "legacy note"}});
    record_entity_observation(e, "s");

    ASSERT_EQ(observation_count(e.metadata), 2u);
    EXPECT_EQ(e.metadata["observations"][0], "legacy note");
    EXPECT_EQ(e.metadata["observations"][1]["source"], "s");
}

TEST(ObservationTest, RelationshipObservationHasFreeFormContext) {
    Relationship r = create_relationship("a", "b", "relatesTo", 0.7);
    record_relationship_observation(r, "msg", "Both entities are of type Person", "PatternExtractor");

    ASSERT_EQ(observation_count(r.metadata), 1u);
    const auto& obs = r.metadata["observations"][0];
    EXPECT_EQ(obs["context"], "Both entities are of type Person");
    EXPECT_FALSE(obs.contains("position"));
    EXPECT_DOUBLE_EQ(obs["confidence"].get<double>(), 0.7);
}

TEST(ObservationTest, CountIsZeroWithoutList) {
    EXPECT_EQ(observation_count(Metadata::object()), 0u);
    EXPECT_EQ(observation_count(Metadata(nullptr)), 0u);
    EXPECT_EQ(observation_count({{"observations", 3}}), 0u);
}
