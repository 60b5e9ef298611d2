#include <gtest/gtest.h>
#include "model/EntityFactory.hpp"

#include <stdexcept>

using namespace model;

TEST(FactoryTest, CreateEntityFillsFields) {
    Entity e = create_entity("Alice", "Person", "Alice", 20, 25, 0.8, {{"extractor", "test"}});

    EXPECT_EQ(e.id.size(), 36u);
    EXPECT_EQ(e.name, "Alice");
    EXPECT_EQ(e.type, "Person");
    EXPECT_EQ(e.source_text, "Alice");
    EXPECT_EQ(e.start_position, 20u);
    EXPECT_EQ(e.end_position, 25u);
    EXPECT_DOUBLE_EQ(e.confidence, 0.8);
    EXPECT_EQ(e.metadata["extractor"], "test");
    EXPECT_TRUE(e.metadata["created_at"].is_string());
}

TEST(FactoryTest, EveryCallMintsAFreshId) {
    Entity a = create_entity("Omar", "Person", "Omar", 0, 4, 0.8);
    Entity b = create_entity("Omar", "Person", "Omar", 0, 4, 0.8);
    EXPECT_NE(a.id, b.id);

    Relationship r = create_relationship(a.id, b.id, "knows", 0.5);
    EXPECT_NE(r.id, a.id);
    EXPECT_EQ(r.source_entity, a.id);
    EXPECT_EQ(r.target_entity, b.id);
}

TEST(FactoryTest, KeepsCallerCreatedAt) {
    Entity e = create_entity("X", "T", "X", 0, 1, 0.5, {{"created_at", "2020-01-01T00:00:00.000000Z"}});
    EXPECT_EQ(e.metadata["created_at"], "2020-01-01T00:00:00.000000Z");
}

TEST(FactoryTest, ClampsConfidence) {
    EXPECT_DOUBLE_EQ(create_entity("X", "T", "X", 0, 1, 1.7).confidence, 1.0);
    EXPECT_DOUBLE_EQ(create_relationship("a", "b", "t", -0.2).confidence, 0.0);
}

TEST(FactoryTest, RejectsInvertedPositions) {
    EXPECT_THROW(create_entity("X", "T", "X", 5, 4, 0.5), std::invalid_argument);
    EXPECT_NO_THROW(create_entity("", "T", "", 3, 3, 0.5));
}
