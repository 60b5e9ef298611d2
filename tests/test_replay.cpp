#include <gtest/gtest.h>
#include "extract/CompositeExtractor.hpp"
#include "extract/PatternExtractor.hpp"
#include "extract/ReplayExtractor.hpp"
#include "io/JsonIO.hpp"
#include "model/EntityFactory.hpp"
#include "model/Observation.hpp"
#include "util/Uuid.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace extract;

class ReplayTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("entity-replay-" + util::new_id());
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    ExtractParams params(const std::string& source_id) const {
        ExtractParams p;
        p.source_id = source_id;
        return p;
    }
};

TEST_F(ReplayTest, ReturnsStoredCollection) {
    model::EntityCollection stored;
    model::Entity acme = model::create_entity("Acme", "Organization", "Acme", 14, 18, 0.9);
    stored.add_entity(acme);
    io::save_collection(dir / "msg-1.json", stored);

    ReplayExtractor ex(dir.string());
    auto c = ex.extract_entities("ignored", params("msg-1"));

    ASSERT_EQ(c.entities().size(), 1u);
    EXPECT_EQ(c.entities()[0].id, acme.id);
    EXPECT_EQ(c.source_id(), std::optional<std::string>("msg-1"));
    EXPECT_EQ(ex.path_for("msg-1").string(), (dir / "msg-1.json").string());
}

TEST_F(ReplayTest, FailsWithoutSourceOrFile) {
    ReplayExtractor ex(dir.string());
    EXPECT_THROW(ex.extract_entities("", {}), ExtractionError);
    EXPECT_THROW(ex.extract_entities("", params("absent")), ExtractionError);

    std::ofstream(dir / "broken.json") << "{\"entities\": 5}";
    EXPECT_THROW(ex.extract_entities("", params("broken")), ExtractionError);
}

TEST_F(ReplayTest, SourceIdCannotLeaveTheDirectory) {
    const std::string outside = dir.filename().string() + "-outside";
    std::ofstream(dir.parent_path() / (outside + ".json")) << "{\"entities\": [], \"relationships\": []}";
    ReplayExtractor ex(dir.string());

    EXPECT_THROW(ex.extract_entities("", params("../" + outside)), ExtractionError);
    EXPECT_THROW(ex.extract_entities("", params("a/b")), ExtractionError);
    EXPECT_THROW(ex.extract_entities("", params("a\\b")), ExtractionError);
    EXPECT_THROW(ex.extract_entities("", params("")), ExtractionError);
    EXPECT_THROW(ex.path_for(".."), ExtractionError);

    std::error_code ec;
    fs::remove(dir.parent_path() / (outside + ".json"), ec);
}

TEST_F(ReplayTest, StoredExtractionConfirmsLiveOne) {
    const std::string text = "Omar works at Acme.";

    PatternConfig cfg;
    cfg.patterns = {{"Person", {"Omar"}}, {"Organization", {"Acme"}}};
    auto pattern = std::make_shared<PatternExtractor>(cfg);

    io::save_collection(dir / "doc.json", pattern->extract_entities(text, params("doc")));

    CompositeExtractor composite({pattern, std::make_shared<ReplayExtractor>(dir.string())});
    MergeResult r = composite.merge(text, params("doc"));

    EXPECT_TRUE(r.failures.empty());
    ASSERT_EQ(r.collection.entities().size(), 2u);
    EXPECT_EQ(model::observation_count(r.collection.entities()[0].metadata), 2u);
}

TEST_F(ReplayTest, MissingReplayIsANonFatalFailure) {
    PatternConfig cfg;
    cfg.patterns = {{"Person", {"Omar"}}};

    CompositeExtractor composite({std::make_shared<PatternExtractor>(cfg),
                                  std::make_shared<ReplayExtractor>(dir.string())});
    MergeResult r = composite.merge("Omar", params("nothing-stored"));

    EXPECT_EQ(r.collection.entities().size(), 1u);
    ASSERT_EQ(r.failures.size(), 1u);
    EXPECT_EQ(r.failures[0].extractor, "ReplayExtractor");
}
