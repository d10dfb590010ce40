#include "ArtifactJson.h"
#include "AugurExceptions.h"
#include "MemoryStore.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <filesystem>
#include <memory>

namespace {
MemoryRecord sampleRecord() {
    MemoryRecord r;
    r.lastSeen = "2024-05-01T12:30:00Z";
    r.target = "target";
    r.shape = {200, 2};
    r.bestModel = "RandomForest";
    r.bestMetrics.model = "RandomForest";
    r.bestMetrics.accuracy = 0.9;
    r.bestMetrics.balancedAccuracy = 0.75;
    r.bestMetrics.f1Macro = 0.625;
    r.bestMetrics.precisionMacro = 0.7;
    r.bestMetrics.recallMacro = 0.75;
    return r;
}
} // namespace

TEST(MemoryStore, MissingFileStartsEmpty) {
    TestSupport::ScopedTempDir dir;
    MemoryStore store(dir.file("memory.json"));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.notes().empty());
    EXPECT_FALSE(store.get("fp_1").has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.file("memory.json")));
}

TEST(MemoryStore, UpsertThenGetRoundTrips) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("memory.json");
    const MemoryRecord record = sampleRecord();
    {
        MemoryStore store(path);
        store.upsert("fp_42", record);
        ASSERT_TRUE(store.get("fp_42").has_value());
        EXPECT_EQ(*store.get("fp_42"), record);
        EXPECT_FALSE(store.get("fp_unknown").has_value());
    }
    MemoryStore reopened(path);
    ASSERT_TRUE(reopened.get("fp_42").has_value());
    EXPECT_EQ(*reopened.get("fp_42"), record);
}

TEST(MemoryStore, UpsertReplacesExistingRecord) {
    TestSupport::ScopedTempDir dir;
    MemoryStore store(dir.file("memory.json"));
    MemoryRecord first = sampleRecord();
    store.upsert("fp_1", first);
    MemoryRecord second = first;
    second.bestModel = "GradientBoosting";
    store.upsert("fp_1", second);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("fp_1")->bestModel, "GradientBoosting");
}

TEST(MemoryStore, SavedFileHasDatasetsAndNotes) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("nested/dir/memory.json");
    MemoryStore store(path);
    store.addNote("first run");

    const Json::Value root = ArtifactJson::readJsonFile(path);
    ASSERT_TRUE(root.isObject());
    EXPECT_TRUE(root["datasets"].isObject());
    ASSERT_TRUE(root["notes"].isArray());
    EXPECT_EQ(root["notes"][0]["msg"].asString(), "first run");
    EXPECT_EQ(root["notes"][0]["ts"].asString().back(), 'Z');
}

TEST(MemoryStore, CorruptFileIsBackedUpAndReset) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("memory.json");
    TestSupport::writeTextFile(path, "{ this is not json");

    std::unique_ptr<MemoryStore> store;
    ASSERT_NO_THROW(store = std::make_unique<MemoryStore>(path));
    EXPECT_EQ(store->size(), 0u);
    ASSERT_EQ(store->notes().size(), 1u);
    EXPECT_NE(store->notes()[0].msg.find(path + ".bak"), std::string::npos);
    EXPECT_EQ(TestSupport::readTextFile(path + ".bak"), "{ this is not json");

    store->upsert("fp_7", sampleRecord());
    MemoryStore reopened(path);
    EXPECT_TRUE(reopened.get("fp_7").has_value());
    EXPECT_EQ(reopened.notes().size(), 1u);
}

TEST(MemoryStore, WrongShapeCountsAsCorrupt) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("memory.json");
    TestSupport::writeTextFile(path, "{\"datasets\": [1, 2], \"notes\": []}");
    MemoryStore store(path);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.notes().size(), 1u);

    TestSupport::writeTextFile(path, "{\"datasets\": {\"fp_1\": {\"target\": 3}}, \"notes\": []}");
    MemoryStore second(path);
    EXPECT_EQ(second.size(), 0u);
    EXPECT_EQ(second.notes().size(), 1u);
}

TEST(MemoryStore, MissingTopLevelKeysAreTolerated) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("memory.json");
    TestSupport::writeTextFile(path, "{}");
    MemoryStore store(path);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.notes().empty());
}

TEST(MemoryStore, UnwritableLocationRaisesIOError) {
    TestSupport::ScopedTempDir dir;
    const std::string blocker = dir.file("blocker");
    TestSupport::writeTextFile(blocker, "file, not a directory");
    MemoryStore store(blocker + "/memory.json");
    EXPECT_THROW(store.upsert("fp_1", sampleRecord()), Augur::IOException);
}
