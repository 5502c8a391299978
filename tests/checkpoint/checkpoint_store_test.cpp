#include <gtest/gtest.h>
#include "rpl/checkpoint/checkpoint_store.hpp"

#include "support/temp_dir.hpp"

#include <filesystem>

using namespace rpl;
using namespace rpl::checkpoint;

namespace {

Checkpoint sample(const std::string& profile) {
    Checkpoint checkpoint;
    checkpoint.profile = profile;
    checkpoint.completed_chunk_ids = {"00000000000000a1", "00000000000000b2"};
    checkpoint.parameters = {1024, 10, 3};
    checkpoint.phase = "Copying";
    checkpoint.saved_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000));
    return checkpoint;
}

} // namespace

TEST(CheckpointStore, SaveAndLoad) {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    ASSERT_TRUE(store.save(sample("engineering")).is_ok());
    auto loaded = store.load("engineering");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->profile, "engineering");
    EXPECT_EQ(loaded->completed_chunk_ids, sample("x").completed_chunk_ids);
    EXPECT_TRUE(loaded->parameters == sample("x").parameters);
    EXPECT_EQ(loaded->phase, "Copying");
    EXPECT_TRUE(loaded->saved_at == sample("x").saved_at);
}

TEST(CheckpointStore, SaveOverwrites) {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    auto checkpoint = sample("engineering");
    ASSERT_TRUE(store.save(checkpoint).is_ok());

    checkpoint.completed_chunk_ids.insert("00000000000000c3");
    ASSERT_TRUE(store.save(checkpoint).is_ok());

    auto loaded = store.load("engineering");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->completed_chunk_ids.size(), 3u);
}

TEST(CheckpointStore, MissingIsNone) {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    EXPECT_FALSE(store.load("engineering").has_value());
}

TEST(CheckpointStore, MalformedIsNone) {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    test::write_text(store.path_for("a"), "{ truncated");
    test::write_text(store.path_for("b"), "{\"version\": 1, \"profile\": \"b\"}");
    test::write_text(store.path_for("c"), "[1, 2, 3]");

    EXPECT_FALSE(store.load("a").has_value());
    EXPECT_FALSE(store.load("b").has_value());
    EXPECT_FALSE(store.load("c").has_value());
}

TEST(CheckpointStore, UnknownVersionIsNone) {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    auto checkpoint = sample("engineering");
    checkpoint.version = kCheckpointVersion + 1;
    ASSERT_TRUE(store.save(checkpoint).is_ok());

    EXPECT_FALSE(store.load("engineering").has_value());
}

TEST(CheckpointStore, RemoveIsIdempotent) {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    ASSERT_TRUE(store.save(sample("engineering")).is_ok());

    ASSERT_TRUE(store.remove("engineering").is_ok());
    ASSERT_TRUE(store.remove("engineering").is_ok());
    EXPECT_FALSE(std::filesystem::exists(store.path_for("engineering")));
}

TEST(CheckpointStore, ProfileNamesMapToSafeFiles) {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    EXPECT_EQ(store.path_for("eng/cad tools").filename().string(), "eng_cad_tools.checkpoint.json");
    EXPECT_EQ(store.path_for("..").filename().string(), "_...checkpoint.json");
    EXPECT_EQ(store.path_for("").filename().string(), "_.checkpoint.json");
    EXPECT_EQ(store.path_for("x").parent_path().string(), dir.str());
}
