#include <gtest/gtest.h>
#include "artifact_store.h"
#include "errors.h"
#include "file_utils.h"
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace boxrun {
namespace {

class ArtifactStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("boxrun_store_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    // Durable file plus its record, as the collector would leave them
    ArtifactRecord put(ArtifactStore& store, const std::string& id, const std::string& name,
                       const std::string& data) {
        fs::create_directories(store.execution_dir(id));
        ArtifactRecord record;
        record.execution_id = id;
        record.file_name = name;
        record.path = (store.execution_dir(id) / name).string();
        record.category = FileUtils::category_to_string(FileUtils::detect_category(name));
        record.size_bytes = data.size();
        record.sha256 = FileUtils::sha256_string(data);
        EXPECT_TRUE(FileUtils::write_file(record.path, data));
        store.register_artifact(record);
        return record;
    }

    void expect_not_found(const ArtifactStore& store, const std::string& uri) {
        try {
            store.fetch(uri);
            FAIL() << "Expected ArtifactNotFound for " << uri;
        } catch (const SandboxError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::ARTIFACT_NOT_FOUND) << uri;
        }
    }

    fs::path root;
};

// ============================================================================
// Identifiers
// ============================================================================

TEST(ArtifactUriTest, ParseWellFormed) {
    std::string id, name;
    ASSERT_TRUE(ArtifactStore::parse_uri("artifacts://abc123/result.png", id, name));
    EXPECT_EQ(id, "abc123");
    EXPECT_EQ(name, "result.png");
}

TEST(ArtifactUriTest, RejectMalformed) {
    std::string id, name;
    EXPECT_FALSE(ArtifactStore::parse_uri("abc123/result.png", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("artifacts://abc123", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("artifacts://abc123/", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("artifacts:///result.png", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("artifacts://abc/../etc/passwd", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("artifacts://../x", id, name));
    EXPECT_FALSE(ArtifactStore::parse_uri("containers://abc/logs", id, name));
}

TEST(ArtifactUriTest, MakeUri) {
    EXPECT_EQ(ArtifactStore::make_uri("c1", "out.txt"), "artifacts://c1/out.txt");
}

// ============================================================================
// Fetch
// ============================================================================

TEST_F(ArtifactStoreTest, FetchRegistered) {
    ArtifactStore store(root.string());
    put(store, "c1", "data.json", "{\"a\":1}");

    ArtifactContent content = store.fetch("artifacts://c1/data.json");
    EXPECT_EQ(content.data, "{\"a\":1}");
    EXPECT_EQ(content.file_name, "data.json");
    EXPECT_EQ(content.category, "text");
    EXPECT_EQ(content.mime_type, "application/json");
}

TEST_F(ArtifactStoreTest, FetchUnknownOrMalformed) {
    ArtifactStore store(root.string());
    put(store, "c1", "data.json", "{}");

    expect_not_found(store, "artifacts://c1/other.json");
    expect_not_found(store, "artifacts://c2/data.json");
    expect_not_found(store, "not-a-uri");
}

TEST_F(ArtifactStoreTest, FetchAfterDurableCopyVanished) {
    ArtifactStore store(root.string());
    ArtifactRecord record = put(store, "c1", "gone.txt", "x");
    fs::remove(record.path);

    expect_not_found(store, "artifacts://c1/gone.txt");
}

// ============================================================================
// List
// ============================================================================

TEST_F(ArtifactStoreTest, ListByPrefixInKeyOrder) {
    ArtifactStore store(root.string());
    put(store, "c2", "z.txt", "z");
    put(store, "c1", "b.txt", "b");
    put(store, "c1", "a.txt", "a");
    put(store, "c10", "x.txt", "x");

    auto c1 = store.list("artifacts://c1/");
    ASSERT_EQ(c1.size(), 2u);
    EXPECT_EQ(c1[0].uri(), "artifacts://c1/a.txt");
    EXPECT_EQ(c1[1].uri(), "artifacts://c1/b.txt");

    EXPECT_EQ(store.list("artifacts://").size(), 4u);
    EXPECT_EQ(store.list("c2/").size(), 1u);
    EXPECT_TRUE(store.list("artifacts://nothing/").empty());
}

TEST_F(ArtifactStoreTest, BareIdListsOnlyThatExecution) {
    // Given: Two executions where one id is a prefix of the other
    ArtifactStore store(root.string());
    put(store, "abc", "x.png", "x");
    put(store, "abcdef", "y.png", "y");

    // Then: Either form of the id names exactly one execution
    auto bare = store.list("abc");
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_EQ(bare[0].uri(), "artifacts://abc/x.png");

    auto scheme = store.list("artifacts://abc");
    ASSERT_EQ(scheme.size(), 1u);
    EXPECT_EQ(scheme[0].uri(), "artifacts://abc/x.png");

    EXPECT_EQ(store.list("artifacts://abcdef/").size(), 1u);
}

// ============================================================================
// Purge and Rebuild
// ============================================================================

TEST_F(ArtifactStoreTest, PurgeRemovesRecordsAndFiles) {
    ArtifactStore store(root.string());
    put(store, "c1", "a.txt", "a");
    put(store, "c1", "b.txt", "b");
    put(store, "c2", "a.txt", "a");

    EXPECT_EQ(store.purge("c1"), 2u);
    EXPECT_FALSE(fs::exists(store.execution_dir("c1")));
    EXPECT_EQ(store.size(), 1u);
    expect_not_found(store, "artifacts://c1/a.txt");
    EXPECT_EQ(store.fetch("artifacts://c2/a.txt").data, "a");

    EXPECT_EQ(store.purge("c1"), 0u) << "Purging twice is harmless";
}

TEST_F(ArtifactStoreTest, RebuildIndexFromDisk) {
    {
        ArtifactStore first(root.string());
        put(first, "c1", "plot.png", "png-bytes");
        put(first, "c2", "notes.md", "# notes");
    }

    // A new process starts with an empty index
    ArtifactStore second(root.string());
    EXPECT_EQ(second.size(), 0u);
    EXPECT_EQ(second.rebuild_index(), 2u);

    auto records = second.list("artifacts://c1/");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].category, "image");
    EXPECT_EQ(records[0].size_bytes, 9u);
    EXPECT_EQ(records[0].sha256, FileUtils::sha256_string("png-bytes"));
    EXPECT_EQ(second.fetch("artifacts://c2/notes.md").data, "# notes");
}

TEST_F(ArtifactStoreTest, RebuildIndexSkipsStrayEntries) {
    {
        ArtifactStore first(root.string());
        put(first, "c1", "data.csv", "a,b\n");
    }
    ASSERT_TRUE(FileUtils::write_file((root / "stray.txt").string(), "not an execution"));
    fs::create_directories(root / "c2" / "nested");
    fs::create_symlink(root / "missing-target", root / "c2" / "dangling");

    ArtifactStore second(root.string());
    size_t indexed = 0;
    EXPECT_NO_THROW(indexed = second.rebuild_index());
    EXPECT_EQ(indexed, 1u);
    EXPECT_EQ(second.fetch("artifacts://c1/data.csv").data, "a,b\n");
}

TEST_F(ArtifactStoreTest, ConcurrentRegistration) {
    ArtifactStore store(root.string());
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 50; ++i) {
                ArtifactRecord record;
                record.execution_id = "c" + std::to_string(t);
                record.file_name = std::to_string(i) + ".txt";
                store.register_artifact(record);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.size(), 400u);
}

} // namespace
} // namespace boxrun
