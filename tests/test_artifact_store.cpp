// test_artifact_store.cpp - Tests for SqliteArtifactStore and RetentionCleanup

#include "sweep/RetentionCleanup.hpp"
#include "sweep/SqliteArtifactStore.hpp"

#include "test_harness.hpp"

#include <ctime>
#include <memory>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::time_t kDay = 24 * 60 * 60;

BuildEvent MakeEvent(const std::string& artifact, uint64_t size, std::time_t when) {
    BuildEvent event;
    event.project_path = fs::path(artifact).parent_path().string();
    event.language = "Rust";
    event.artifact_path = artifact;
    event.size_bytes = size;
    event.build_time = when;
    return event;
}

} // namespace

// =============================================================================
// Queries
// =============================================================================

void test_recent_paths_are_distinct_and_newest_first() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    store.InsertBuild(MakeEvent("/p/a/target", 10, now - 30));
    store.InsertBuild(MakeEvent("/p/b/build", 20, now - 20));
    store.InsertBuild(MakeEvent("/p/a/target", 15, now - 10));

    const std::vector<std::string> paths = store.RecentArtifactPaths();
    ASSERT_EQ(paths.size(), 2u);
    ASSERT_EQ(paths[0], "/p/a/target");
    ASSERT_EQ(paths[1], "/p/b/build");
}

void test_recent_paths_respect_limit() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    for (int i = 0; i < 60; ++i) {
        store.InsertBuild(MakeEvent("/p/" + std::to_string(i) + "/target", 1, now - i));
    }
    ASSERT_EQ(store.RecentArtifactPaths().size(), ArtifactStore::kRecentArtifactLimit);
    ASSERT_EQ(store.RecentArtifactPaths(5).size(), 5u);
}

void test_recent_builds_newest_first() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    for (int i = 0; i < 12; ++i) {
        store.InsertBuild(MakeEvent("/p/" + std::to_string(i) + "/target", 1, now - 100 + i));
    }

    const std::vector<BuildEvent> builds = store.RecentBuilds();
    ASSERT_EQ(builds.size(), ArtifactStore::kRecentBuildLimit);
    ASSERT_EQ(builds[0].artifact_path, "/p/11/target");
    ASSERT_EQ(builds[0].project_path, "/p/11");
    ASSERT_EQ(builds[0].language, "Rust");
    ASSERT(builds[0].build_time >= builds[1].build_time);
}

void test_count_and_max_size() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    store.InsertBuild(MakeEvent("/p/a/target", 100, now));
    store.InsertBuild(MakeEvent("/p/a/target", 300, now));
    store.InsertBuild(MakeEvent("/p/b/node_modules", 200, now));

    ASSERT_EQ(store.CountBuilds(), 3u);
    const std::vector<ArtifactSize> sizes = store.MaxSizeByArtifact();
    ASSERT_EQ(sizes.size(), 2u);
    ASSERT_EQ(sizes[0].artifact_path, "/p/a/target");
    ASSERT_EQ(sizes[0].size_bytes, 300u);
    ASSERT_EQ(sizes[1].size_bytes, 200u);
}

void test_log_build_stamps_current_time() {
    SqliteArtifactStore store(":memory:");
    const std::time_t before = std::time(nullptr);
    store.LogBuild("/p/a", "Go", "/p/a/build", 42);

    const std::vector<BuildEvent> builds = store.RecentBuilds();
    ASSERT_EQ(builds.size(), 1u);
    ASSERT(builds[0].build_time >= before);
    ASSERT_EQ(builds[0].size_bytes, 42u);
}

// =============================================================================
// Deletion
// =============================================================================

void test_delete_artifact_is_exact_match() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    store.InsertBuild(MakeEvent("/p/a/target", 1, now));
    store.InsertBuild(MakeEvent("/p/a/target2", 1, now));

    store.DeleteArtifact("/p/a/target");
    const std::vector<std::string> paths = store.RecentArtifactPaths();
    ASSERT_EQ(paths.size(), 1u);
    ASSERT_EQ(paths[0], "/p/a/target2");

    store.DeleteAll();
    ASSERT_EQ(store.CountBuilds(), 0u);
}

void test_old_paths_use_latest_event() {
    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    // Old event but a fresh one too: not old.
    store.InsertBuild(MakeEvent("/p/fresh/target", 1, now - 20 * kDay));
    store.InsertBuild(MakeEvent("/p/fresh/target", 1, now - kDay));
    store.InsertBuild(MakeEvent("/p/stale/target", 1, now - 10 * kDay));

    const std::vector<std::string> old = store.OldArtifactPaths(7);
    ASSERT_EQ(old.size(), 1u);
    ASSERT_EQ(old[0], "/p/stale/target");

    store.DeleteBuildsOlderThan(7);
    ASSERT_EQ(store.CountBuilds(), 1u);
    ASSERT_EQ(store.RecentArtifactPaths()[0], "/p/fresh/target");
}

void test_file_database_persists() {
    TempDir dir("buildsweep_store");
    const std::string db = (dir.Path() / "nested" / "artifacts.db").string();
    {
        SqliteArtifactStore store(db);
        store.LogBuild("/p/a", "Rust", "/p/a/target", 7);
    }
    SqliteArtifactStore reopened(db);
    ASSERT_EQ(reopened.CountBuilds(), 1u);
}

void test_unopenable_database_throws() {
    bool threw = false;
    try {
        SqliteArtifactStore store("/proc/buildsweep-cannot-exist/artifacts.db");
    } catch (const ArtifactStoreError&) {
        threw = true;
    }
    ASSERT(threw);
}

void test_concurrent_inserts() {
    SqliteArtifactStore store(":memory:");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 25; ++i) {
                store.LogBuild("/p", "Rust", "/p/" + std::to_string(t) + "/" + std::to_string(i), 1);
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }
    ASSERT_EQ(store.CountBuilds(), 100u);
}

// =============================================================================
// Retention cleanup
// =============================================================================

void test_retention_cleanup_removes_stale_directories() {
    TempDir dir("buildsweep_retention");
    const fs::path stale = dir.MakeDir("old/target");
    dir.WriteFile("old/target/out.bin", "data");
    const fs::path fresh = dir.MakeDir("new/target");

    SqliteArtifactStore store(":memory:");
    const std::time_t now = std::time(nullptr);
    store.InsertBuild(MakeEvent(stale.string(), 4, now - 30 * kDay));
    store.InsertBuild(MakeEvent(fresh.string(), 4, now));

    ASSERT_EQ(RunRetentionCleanup(store, 7), 1u);
    ASSERT(!fs::exists(stale));
    ASSERT(fs::exists(fresh));
    ASSERT_EQ(store.CountBuilds(), 1u);
}

void test_retention_cleanup_with_nothing_old() {
    SqliteArtifactStore store(":memory:");
    store.LogBuild("/p", "Rust", "/p/target", 1);
    ASSERT_EQ(RunRetentionCleanup(store, 30), 0u);
    ASSERT_EQ(store.CountBuilds(), 1u);
}

int main() {
    std::cout << "Store Query Tests:\n";
    TEST(recent_paths_are_distinct_and_newest_first);
    TEST(recent_paths_respect_limit);
    TEST(recent_builds_newest_first);
    TEST(count_and_max_size);
    TEST(log_build_stamps_current_time);

    std::cout << "\nStore Deletion Tests:\n";
    TEST(delete_artifact_is_exact_match);
    TEST(old_paths_use_latest_event);
    TEST(file_database_persists);
    TEST(unopenable_database_throws);
    TEST(concurrent_inserts);

    std::cout << "\nRetention Cleanup Tests:\n";
    TEST(retention_cleanup_removes_stale_directories);
    TEST(retention_cleanup_with_nothing_old);

    return PrintResults();
}
