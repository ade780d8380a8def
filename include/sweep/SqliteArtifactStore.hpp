#ifndef SWEEP_SQLITEARTIFACTSTORE_HPP
#define SWEEP_SQLITEARTIFACTSTORE_HPP

#include <mutex>
#include <string>

#include <sqlite3.h>

#include "sweep/ArtifactStore.hpp"

// ArtifactStore backed by a single SQLite database file.
// All statements run under one mutex so the scan, cleanup and UI threads can share it.
class SqliteArtifactStore : public ArtifactStore {
public:
    // Opens (creating if needed) the database at `path`; ":memory:" is accepted.
    // Throws ArtifactStoreError when the database cannot be opened or migrated.
    explicit SqliteArtifactStore(const std::string& path);
    ~SqliteArtifactStore() override;

    SqliteArtifactStore(const SqliteArtifactStore&) = delete;
    SqliteArtifactStore& operator=(const SqliteArtifactStore&) = delete;

    void InsertBuild(const BuildEvent& event) override;

    std::vector<std::string> RecentArtifactPaths(std::size_t limit = kRecentArtifactLimit) override;
    std::vector<BuildEvent> RecentBuilds(std::size_t limit = kRecentBuildLimit) override;
    std::size_t CountBuilds() override;
    std::vector<ArtifactSize> MaxSizeByArtifact() override;

    void DeleteArtifact(const std::string& artifact_path) override;
    void DeleteAll() override;

    std::vector<std::string> OldArtifactPaths(uint32_t days) override;
    void DeleteBuildsOlderThan(uint32_t days) override;

private:
    class Statement;

    void Execute(const char* sql);
    void CreateSchema();
    static std::time_t CutoffFor(uint32_t days);

    sqlite3* db_;
    std::mutex mutex_;
};

#endif // SWEEP_SQLITEARTIFACTSTORE_HPP
