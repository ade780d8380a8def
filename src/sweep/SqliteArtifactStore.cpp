#include "sweep/SqliteArtifactStore.hpp"

#include <filesystem>
#include <system_error>

namespace {
constexpr std::time_t kSecondsPerDay = 24 * 60 * 60;

const char* const kSchema =
    "CREATE TABLE IF NOT EXISTS builds ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  project_path TEXT NOT NULL,"
    "  language TEXT NOT NULL,"
    "  artifact_path TEXT NOT NULL,"
    "  size_bytes INTEGER NOT NULL DEFAULT 0,"
    "  build_time INTEGER NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_builds_artifact ON builds(artifact_path);"
    "CREATE INDEX IF NOT EXISTS idx_builds_time ON builds(build_time);";
}

// Owns one prepared statement; finalized on scope exit.
class SqliteArtifactStore::Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db), stmt_(nullptr) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw ArtifactStoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void BindInt64(int index, int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
    }

    // Returns true while rows are available, false once the statement is done.
    bool Step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw ArtifactStoreError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
    }

    std::string ColumnText(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt_, column);
        if (text == nullptr) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char*>(text));
    }

    int64_t ColumnInt64(int column) const {
        return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
    }

private:
    void Check(int rc) {
        if (rc != SQLITE_OK) {
            throw ArtifactStoreError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

SqliteArtifactStore::SqliteArtifactStore(const std::string& path) : db_(nullptr) {
    if (path != ":memory:") {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = "Could not open artifact database " + path;
        if (db_ != nullptr) {
            message += ": ";
            message += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw ArtifactStoreError(message);
    }

    sqlite3_busy_timeout(db_, 2000);
    try {
        CreateSchema();
    } catch (const ArtifactStoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteArtifactStore::~SqliteArtifactStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

void SqliteArtifactStore::Execute(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error != nullptr ? error : "unknown error";
        sqlite3_free(error);
        throw ArtifactStoreError("SQL failed: " + message);
    }
}

void SqliteArtifactStore::CreateSchema() {
    std::lock_guard<std::mutex> lock(mutex_);
    Execute(kSchema);
}

std::time_t SqliteArtifactStore::CutoffFor(uint32_t days) {
    return std::time(nullptr) - static_cast<std::time_t>(days) * kSecondsPerDay;
}

void SqliteArtifactStore::InsertBuild(const BuildEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "INSERT INTO builds (project_path, language, artifact_path, size_bytes, build_time) "
                   "VALUES (?, ?, ?, ?, ?)");
    stmt.BindText(1, event.project_path);
    stmt.BindText(2, event.language);
    stmt.BindText(3, event.artifact_path);
    stmt.BindInt64(4, static_cast<int64_t>(event.size_bytes));
    stmt.BindInt64(5, static_cast<int64_t>(event.build_time));
    stmt.Step();
}

std::vector<std::string> SqliteArtifactStore::RecentArtifactPaths(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT artifact_path FROM builds GROUP BY artifact_path "
                   "ORDER BY MAX(build_time) DESC, MAX(id) DESC LIMIT ?");
    stmt.BindInt64(1, static_cast<int64_t>(limit));
    std::vector<std::string> paths;
    while (stmt.Step()) {
        paths.push_back(stmt.ColumnText(0));
    }
    return paths;
}

std::vector<BuildEvent> SqliteArtifactStore::RecentBuilds(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT project_path, language, artifact_path, size_bytes, build_time FROM builds "
                   "ORDER BY build_time DESC, id DESC LIMIT ?");
    stmt.BindInt64(1, static_cast<int64_t>(limit));
    std::vector<BuildEvent> events;
    while (stmt.Step()) {
        BuildEvent event;
        event.project_path = stmt.ColumnText(0);
        event.language = stmt.ColumnText(1);
        event.artifact_path = stmt.ColumnText(2);
        event.size_bytes = static_cast<uint64_t>(stmt.ColumnInt64(3));
        event.build_time = static_cast<std::time_t>(stmt.ColumnInt64(4));
        events.push_back(event);
    }
    return events;
}

std::size_t SqliteArtifactStore::CountBuilds() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM builds");
    if (!stmt.Step()) {
        return 0;
    }
    return static_cast<std::size_t>(stmt.ColumnInt64(0));
}

std::vector<ArtifactSize> SqliteArtifactStore::MaxSizeByArtifact() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT artifact_path, MAX(size_bytes) AS size FROM builds "
                   "GROUP BY artifact_path ORDER BY size DESC");
    std::vector<ArtifactSize> sizes;
    while (stmt.Step()) {
        ArtifactSize entry;
        entry.artifact_path = stmt.ColumnText(0);
        entry.size_bytes = static_cast<uint64_t>(stmt.ColumnInt64(1));
        sizes.push_back(entry);
    }
    return sizes;
}

void SqliteArtifactStore::DeleteArtifact(const std::string& artifact_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM builds WHERE artifact_path = ?");
    stmt.BindText(1, artifact_path);
    stmt.Step();
}

void SqliteArtifactStore::DeleteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    Execute("DELETE FROM builds");
}

std::vector<std::string> SqliteArtifactStore::OldArtifactPaths(uint32_t days) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT artifact_path FROM builds GROUP BY artifact_path "
                   "HAVING MAX(build_time) < ?");
    stmt.BindInt64(1, static_cast<int64_t>(CutoffFor(days)));
    std::vector<std::string> paths;
    while (stmt.Step()) {
        paths.push_back(stmt.ColumnText(0));
    }
    return paths;
}

void SqliteArtifactStore::DeleteBuildsOlderThan(uint32_t days) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM builds WHERE build_time < ?");
    stmt.BindInt64(1, static_cast<int64_t>(CutoffFor(days)));
    stmt.Step();
}
