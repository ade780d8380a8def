#ifndef SWEEP_ARTIFACTSTORE_HPP
#define SWEEP_ARTIFACTSTORE_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

// A single recorded sighting of an artifact directory.
struct BuildEvent {
    std::string project_path;
    std::string language;
    std::string artifact_path;
    uint64_t size_bytes = 0;
    std::time_t build_time = 0; // Unix seconds
};

struct ArtifactSize {
    std::string artifact_path;
    uint64_t size_bytes = 0;
};

// Raised by store implementations on any query or write failure.
class ArtifactStoreError : public std::runtime_error {
public:
    explicit ArtifactStoreError(const std::string& what) : std::runtime_error(what) {}
};

// Persistent record of discovered artifacts and the build events seen for them.
// Implementations must be safe to call from several threads at once.
class ArtifactStore {
public:
    static constexpr std::size_t kRecentArtifactLimit = 50;
    static constexpr std::size_t kRecentBuildLimit = 10;

    virtual ~ArtifactStore() = default;

    // Records a build event stamped with the current time.
    void LogBuild(const std::string& project_path,
                  const std::string& language,
                  const std::string& artifact_path,
                  uint64_t size_bytes);

    virtual void InsertBuild(const BuildEvent& event) = 0;

    // Distinct artifact paths ordered by their latest build time, newest first.
    virtual std::vector<std::string> RecentArtifactPaths(std::size_t limit = kRecentArtifactLimit) = 0;
    // Newest build events first. artifact_path and size_bytes are filled too.
    virtual std::vector<BuildEvent> RecentBuilds(std::size_t limit = kRecentBuildLimit) = 0;
    virtual std::size_t CountBuilds() = 0;
    // Largest recorded size per artifact path, biggest first.
    virtual std::vector<ArtifactSize> MaxSizeByArtifact() = 0;

    virtual void DeleteArtifact(const std::string& artifact_path) = 0;
    virtual void DeleteAll() = 0;

    // Paths whose most recent build event is older than `days`.
    virtual std::vector<std::string> OldArtifactPaths(uint32_t days) = 0;
    // Drops every event older than `days`, regardless of path.
    virtual void DeleteBuildsOlderThan(uint32_t days) = 0;
};

#endif // SWEEP_ARTIFACTSTORE_HPP
