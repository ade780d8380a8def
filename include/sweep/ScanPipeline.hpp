#ifndef SWEEP_SCANPIPELINE_HPP
#define SWEEP_SCANPIPELINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sweep/DirectoryWalker.hpp"

class ArtifactStore;
class BuildWatcher;
class LogBuffer;
class ScanResultSlot;

struct ScanRequest {
    std::vector<std::string> roots; // "." is scanned when empty
    std::vector<std::string> excluded;
    int max_depth = DirectoryWalker::kDefaultMaxDepth;
};

// Finds artifact directories below the scan roots on a background thread.
// Progress goes to the shared LogBuffer; the finished list is handed over once through a single slot.
// The pipeline does not guard against overlapping scans, its owner does.
class ScanPipeline {
public:
    // `watcher` may be null.
    ScanPipeline(std::shared_ptr<ArtifactStore> store,
                 std::shared_ptr<BuildWatcher> watcher,
                 std::shared_ptr<LogBuffer> logs);

    // Starts a detached scan and returns immediately. A started scan always offers a result.
    // Returns false when the worker thread could not be started.
    bool Launch(const ScanRequest& request);

    // The completed artifact list, if a scan has finished since the last call.
    std::optional<std::vector<std::string>> TryTakeResult();

    // Scans synchronously and returns what was found. Launch() runs this on a worker thread.
    static std::vector<std::string> Run(const ScanRequest& request,
                                        ArtifactStore& store,
                                        BuildWatcher* watcher,
                                        LogBuffer& logs);

private:
    std::shared_ptr<ArtifactStore> store_;
    std::shared_ptr<BuildWatcher> watcher_;
    std::shared_ptr<LogBuffer> logs_;
    std::shared_ptr<ScanResultSlot> results_;
};

#endif // SWEEP_SCANPIPELINE_HPP
