#include "sweep/ScanPipeline.hpp"

#include <exception>
#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "sweep/ArtifactCatalog.hpp"
#include "sweep/ArtifactStore.hpp"
#include "sweep/BackgroundTask.hpp"
#include "sweep/BuildWatcher.hpp"
#include "sweep/LogBuffer.hpp"
#include "sweep/ProjectInspector.hpp"
#include "sweep/ScanResultSlot.hpp"

namespace fs = std::filesystem;

ScanPipeline::ScanPipeline(std::shared_ptr<ArtifactStore> store,
                           std::shared_ptr<BuildWatcher> watcher,
                           std::shared_ptr<LogBuffer> logs)
    : store_(std::move(store)),
      watcher_(std::move(watcher)),
      logs_(std::move(logs)),
      results_(std::make_shared<ScanResultSlot>()) {}

bool ScanPipeline::Launch(const ScanRequest& request) {
    auto store = store_;
    auto watcher = watcher_;
    auto logs = logs_;
    auto results = results_;
    return RunDetached("scan", [request, store, watcher, logs, results]() {
        // A result is always offered, even an empty one, so the session never waits forever.
        std::vector<std::string> found;
        try {
            found = Run(request, *store, watcher.get(), *logs);
        } catch (const std::exception& e) {
            spdlog::error("Scan aborted: {}", e.what());
            logs->Append(std::string("Scan failed: ") + e.what());
        }
        if (!results->Offer(std::move(found))) {
            spdlog::warn("Previous scan result was never collected; dropping the new one");
        }
    });
}

std::optional<std::vector<std::string>> ScanPipeline::TryTakeResult() {
    return results_->TryTake();
}

std::vector<std::string> ScanPipeline::Run(const ScanRequest& request,
                                           ArtifactStore& store,
                                           BuildWatcher* watcher,
                                           LogBuffer& logs) {
    logs.Append("Starting scan...");

    std::vector<std::string> roots = request.roots;
    if (roots.empty()) {
        roots.push_back(".");
    }

    std::vector<std::string> found;
    for (const auto& root : roots) {
        logs.Append("Scanning path: " + root);
        std::size_t count = 0;

        DirectoryWalker walker(root, request.max_depth);
        walker.ForEachDirectory([&](const fs::path& dir) {
            const std::string path = dir.string();
            if (!IsKnownArtifactDir(dir.filename().string()) || IsExcludedPath(path, request.excluded)) {
                return;
            }

            fs::path project = dir.parent_path();
            if (project.empty()) {
                project = ".";
            }
            found.push_back(path);
            ++count;

            try {
                store.LogBuild(project.string(), DetectLanguage(project), path, DirectorySize(dir));
            } catch (const std::exception& e) {
                spdlog::warn("Could not record {}: {}", path, e.what());
            }
            if (watcher != nullptr) {
                watcher->Watch(path);
            }
        });

        logs.Append("Scan complete for " + root + ". Found " + std::to_string(count) + " artifacts.");
    }

    logs.Append("Total scan complete. Found " + std::to_string(found.size()) + " artifacts.");
    spdlog::info("Scan finished: {} artifacts in {} roots", found.size(), roots.size());
    return found;
}
