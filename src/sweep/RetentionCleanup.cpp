#include "sweep/RetentionCleanup.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "sweep/ArtifactStore.hpp"

std::size_t RunRetentionCleanup(ArtifactStore& store, uint32_t retention_days) {
    std::vector<std::string> old_paths;
    try {
        old_paths = store.OldArtifactPaths(retention_days);
    } catch (const ArtifactStoreError& e) {
        spdlog::debug("Retention cleanup skipped: {}", e.what());
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& path : old_paths) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            spdlog::warn("Could not remove {}: {}", path, ec.message());
        } else {
            ++removed;
        }
    }

    try {
        store.DeleteBuildsOlderThan(retention_days);
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Retention cleanup could not prune records: {}", e.what());
    }

    spdlog::info("Retention cleanup removed {} of {} artifacts older than {} days",
                 removed, old_paths.size(), retention_days);
    return removed;
}
