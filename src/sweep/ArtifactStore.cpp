#include "sweep/ArtifactStore.hpp"

void ArtifactStore::LogBuild(const std::string& project_path,
                             const std::string& language,
                             const std::string& artifact_path,
                             uint64_t size_bytes) {
    BuildEvent event;
    event.project_path = project_path;
    event.language = language;
    event.artifact_path = artifact_path;
    event.size_bytes = size_bytes;
    event.build_time = std::time(nullptr);
    InsertBuild(event);
}
