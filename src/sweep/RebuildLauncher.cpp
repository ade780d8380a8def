#include "sweep/RebuildLauncher.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "sweep/Process.hpp"

namespace fs = std::filesystem;

namespace {

bool Has(const fs::path& dir, const char* name) {
    std::error_code ec;
    return fs::exists(dir / name, ec);
}

} // namespace

std::optional<RebuildCommand> DetectRebuildCommand(const fs::path& artifact_path) {
    fs::path project = artifact_path.parent_path();
    if (project.empty()) {
        project = ".";
    }

    if (Has(project, "Cargo.toml")) {
        return RebuildCommand{{"cargo", "build"}, project};
    }
    if (Has(project, "package.json")) {
        return RebuildCommand{{"npm", "run", "build"}, project};
    }
    if (Has(project, "go.mod")) {
        return RebuildCommand{{"go", "build", "./..."}, project};
    }
    if (Has(project, "pom.xml")) {
        return RebuildCommand{{"mvn", "-q", "package"}, project};
    }
    if (Has(project, "build.gradle") || Has(project, "build.gradle.kts")) {
        return RebuildCommand{{"gradle", "build"}, project};
    }
    // A configured CMake tree can rebuild itself.
    if (Has(project, "CMakeLists.txt") && Has(artifact_path, "CMakeCache.txt")) {
        return RebuildCommand{{"cmake", "--build", artifact_path.string()}, project};
    }
    return std::nullopt;
}

bool LaunchRebuild(const fs::path& artifact_path) {
    std::optional<RebuildCommand> command = DetectRebuildCommand(artifact_path);
    if (!command) {
        spdlog::info("No build system detected for {}", artifact_path.string());
        return false;
    }
    return SpawnDetached(command->args, command->working_dir);
}
