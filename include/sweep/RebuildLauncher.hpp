#ifndef SWEEP_REBUILDLAUNCHER_HPP
#define SWEEP_REBUILDLAUNCHER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct RebuildCommand {
    std::vector<std::string> args;
    std::filesystem::path working_dir;
};

// Picks the build command for the project owning `artifact_path` (its parent directory).
std::optional<RebuildCommand> DetectRebuildCommand(const std::filesystem::path& artifact_path);

// Starts the detected build in the background. False if no build system was found or spawning failed.
bool LaunchRebuild(const std::filesystem::path& artifact_path);

#endif // SWEEP_REBUILDLAUNCHER_HPP
