#ifndef SWEEP_PROJECTINSPECTOR_HPP
#define SWEEP_PROJECTINSPECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>

// Guesses the main language of a project from its manifest files.
// Returns "Unknown" when no known marker is present.
std::string DetectLanguage(const std::filesystem::path& project_dir);

// Total size of regular files below `dir`. Unreadable entries are skipped, symlinks are not followed.
uint64_t DirectorySize(const std::filesystem::path& dir);

#endif // SWEEP_PROJECTINSPECTOR_HPP
