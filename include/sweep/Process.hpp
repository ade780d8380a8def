#ifndef SWEEP_PROCESS_HPP
#define SWEEP_PROCESS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Runs args[0] (looked up on PATH) and waits for it. stdout and stderr go to /dev/null.
// `stdin_data`, when present, is written to the child's stdin through a pipe, then the pipe is closed.
// Returns the exit code, or -1 if the process could not be started or did not exit normally.
int RunProcess(const std::vector<std::string>& args,
               const std::optional<std::string>& stdin_data = std::nullopt);

// Starts args[0] in `cwd` without waiting for it; a detached thread reaps the child.
// Returns false if the process could not be started.
bool SpawnDetached(const std::vector<std::string>& args, const std::filesystem::path& cwd);

#endif // SWEEP_PROCESS_HPP
