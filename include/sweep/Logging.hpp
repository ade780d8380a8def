#ifndef SWEEP_LOGGING_HPP
#define SWEEP_LOGGING_HPP

#include <filesystem>

// Installs the default spdlog logger writing to `log_file`.
// The terminal is owned by notcurses while the UI runs, so nothing goes to the console.
// Falls back to a null sink when the file cannot be opened; returns false in that case.
bool InitLogging(const std::filesystem::path& log_file, bool debug);

// Default log location: ~/.local/share/buildsweep/buildsweep.log.
std::filesystem::path DefaultLogPath();

#endif // SWEEP_LOGGING_HPP
