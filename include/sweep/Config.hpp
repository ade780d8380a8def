#ifndef SWEEP_CONFIG_HPP
#define SWEEP_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// User settings persisted between sessions.
struct Config {
    std::vector<std::string> scan_paths;
    std::vector<std::string> excluded_paths; // substrings, matched anywhere in a path
    uint32_t retention_days = 30;
    std::string database_path;
    bool debug_logs_enabled = false;
    bool automatic_removal = true;
};

// Defaults with database_path resolved under UserDataDir().
Config DefaultConfig();

// Lightweight YAML-like file holding a Config.
// Parses simple "key: value" lines, ignoring comments (#) and blank lines. Lists are comma separated.
class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path path);

    // Fills `config` from disk. Keys missing from the file keep the values already in `config`.
    // Returns false if the file could not be opened.
    bool Load(Config& config) const;

    // Writes every key, creating the parent directory if needed.
    bool Save(const Config& config) const;

    const std::filesystem::path& Path() const { return path_; }

    // ~/.config/buildsweep/buildsweep.yml (honours XDG_CONFIG_HOME).
    static std::filesystem::path DefaultPath();

private:
    std::filesystem::path path_;
};

// ~/.local/share/buildsweep (honours XDG_DATA_HOME).
std::filesystem::path UserDataDir();

// Strict unsigned decimal parse; rejects signs, blanks, junk and overflow.
bool ParseUnsigned(const std::string& text, uint32_t& value);

#endif // SWEEP_CONFIG_HPP
