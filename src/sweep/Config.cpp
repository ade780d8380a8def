#include "sweep/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace {
std::string Trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string item = Trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

std::string JoinList(const std::vector<std::string>& items) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined;
}

bool ParseBool(const std::string& raw, bool fallback) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return fallback;
}

std::filesystem::path HomeDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        std::error_code ec;
        return std::filesystem::current_path(ec);
    }
    return std::filesystem::path(home);
}

std::filesystem::path XdgDir(const char* variable, const char* fallback) {
    const char* value = std::getenv(variable);
    if (value != nullptr && *value != '\0') {
        return std::filesystem::path(value);
    }
    return HomeDir() / fallback;
}
}

Config DefaultConfig() {
    Config config;
    config.database_path = (UserDataDir() / "artifacts.db").string();
    return config;
}

ConfigStore::ConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

bool ConfigStore::Load(Config& config) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return false;
    }

    std::unordered_map<std::string, std::string> values;
    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        values[Trim(trimmed.substr(0, colon))] = Trim(trimmed.substr(colon + 1));
    }

    auto it = values.find("scan_paths");
    if (it != values.end()) {
        config.scan_paths = SplitList(it->second);
    }
    it = values.find("excluded_paths");
    if (it != values.end()) {
        config.excluded_paths = SplitList(it->second);
    }
    it = values.find("retention_days");
    if (it != values.end()) {
        uint32_t days = 0;
        if (ParseUnsigned(it->second, days)) {
            config.retention_days = days;
        }
    }
    it = values.find("database_path");
    if (it != values.end() && !it->second.empty()) {
        config.database_path = it->second;
    }
    it = values.find("debug_logs_enabled");
    if (it != values.end()) {
        config.debug_logs_enabled = ParseBool(it->second, config.debug_logs_enabled);
    }
    it = values.find("automatic_removal");
    if (it != values.end()) {
        config.automatic_removal = ParseBool(it->second, config.automatic_removal);
    }
    return true;
}

bool ConfigStore::Save(const Config& config) const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_);
    if (!out.is_open()) {
        return false;
    }
    out << "# buildsweep settings\n";
    out << "scan_paths: " << JoinList(config.scan_paths) << "\n";
    out << "excluded_paths: " << JoinList(config.excluded_paths) << "\n";
    out << "retention_days: " << config.retention_days << "\n";
    out << "database_path: " << config.database_path << "\n";
    out << "debug_logs_enabled: " << (config.debug_logs_enabled ? "true" : "false") << "\n";
    out << "automatic_removal: " << (config.automatic_removal ? "true" : "false") << "\n";
    return static_cast<bool>(out);
}

std::filesystem::path ConfigStore::DefaultPath() {
    return XdgDir("XDG_CONFIG_HOME", ".config") / "buildsweep" / "buildsweep.yml";
}

std::filesystem::path UserDataDir() {
    return XdgDir("XDG_DATA_HOME", ".local/share") / "buildsweep";
}

bool ParseUnsigned(const std::string& text, uint32_t& value) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    uint64_t parsed = 0;
    for (char c : trimmed) {
        if (c < '0' || c > '9') {
            return false;
        }
        parsed = parsed * 10 + static_cast<uint64_t>(c - '0');
        if (parsed > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}
