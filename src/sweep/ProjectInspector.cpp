#include "sweep/ProjectInspector.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace {
bool HasFile(const std::filesystem::path& dir, const char* name) {
    std::error_code ec;
    return std::filesystem::exists(dir / name, ec);
}
}

std::string DetectLanguage(const std::filesystem::path& project_dir) {
    // First match wins; TypeScript is checked before the generic package.json.
    static const std::vector<std::pair<const char*, const char*>> markers{
        {"Cargo.toml", "Rust"},
        {"tsconfig.json", "TypeScript"},
        {"package.json", "JavaScript"},
        {"pyproject.toml", "Python"},
        {"setup.py", "Python"},
        {"requirements.txt", "Python"},
        {"go.mod", "Go"},
        {"pom.xml", "Java"},
        {"build.gradle", "Java"},
        {"build.gradle.kts", "Kotlin"},
        {"composer.json", "PHP"},
        {"Gemfile", "Ruby"},
        {"CMakeLists.txt", "C/C++"},
        {"meson.build", "C/C++"},
        {"Makefile", "C/C++"},
    };

    for (const auto& marker : markers) {
        if (HasFile(project_dir, marker.first)) {
            return marker.second;
        }
    }
    return "Unknown";
}

uint64_t DirectorySize(const std::filesystem::path& dir) {
    uint64_t total = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
            const std::uintmax_t size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += static_cast<uint64_t>(size);
            }
        }
        it.increment(ec);
    }
    return total;
}
