#include "sweep/ArtifactCatalog.hpp"

#include <algorithm>

const std::vector<std::string>& KnownArtifactDirNames() {
    static const std::vector<std::string> names{
        // Rust
        "target",
        // C/C++
        "build",
        ".build",
        "cmake-build-debug",
        "cmake-build-release",
        "Debug",
        "Release",
        // JavaScript/TypeScript
        "node_modules",
        "dist",
        ".next",
        ".parcel-cache",
        ".cache",
        // Python
        "__pycache__",
        ".eggs",
        "eggs",
        // Java/Gradle
        ".gradle",
        // PHP/Composer
        "vendor",
        // Ruby
        ".bundle",
        // Generic outputs
        "out",
        ".output",
        ".nyc_output",
    };
    return names;
}

bool IsKnownArtifactDir(const std::string& name) {
    const std::vector<std::string>& names = KnownArtifactDirNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool IsExcludedPath(const std::string& path, const std::vector<std::string>& excluded) {
    for (const std::string& pattern : excluded) {
        if (!pattern.empty() && path.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}
