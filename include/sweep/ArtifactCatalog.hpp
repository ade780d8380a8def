#ifndef SWEEP_ARTIFACTCATALOG_HPP
#define SWEEP_ARTIFACTCATALOG_HPP

#include <string>
#include <vector>

// Directory names produced by common toolchains (cargo, cmake, npm, pip, gradle, ...).
const std::vector<std::string>& KnownArtifactDirNames();

bool IsKnownArtifactDir(const std::string& name);

// True when any non-empty entry of `excluded` is a substring of `path`.
bool IsExcludedPath(const std::string& path, const std::vector<std::string>& excluded);

#endif // SWEEP_ARTIFACTCATALOG_HPP
