#ifndef SWEEP_DIRECTORYWALKER_HPP
#define SWEEP_DIRECTORYWALKER_HPP

#include <filesystem>
#include <functional>

// Bounded-depth walk over the directories below a root. The root itself is depth 0.
// Entries that cannot be read are skipped; symlinked directories are not followed.
class DirectoryWalker {
public:
    static constexpr int kDefaultMaxDepth = 3;

    explicit DirectoryWalker(std::filesystem::path root, int max_depth = kDefaultMaxDepth);

    // Calls `visit` for the root and for every directory down to max_depth, parents before children.
    void ForEachDirectory(const std::function<void(const std::filesystem::path&)>& visit) const;

private:
    void Walk(const std::filesystem::path& dir,
              int depth,
              const std::function<void(const std::filesystem::path&)>& visit) const;

    std::filesystem::path root_;
    int max_depth_;
};

#endif // SWEEP_DIRECTORYWALKER_HPP
