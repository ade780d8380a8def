#include "sweep/DirectoryWalker.hpp"

#include <system_error>
#include <utility>

DirectoryWalker::DirectoryWalker(std::filesystem::path root, int max_depth)
    : root_(std::move(root)), max_depth_(max_depth) {}

void DirectoryWalker::ForEachDirectory(const std::function<void(const std::filesystem::path&)>& visit) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return;
    }
    visit(root_);
    if (max_depth_ > 0) {
        Walk(root_, 0, visit);
    }
}

void DirectoryWalker::Walk(const std::filesystem::path& dir,
                           int depth,
                           const std::function<void(const std::filesystem::path&)>& visit) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }

    const std::filesystem::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        const std::filesystem::directory_entry& entry = *it;
        if (entry.is_symlink(type_ec) || !entry.is_directory(type_ec)) {
            continue;
        }

        visit(entry.path());
        if (depth + 1 < max_depth_) {
            Walk(entry.path(), depth + 1, visit);
        }
    }
}
