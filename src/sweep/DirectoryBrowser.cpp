#include "sweep/DirectoryBrowser.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

DirectoryBrowser::DirectoryBrowser(fs::path start) : current_path_(std::move(start)), selected_index_(0) {
    Refresh();
}

bool DirectoryBrowser::Load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }
    current_path_ = path;
    Refresh();
    return true;
}

void DirectoryBrowser::MoveSelectionUp() {
    if (selected_index_ > 0) {
        --selected_index_;
    }
}

void DirectoryBrowser::MoveSelectionDown() {
    if (selected_index_ + 1 < entries_.size()) {
        ++selected_index_;
    }
}

void DirectoryBrowser::ActivateSelection() {
    if (selected_index_ >= entries_.size()) {
        return;
    }
    if (entries_[selected_index_] == kParentEntry) {
        current_path_ = ParentPath();
        Refresh();
        return;
    }
    Load(current_path_ / entries_[selected_index_]);
}

fs::path DirectoryBrowser::SelectedPath() const {
    if (selected_index_ >= entries_.size() || entries_[selected_index_] == kParentEntry) {
        return ParentPath();
    }
    return current_path_ / entries_[selected_index_];
}

fs::path DirectoryBrowser::ParentPath() const {
    if (current_path_.has_relative_path() && current_path_.has_parent_path()) {
        return current_path_.parent_path();
    }
    return current_path_;
}

void DirectoryBrowser::Refresh() {
    entries_.clear();
    entries_.push_back(kParentEntry);

    std::vector<std::string> dirs;
    std::error_code ec;
    fs::directory_iterator it(current_path_, fs::directory_options::skip_permission_denied, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            dirs.push_back(it->path().filename().string());
        }
    }

    std::sort(dirs.begin(), dirs.end());
    entries_.insert(entries_.end(), dirs.begin(), dirs.end());
    selected_index_ = 0;
}
