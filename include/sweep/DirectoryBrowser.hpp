#ifndef SWEEP_DIRECTORYBROWSER_HPP
#define SWEEP_DIRECTORYBROWSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Directory-only browser used to pick a scan root. ".." is always the first entry.
class DirectoryBrowser {
public:
    static constexpr const char* kParentEntry = "..";

    explicit DirectoryBrowser(std::filesystem::path start);

    // Switch to `path`; returns false (and keeps the current directory) if it is not a directory.
    bool Load(const std::filesystem::path& path);

    // Clamped at both ends.
    void MoveSelectionUp();
    void MoveSelectionDown();

    // ".." goes to the parent, anything else descends. Selection resets to the top.
    void ActivateSelection();

    // Path the selected entry points at; ".." resolves to the parent.
    std::filesystem::path SelectedPath() const;

    const std::vector<std::string>& Entries() const { return entries_; }
    std::size_t SelectedIndex() const { return selected_index_; }
    const std::filesystem::path& CurrentPath() const { return current_path_; }

private:
    void Refresh();
    std::filesystem::path ParentPath() const;

    std::filesystem::path current_path_;
    std::vector<std::string> entries_;
    std::size_t selected_index_;
};

#endif // SWEEP_DIRECTORYBROWSER_HPP
