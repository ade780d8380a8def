#ifndef TUI_TEXTLAYOUT_HPP
#define TUI_TEXTLAYOUT_HPP

#include <string>
#include <vector>

// Cuts `text` to at most `width` columns, ending in "..." when shortened.
// Counts code points, which is good enough for the paths and labels drawn here.
std::string Clip(const std::string& text, int width);

std::vector<std::string> SplitLines(const std::string& text);

// Drops "<root>/" from the front of `path` so lists stay readable.
std::string RelativeTo(const std::string& path, const std::string& root);

#endif // TUI_TEXTLAYOUT_HPP
