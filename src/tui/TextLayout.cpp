#include "tui/TextLayout.hpp"

#include <cstddef>

namespace {

std::size_t CodePoints(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Byte offset where the code point at index `n` starts.
std::size_t ByteOffset(const std::string& text, std::size_t n) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == n) {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

} // namespace

std::string Clip(const std::string& text, int width) {
    if (width <= 0) {
        return std::string();
    }
    const std::size_t limit = static_cast<std::size_t>(width);
    if (CodePoints(text) <= limit) {
        return text;
    }
    if (limit <= 3) {
        return text.substr(0, ByteOffset(text, limit));
    }
    return text.substr(0, ByteOffset(text, limit - 3)) + "...";
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string RelativeTo(const std::string& path, const std::string& root) {
    if (root.empty()) {
        return path;
    }
    const std::string prefix = root.back() == '/' ? root : root + "/";
    if (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0) {
        return path.substr(prefix.size());
    }
    return path;
}
