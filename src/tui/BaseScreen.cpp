#include "tui/BaseScreen.hpp"

#include "tui/TextLayout.hpp"

void BaseScreen::ClearAndCenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines) {
    plane.erase();
    unsigned rows = 0;
    unsigned cols = 0;
    plane.get_dim(rows, cols);

    const int total_lines = static_cast<int>(lines.size());
    const int mid_row = static_cast<int>(rows) / 2;

    for (int index = 0; index < total_lines; ++index) {
        const int row = mid_row - total_lines / 2 + index;
        const std::string line = Clip(lines[static_cast<std::size_t>(index)], static_cast<int>(cols));
        plane.putstr(row, ncpp::NCAlign::Center, line.c_str());
    }
}

void BaseScreen::DrawTitleBar(ncpp::Plane& plane, int rows, const std::string& title) {
    const int cols = static_cast<int>(plane.get_dim_x());
    for (int row = 0; row < rows; ++row) {
        const char* left = row == 0 ? "╭" : (row == rows - 1 ? "╰" : "│");
        const char* right = row == 0 ? "╮" : (row == rows - 1 ? "╯" : "│");
        plane.putstr(row, 0, left);
        plane.putstr(row, cols - 1, right);
        if (row == 0 || row == rows - 1) {
            for (int col = 1; col < cols - 1; ++col) {
                plane.putstr(row, col, "─");
            }
        }
    }

    plane.set_fg_rgb8(0, 200, 255);
    const std::string text = Clip(title, cols - 4);
    plane.putstr(rows / 2, ncpp::NCAlign::Center, text.c_str());
    plane.set_fg_default();
}

void BaseScreen::DrawStatusLine(ncpp::Plane& plane, int row, const std::string& text) {
    const int cols = static_cast<int>(plane.get_dim_x());
    plane.set_bg_rgb8(144, 238, 144);
    plane.set_fg_rgb8(0, 0, 0);
    for (int col = 0; col < cols; ++col) {
        plane.putstr(row, col, " ");
    }
    plane.putstr(row, 0, Clip(text, cols).c_str());
    plane.set_bg_default();
    plane.set_fg_default();
}
