#ifndef TUI_POPUPVIEW_HPP
#define TUI_POPUPVIEW_HPP

#include <memory>
#include <string>
#include <vector>

#include <ncpp/Plane.hh>

class Session;

// Paints the session's active popup on a top-most plane centered over the dashboard.
class PopupView {
public:
    void Draw(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols, const Session& session);

private:
    struct Frame {
        std::string title;
        std::vector<std::string> lines;
        int highlighted = -1; // index into lines
        int width_percent = 60;
        int height_percent = 50;
        unsigned char bg[3] = {0, 0, 0};
        unsigned char fg[3] = {255, 255, 255};
        bool tail = false; // keep the last lines visible instead of the first
    };

    static bool Describe(const Session& session, Frame& frame);
    void Paint(const Frame& frame);
    void EnsurePlane(ncpp::Plane& parent, int rows, int cols, int y, int x);

    std::unique_ptr<ncpp::Plane> plane_;
    int rows_ = 0;
    int cols_ = 0;
};

#endif // TUI_POPUPVIEW_HPP
