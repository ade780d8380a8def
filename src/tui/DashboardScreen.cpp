#include "tui/DashboardScreen.hpp"

#include <algorithm>
#include <cstdint>

#include "sweep/Config.hpp"
#include "sweep/Session.hpp"
#include "tui/StateMachine.hpp"
#include "tui/TextLayout.hpp"

namespace {
constexpr int kTitleRows = 3;
constexpr int kFooterRows = 1;
constexpr int kMinRows = 16;
constexpr int kMinCols = 60;
constexpr int kChartNameWidth = 15;

const char* const kLegend =
    "Tab: Focus | s: Scan | d: Delete | x: Exclude | r: Rebuild | h: History | e: Settings | l: Logs | "
    "Shift+D: Clear All | q: Quit";

struct Rgb {
    int r;
    int g;
    int b;
};

// Colour hint for the toolchain that produced an artifact.
Rgb ArtifactColor(const std::string& path) {
    if (path.find("target") != std::string::npos) {
        return {0, 200, 0};
    }
    if (path.find("node_modules") != std::string::npos) {
        return {80, 140, 255};
    }
    if (path.find("__pycache__") != std::string::npos) {
        return {230, 200, 0};
    }
    if (path.find("build") != std::string::npos) {
        return {230, 60, 60};
    }
    return {230, 230, 230};
}

const Rgb kChartColors[] = {
    {230, 60, 60}, {0, 200, 0}, {80, 140, 255}, {230, 200, 0}, {200, 80, 200}, {0, 200, 200}, {230, 230, 230},
};

std::string FirstRoot(const Config& config) {
    return config.scan_paths.empty() ? std::string() : config.scan_paths.front();
}

// Keeps `selected` inside a window of `visible` rows starting at `offset`.
int ScrollToShow(int offset, int selected, int visible) {
    if (visible <= 0) {
        return 0;
    }
    if (selected < offset) {
        return selected;
    }
    if (selected >= offset + visible) {
        return selected - visible + 1;
    }
    return offset;
}

std::string PadRight(const std::string& text, std::size_t width) {
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}
} // namespace

DashboardScreen::DashboardScreen(Session& session)
    : session_(session),
      artifacts_panel_(session),
      history_panel_(session),
      charts_panel_(session),
      settings_panel_(session),
      summary_panel_(session) {}

void DashboardScreen::Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    session_.ReloadHistory();
}

void DashboardScreen::Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    stdplane.erase();
    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);

    if (static_cast<int>(rows) < kMinRows || static_cast<int>(cols) < kMinCols) {
        ClearAndCenterLines(stdplane, {"Terminal too small", "Resize the window or press q to quit"});
        return;
    }

    DrawTitleBar(stdplane, kTitleRows, "buildsweep - Build Artifact Purge Tool");

    const Panel focus = session_.FocusedPanel();
    artifacts_panel_.SetFocused(focus == Panel::Artifacts);
    history_panel_.SetFocused(focus == Panel::History);
    charts_panel_.SetFocused(focus == Panel::Charts);
    settings_panel_.SetFocused(focus == Panel::Settings);
    summary_panel_.SetFocused(focus == Panel::Summary);

    GridPanel* panels[] = {&artifacts_panel_, &history_panel_, &charts_panel_, &settings_panel_, &summary_panel_};
    for (GridPanel* panel : panels) {
        panel->Resize(stdplane, rows, cols);
        panel->Draw();
    }

    DrawStatusLine(stdplane, static_cast<int>(rows) - kFooterRows, kLegend);
    popup_view_.Draw(stdplane, rows, cols, session_);
}

void DashboardScreen::Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)nc;
    (void)stdplane;
    session_.Tick();
    if (session_.ShouldQuit()) {
        machine.RequestStop();
    }
}

void DashboardScreen::HandleInput(StateMachine& machine,
                                  ncpp::NotCurses& nc,
                                  ncpp::Plane& stdplane,
                                  const KeyEvent& key) {
    (void)nc;
    (void)stdplane;
    session_.HandleKey(key);
    if (session_.ShouldQuit()) {
        machine.RequestStop();
    }
}

DashboardScreen::GridPanel::GridPanel(const Session& session, int grid_row, int column)
    : session_(session), grid_row_(grid_row), column_(column) {}

void DashboardScreen::GridPanel::ComputeGeometry(unsigned parent_rows,
                                                 unsigned parent_cols,
                                                 int& y,
                                                 int& x,
                                                 int& rows,
                                                 int& cols) {
    const int grid_rows = static_cast<int>(parent_rows) - kTitleRows - kFooterRows;
    const int top_rows = grid_rows / 2;
    const int columns = grid_row_ == 0 ? 3 : 2;
    const int width = static_cast<int>(parent_cols) / columns;

    y = kTitleRows + (grid_row_ == 0 ? 0 : top_rows);
    rows = grid_row_ == 0 ? top_rows : grid_rows - top_rows;
    x = column_ * width;
    // The last column absorbs the rounding remainder.
    cols = column_ == columns - 1 ? static_cast<int>(parent_cols) - x : width;
}

void DashboardScreen::GridPanel::DrawLines(const std::vector<std::string>& lines) {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    for (int i = 0; i < area.height && i < static_cast<int>(lines.size()); ++i) {
        plane_->putstr(area.top + i, area.left, Clip(lines[static_cast<std::size_t>(i)], area.width).c_str());
    }
}

void DashboardScreen::ArtifactsPanel::DrawContents() {
    DrawBorder("Artifacts (" + std::to_string(session_.Artifacts().size()) + ")");

    const std::vector<std::string>& artifacts = session_.Artifacts();
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (artifacts.empty()) {
        plane_->putstr(area.top, area.left, Clip(session_.IsScanning() ? "Scanning..." : "No artifacts", area.width).c_str());
        return;
    }

    const int selected = static_cast<int>(session_.Selected());
    scroll_offset_ = ScrollToShow(scroll_offset_, selected, area.height);
    const std::string root = FirstRoot(session_.Settings());

    for (int i = 0; i < area.height && scroll_offset_ + i < static_cast<int>(artifacts.size()); ++i) {
        const int index = scroll_offset_ + i;
        const std::string& path = artifacts[static_cast<std::size_t>(index)];
        if (focused_ && index == selected) {
            plane_->set_bg_rgb8(80, 140, 255);
            plane_->set_fg_rgb8(0, 0, 0);
            plane_->putstr(area.top + i, area.left, std::string(static_cast<std::size_t>(area.width), ' ').c_str());
        } else {
            const Rgb color = ArtifactColor(path);
            plane_->set_bg_default();
            plane_->set_fg_rgb8(color.r, color.g, color.b);
        }
        plane_->putstr(area.top + i, area.left, Clip(RelativeTo(path, root), area.width).c_str());
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}

void DashboardScreen::HistoryPanel::DrawContents() {
    DrawBorder("History");
    const std::vector<std::string>& history = session_.History();
    if (history.empty()) {
        DrawLines({"No builds recorded"});
        return;
    }
    DrawLines(history);
}

void DashboardScreen::ChartsPanel::DrawContents() {
    DrawBorder("Charts");

    const std::vector<ArtifactSize>& data = session_.ChartData();
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (data.empty()) {
        DrawLines({"No data"});
        return;
    }

    uint64_t max_size = 1;
    for (const ArtifactSize& entry : data) {
        max_size = std::max(max_size, entry.size_bytes);
    }

    // name, space, bar, space, "<n>MB"
    const int bar_width = std::max(1, area.width - kChartNameWidth - 2 - 8);
    const int selected = static_cast<int>(session_.ChartSelected());
    scroll_offset_ = ScrollToShow(scroll_offset_, selected, area.height);
    const std::string root = FirstRoot(session_.Settings());

    for (int i = 0; i < area.height && scroll_offset_ + i < static_cast<int>(data.size()); ++i) {
        const int index = scroll_offset_ + i;
        const ArtifactSize& entry = data[static_cast<std::size_t>(index)];
        const int bar_len = static_cast<int>(entry.size_bytes * static_cast<uint64_t>(bar_width) / max_size);

        std::string line = PadRight(Clip(RelativeTo(entry.artifact_path, root), kChartNameWidth), kChartNameWidth);
        line += ' ';
        for (int b = 0; b < bar_len; ++b) {
            line += "█";
        }
        line += ' ' + std::to_string(entry.size_bytes / 1000000) + "MB";

        if (focused_ && index == selected) {
            plane_->set_bg_rgb8(80, 140, 255);
            plane_->set_fg_rgb8(255, 255, 255);
        } else {
            const Rgb color = kChartColors[static_cast<std::size_t>(index) % (sizeof(kChartColors) / sizeof(kChartColors[0]))];
            plane_->set_bg_default();
            plane_->set_fg_rgb8(color.r, color.g, color.b);
        }
        plane_->putstr(area.top + i, area.left, Clip(line, area.width).c_str());
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}

void DashboardScreen::SettingsPanel::DrawContents() {
    DrawBorder("Settings");
    const Config& config = session_.Settings();

    std::string paths;
    for (const std::string& path : config.scan_paths) {
        paths += (paths.empty() ? "" : ",") + path;
    }

    DrawLines({
        "DB: " + config.database_path,
        "Paths: " + (paths.empty() ? std::string(".") : paths),
        "Retention Days: " + std::to_string(config.retention_days),
        std::string("Automatic Removal: ") + (session_.AutomaticRemoval() ? "Enabled" : "Disabled"),
        "Excluded Paths: " + std::to_string(config.excluded_paths.size()),
    });
}

void DashboardScreen::SummaryPanel::DrawContents() {
    DrawBorder("Summary");
    DrawLines({
        "Total Builds: " + std::to_string(session_.TotalBuilds()),
        "Artifacts: " + std::to_string(session_.Artifacts().size()),
        std::string("Scans: ") + (session_.IsScanning() ? "Running" : "Idle"),
        std::string("Watcher: ") + (session_.WatcherRunning() ? "Running" : "Unavailable"),
    });
}
