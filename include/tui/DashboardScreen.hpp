#ifndef TUI_DASHBOARDSCREEN_HPP
#define TUI_DASHBOARDSCREEN_HPP

#include <string>
#include <vector>

#include "tui/BaseScreen.hpp"
#include "tui/PopupView.hpp"
#include "tui/Subframe.hpp"

class Session;

// Main screen: title bar, five panels in a 3 + 2 grid, key legend, and the active popup on top.
class DashboardScreen : public BaseScreen {
public:
    explicit DashboardScreen(Session& session);

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     const KeyEvent& key) override;

private:
    // A cell of the dashboard grid. Row 0 holds three panels, row 1 holds two.
    class GridPanel : public Subframe {
    public:
        GridPanel(const Session& session, int grid_row, int column);

    protected:
        void ComputeGeometry(unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols) override;

        // Writes `lines` inside the border, clipped to the panel.
        void DrawLines(const std::vector<std::string>& lines);

        const Session& session_;

    private:
        int grid_row_;
        int column_;
    };

    class ArtifactsPanel : public GridPanel {
    public:
        explicit ArtifactsPanel(const Session& session) : GridPanel(session, 0, 0) {}

    protected:
        void DrawContents() override;

    private:
        int scroll_offset_ = 0;
    };

    class HistoryPanel : public GridPanel {
    public:
        explicit HistoryPanel(const Session& session) : GridPanel(session, 0, 1) {}

    protected:
        void DrawContents() override;
    };

    class ChartsPanel : public GridPanel {
    public:
        explicit ChartsPanel(const Session& session) : GridPanel(session, 0, 2) {}

    protected:
        void DrawContents() override;

    private:
        int scroll_offset_ = 0;
    };

    class SettingsPanel : public GridPanel {
    public:
        explicit SettingsPanel(const Session& session) : GridPanel(session, 1, 0) {}

    protected:
        void DrawContents() override;
    };

    class SummaryPanel : public GridPanel {
    public:
        explicit SummaryPanel(const Session& session) : GridPanel(session, 1, 1) {}

    protected:
        void DrawContents() override;
    };

    Session& session_;
    ArtifactsPanel artifacts_panel_;
    HistoryPanel history_panel_;
    ChartsPanel charts_panel_;
    SettingsPanel settings_panel_;
    SummaryPanel summary_panel_;
    PopupView popup_view_;
};

#endif // TUI_DASHBOARDSCREEN_HPP
