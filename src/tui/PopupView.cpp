#include "tui/PopupView.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <notcurses/notcurses.h>

#include "sweep/LogBuffer.hpp"
#include "sweep/Popup.hpp"
#include "sweep/Session.hpp"
#include "tui/TextLayout.hpp"

namespace {

void SetColor(unsigned char (&target)[3], unsigned char r, unsigned char g, unsigned char b) {
    target[0] = r;
    target[1] = g;
    target[2] = b;
}

void AppendLines(std::vector<std::string>& lines, const std::string& text) {
    for (std::string& line : SplitLines(text)) {
        lines.push_back(std::move(line));
    }
}

} // namespace

void PopupView::Draw(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols, const Session& session) {
    Frame frame;
    if (!Describe(session, frame)) {
        plane_.reset();
        rows_ = cols_ = 0;
        return;
    }

    const int rows = std::max(5, static_cast<int>(parent_rows) * frame.height_percent / 100);
    const int cols = std::max(20, static_cast<int>(parent_cols) * frame.width_percent / 100);
    const int y = (static_cast<int>(parent_rows) - rows) / 2;
    const int x = (static_cast<int>(parent_cols) - cols) / 2;
    EnsurePlane(parent, rows, cols, std::max(0, y), std::max(0, x));
    Paint(frame);
}

bool PopupView::Describe(const Session& session, Frame& frame) {
    const PopupState& popup = session.Popup();
    const Config& config = session.Settings();

    if (const auto* settings = popup.As<PopupState::SettingsList>()) {
        frame.title = "Settings (Up/Down, Enter, Esc)";
        frame.lines = {
            "Retention Days: " + std::to_string(config.retention_days),
            "Scan Path: " + (config.scan_paths.empty() ? std::string(".") : config.scan_paths.front()),
            std::string("Automatic Removal: ") + (session.AutomaticRemoval() ? "Enabled" : "Disabled"),
            "Excluded Paths (" + std::to_string(config.excluded_paths.size()) + ")",
        };
        frame.highlighted = static_cast<int>(settings->selected);
        return true;
    }
    if (const auto* input = popup.As<PopupState::Input>()) {
        frame.title = "Edit (Enter: Apply, Esc: Cancel)";
        frame.height_percent = 25;
        std::string shown = input->buffer;
        if (input->title == kPasswordPromptTitle) {
            // One mask character per code point.
            shown.clear();
            for (unsigned char c : input->buffer) {
                if ((c & 0xC0) != 0x80) {
                    shown += '*';
                }
            }
        }
        frame.lines = {input->title + ": " + shown + "_"};
        return true;
    }
    if (const auto* browse = popup.As<PopupState::DirBrowse>()) {
        frame.title = "Browse: " + browse->browser.CurrentPath().string();
        frame.width_percent = 70;
        frame.height_percent = 70;
        frame.lines = {"Up/Down: Nav | Enter: Open | s: Select | Space: Select Current | Esc: Cancel", ""};
        for (const std::string& entry : browse->browser.Entries()) {
            frame.lines.push_back(entry == DirectoryBrowser::kParentEntry ? entry : entry + "/");
        }
        frame.highlighted = 2 + static_cast<int>(browse->browser.SelectedIndex());
        return true;
    }
    if (const auto* logs = popup.As<PopupState::Logs>()) {
        frame.title = "Logs (Esc to close)";
        frame.width_percent = 80;
        frame.height_percent = 70;
        frame.lines = logs->logs->Snapshot();
        frame.tail = true;
        return true;
    }
    if (const auto* scanning = popup.As<PopupState::Scanning>()) {
        frame.title = "Scanning for new artifacts";
        frame.width_percent = 80;
        frame.height_percent = 70;
        frame.lines = {"Press any key to close", ""};
        for (std::string& line : scanning->logs->Snapshot()) {
            frame.lines.push_back(std::move(line));
        }
        frame.tail = true;
        return true;
    }
    if (const auto* actions = popup.As<PopupState::ArtifactActions>()) {
        frame.title = "SELECT ACTION";
        frame.width_percent = 40;
        frame.height_percent = 30;
        frame.lines = {"Delete", "Rebuild"};
        frame.highlighted = static_cast<int>(actions->selected);
        SetColor(frame.bg, 200, 40, 40);
        SetColor(frame.fg, 0, 0, 0);
        return true;
    }
    if (popup.Is<PopupState::ClearAllConfirmation>()) {
        frame.title = "CLEAR ALL BUILDS";
        frame.height_percent = 35;
        frame.lines = {"This permanently deletes every listed artifact from disk", "and clears the build history.", "", "y: Yes | n: No"};
        SetColor(frame.bg, 200, 40, 40);
        SetColor(frame.fg, 0, 0, 0);
        return true;
    }
    if (const auto* confirm = popup.As<PopupState::ConfirmAction>()) {
        frame.title = "CONFIRM ACTION";
        AppendLines(frame.lines, confirm->message);
        frame.lines.push_back("");
        frame.lines.push_back("Enter: Confirm | Esc: Cancel");
        SetColor(frame.bg, 230, 200, 0);
        SetColor(frame.fg, 0, 0, 0);
        return true;
    }
    if (const auto* progress = popup.As<PopupState::Progress>()) {
        frame.title = "Progress";
        frame.height_percent = 30;
        AppendLines(frame.lines, progress->message);
        frame.lines.push_back("");
        frame.lines.push_back("Press Esc to close.");
        return true;
    }
    if (const auto* info = popup.As<PopupState::Info>()) {
        frame.title = "Info";
        frame.height_percent = 30;
        AppendLines(frame.lines, info->message);
        frame.lines.push_back("");
        frame.lines.push_back("Press any key to close.");
        return true;
    }
    if (const auto* excluded = popup.As<PopupState::ExcludedPathsList>()) {
        frame.title = "Excluded Paths (Up/Down, Enter to remove, Esc)";
        frame.width_percent = 70;
        if (excluded->paths.empty()) {
            frame.lines = {"No excluded paths"};
        } else {
            frame.lines = excluded->paths;
            frame.highlighted = static_cast<int>(excluded->selected);
        }
        return true;
    }
    return false;
}

void PopupView::EnsurePlane(ncpp::Plane& parent, int rows, int cols, int y, int x) {
    if (plane_ == nullptr || rows_ != rows || cols_ != cols) {
        plane_ = std::make_unique<ncpp::Plane>(&parent, rows, cols, y, x);
        rows_ = rows;
        cols_ = cols;
    } else {
        plane_->move(y, x);
    }
    plane_->move_top();
}

void PopupView::Paint(const Frame& frame) {
    plane_->erase();

    // Opaque background so the dashboard does not bleed through.
    plane_->set_bg_rgb8(frame.bg[0], frame.bg[1], frame.bg[2]);
    plane_->set_fg_rgb8(frame.fg[0], frame.fg[1], frame.fg[2]);
    const std::string blank(static_cast<std::size_t>(cols_), ' ');
    for (int row = 0; row < rows_; ++row) {
        plane_->putstr(row, 0, blank.c_str());
    }

    uint64_t channels = 0;
    ncchannels_set_fg_rgb8(&channels, frame.fg[0], frame.fg[1], frame.fg[2]);
    ncchannels_set_bg_rgb8(&channels, frame.bg[0], frame.bg[1], frame.bg[2]);
    plane_->perimeter_rounded(0, channels, 0);
    plane_->putstr(0, 2, (" " + Clip(frame.title, cols_ - 6) + " ").c_str());

    const int top = 2;
    const int left = 3;
    const int height = std::max(0, rows_ - 3);
    const int width = std::max(0, cols_ - 6);
    const int count = static_cast<int>(frame.lines.size());

    int first = 0;
    if (frame.tail && count > height) {
        first = count - height;
    } else if (frame.highlighted >= height) {
        first = frame.highlighted - height + 1;
    }

    for (int i = 0; i < height && first + i < count; ++i) {
        const int index = first + i;
        if (index == frame.highlighted) {
            plane_->set_bg_rgb8(80, 140, 255);
            plane_->set_fg_rgb8(0, 0, 0);
            plane_->putstr(top + i, left - 1, std::string(static_cast<std::size_t>(width + 2), ' ').c_str());
        }
        plane_->putstr(top + i, left, Clip(frame.lines[static_cast<std::size_t>(index)], width).c_str());
        if (index == frame.highlighted) {
            plane_->set_bg_rgb8(frame.bg[0], frame.bg[1], frame.bg[2]);
            plane_->set_fg_rgb8(frame.fg[0], frame.fg[1], frame.fg[2]);
        }
    }

    plane_->set_bg_default();
    plane_->set_fg_default();
}
