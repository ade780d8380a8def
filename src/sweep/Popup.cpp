#include "sweep/Popup.hpp"

namespace {

std::size_t WrapUp(std::size_t selected, std::size_t count) {
    return selected == 0 ? count - 1 : selected - 1;
}

std::size_t WrapDown(std::size_t selected, std::size_t count) {
    return (selected + 1) % count;
}

} // namespace

std::optional<PopupCommand> PopupState::HandleKey(const KeyEvent& key) {
    if (auto* settings = std::get_if<SettingsList>(&state_)) {
        return HandleSettings(*settings, key);
    }
    if (auto* input = std::get_if<Input>(&state_)) {
        return HandleInput(*input, key);
    }
    if (auto* browse = std::get_if<DirBrowse>(&state_)) {
        return HandleDirBrowse(*browse, key);
    }
    if (auto* actions = std::get_if<ArtifactActions>(&state_)) {
        return HandleArtifactActions(*actions, key);
    }
    if (auto* excluded = std::get_if<ExcludedPathsList>(&state_)) {
        return HandleExcludedPaths(*excluded, key);
    }

    if (Is<Scanning>() || Is<Info>()) {
        Close();
        return std::nullopt;
    }
    if (Is<Logs>() || Is<Progress>()) {
        if (key.code == KeyCode::Esc) {
            Close();
        }
        return std::nullopt;
    }
    if (Is<ClearAllConfirmation>()) {
        if (key.IsChar('y') || key.IsChar('Y')) {
            Close();
            return PopupCommand::Of(PopupCommand::Kind::ClearAllBuilds);
        }
        if (key.IsChar('n') || key.IsChar('N') || key.code == KeyCode::Esc) {
            Close();
        }
        return std::nullopt;
    }
    if (auto* confirm = std::get_if<ConfirmAction>(&state_)) {
        if (key.code == KeyCode::Enter) {
            std::string action = confirm->action;
            Close();
            return PopupCommand::Confirm(std::move(action));
        }
        if (key.code == KeyCode::Esc) {
            Close();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<PopupCommand> PopupState::HandleSettings(SettingsList& state, const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Up:
        state.selected = WrapUp(state.selected, SettingsList::kEntryCount);
        break;
    case KeyCode::Down:
        state.selected = WrapDown(state.selected, SettingsList::kEntryCount);
        break;
    case KeyCode::Enter: {
        std::optional<PopupCommand> command;
        switch (state.selected) {
        case 0:
            command = PopupCommand{PopupCommand::Kind::OpenInput, kRetentionDaysTitle, {}};
            break;
        case 1:
            command = PopupCommand::Of(PopupCommand::Kind::OpenDirBrowse);
            break;
        case 2:
            command = PopupCommand::Of(PopupCommand::Kind::ToggleRemoval);
            break;
        case 3:
            command = PopupCommand::Of(PopupCommand::Kind::OpenExcludedPaths);
            break;
        default:
            break;
        }
        Close();
        return command;
    }
    case KeyCode::Esc:
        Close();
        break;
    default:
        break;
    }
    return std::nullopt;
}

std::optional<PopupCommand> PopupState::HandleInput(Input& state, const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Char:
        AppendUtf8(state.buffer, key.ch);
        break;
    case KeyCode::Backspace:
        PopLastUtf8(state.buffer);
        break;
    case KeyCode::Enter: {
        PopupCommand command = PopupCommand::SetValue(std::move(state.title), std::move(state.buffer));
        Close();
        return command;
    }
    case KeyCode::Esc:
        Close();
        break;
    default:
        break;
    }
    return std::nullopt;
}

std::optional<PopupCommand> PopupState::HandleDirBrowse(DirBrowse& state, const KeyEvent& key) {
    if (key.IsChar('s')) {
        std::string path = state.browser.SelectedPath().string();
        Close();
        return PopupCommand::SetValue(kScanPathKey, std::move(path));
    }
    if (key.IsChar(' ')) {
        std::string path = state.browser.CurrentPath().string();
        Close();
        return PopupCommand::SetValue(kScanPathKey, std::move(path));
    }

    switch (key.code) {
    case KeyCode::Up:
        state.browser.MoveSelectionUp();
        break;
    case KeyCode::Down:
        state.browser.MoveSelectionDown();
        break;
    case KeyCode::Enter:
        state.browser.ActivateSelection();
        break;
    case KeyCode::Esc:
        Close();
        break;
    default:
        break;
    }
    return std::nullopt;
}

std::optional<PopupCommand> PopupState::HandleArtifactActions(ArtifactActions& state, const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Up:
        state.selected = WrapUp(state.selected, ArtifactActions::kEntryCount);
        break;
    case KeyCode::Down:
        state.selected = WrapDown(state.selected, ArtifactActions::kEntryCount);
        break;
    case KeyCode::Enter: {
        PopupCommand command = PopupCommand::Of(state.selected == 0 ? PopupCommand::Kind::DeleteArtifact
                                                                    : PopupCommand::Kind::RebuildArtifact);
        Close();
        return command;
    }
    case KeyCode::Esc:
        Close();
        break;
    default:
        break;
    }
    return std::nullopt;
}

std::optional<PopupCommand> PopupState::HandleExcludedPaths(ExcludedPathsList& state, const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Up:
        if (!state.paths.empty()) {
            state.selected = WrapUp(state.selected, state.paths.size());
        }
        break;
    case KeyCode::Down:
        if (!state.paths.empty()) {
            state.selected = WrapDown(state.selected, state.paths.size());
        }
        break;
    case KeyCode::Enter:
        if (!state.paths.empty()) {
            const std::string path = state.paths[state.selected];
            Open(ConfirmAction{"Remove '" + path + "' from exclusion list?", kRemoveExcludedPrefix + path});
        }
        break;
    case KeyCode::Esc:
        Close();
        break;
    default:
        break;
    }
    return std::nullopt;
}

void AppendUtf8(std::string& buffer, char32_t ch) {
    if (ch < 0x80) {
        buffer.push_back(static_cast<char>(ch));
    } else if (ch < 0x800) {
        buffer.push_back(static_cast<char>(0xC0 | (ch >> 6)));
        buffer.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else if (ch < 0x10000) {
        buffer.push_back(static_cast<char>(0xE0 | (ch >> 12)));
        buffer.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        buffer.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else if (ch < 0x110000) {
        buffer.push_back(static_cast<char>(0xF0 | (ch >> 18)));
        buffer.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
        buffer.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        buffer.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
}

void PopLastUtf8(std::string& buffer) {
    while (!buffer.empty()) {
        const unsigned char last = static_cast<unsigned char>(buffer.back());
        buffer.pop_back();
        if ((last & 0xC0) != 0x80) {
            break;
        }
    }
}
