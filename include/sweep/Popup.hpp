#ifndef SWEEP_POPUP_HPP
#define SWEEP_POPUP_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sweep/DirectoryBrowser.hpp"
#include "sweep/Key.hpp"

class LogBuffer;

// Input titles double as SetValue keys.
constexpr const char* kRetentionDaysTitle = "Retention Days";
constexpr const char* kScanPathKey = "Scan Path";
constexpr const char* kPasswordPromptTitle = "Enter sudo password";

// Prefix of the ConfirmAction tag that removes an exclusion; the path follows it.
constexpr const char* kRemoveExcludedPrefix = "remove_excluded:";

// What a popup asks the session to do once it has handled a key.
struct PopupCommand {
    enum class Kind {
        OpenInput,
        OpenDirBrowse,
        ToggleRemoval,
        OpenExcludedPaths,
        SetValue,
        DeleteArtifact,
        RebuildArtifact,
        ClearAllBuilds,
        ConfirmAction
    };

    Kind kind;
    std::string key;   // OpenInput/SetValue: title. ConfirmAction: action tag.
    std::string value; // SetValue only.

    static PopupCommand Of(Kind kind) { return PopupCommand{kind, {}, {}}; }
    static PopupCommand SetValue(std::string key, std::string value) {
        return PopupCommand{Kind::SetValue, std::move(key), std::move(value)};
    }
    static PopupCommand Confirm(std::string action) {
        return PopupCommand{Kind::ConfirmAction, std::move(action), {}};
    }
};

// The single modal overlay. Exactly one alternative is active; None means no popup.
class PopupState {
public:
    struct None {};
    struct SettingsList {
        static constexpr std::size_t kEntryCount = 4; // retention, scan path, removal, exclusions
        std::size_t selected = 0;
    };
    struct Input {
        std::string title;
        std::string buffer;
    };
    struct DirBrowse {
        DirectoryBrowser browser;
    };
    struct Logs {
        std::shared_ptr<LogBuffer> logs;
    };
    struct Scanning {
        std::shared_ptr<LogBuffer> logs;
    };
    struct ArtifactActions {
        static constexpr std::size_t kEntryCount = 2; // delete, rebuild
        std::size_t selected = 0;
    };
    struct ClearAllConfirmation {};
    struct ConfirmAction {
        std::string message;
        std::string action;
    };
    struct Progress {
        std::string message;
    };
    struct Info {
        std::string message;
    };
    struct ExcludedPathsList {
        std::vector<std::string> paths;
        std::size_t selected = 0;
    };

    using Variant = std::variant<None,
                                 SettingsList,
                                 Input,
                                 DirBrowse,
                                 Logs,
                                 Scanning,
                                 ArtifactActions,
                                 ClearAllConfirmation,
                                 ConfirmAction,
                                 Progress,
                                 Info,
                                 ExcludedPathsList>;

    // Replaces whatever is open.
    template <typename T>
    void Open(T state) {
        state_ = std::move(state);
    }
    void Close() { state_ = None{}; }

    bool IsNone() const { return std::holds_alternative<None>(state_); }

    template <typename T>
    bool Is() const {
        return std::holds_alternative<T>(state_);
    }

    template <typename T>
    const T* As() const {
        return std::get_if<T>(&state_);
    }

    // Interprets a key for the open popup. Returns a command for the session, or nullopt when the
    // key was consumed internally. Keys are ignored while nothing is open.
    std::optional<PopupCommand> HandleKey(const KeyEvent& key);

private:
    std::optional<PopupCommand> HandleSettings(SettingsList& state, const KeyEvent& key);
    std::optional<PopupCommand> HandleInput(Input& state, const KeyEvent& key);
    std::optional<PopupCommand> HandleDirBrowse(DirBrowse& state, const KeyEvent& key);
    std::optional<PopupCommand> HandleArtifactActions(ArtifactActions& state, const KeyEvent& key);
    std::optional<PopupCommand> HandleExcludedPaths(ExcludedPathsList& state, const KeyEvent& key);

    Variant state_;
};

// UTF-8 helpers for the Input buffer.
void AppendUtf8(std::string& buffer, char32_t ch);
void PopLastUtf8(std::string& buffer);

#endif // SWEEP_POPUP_HPP
