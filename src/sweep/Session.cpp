#include "sweep/Session.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "sweep/BackgroundTask.hpp"
#include "sweep/BuildWatcher.hpp"
#include "sweep/LogBuffer.hpp"
#include "sweep/PrivilegedRemover.hpp"
#include "sweep/RebuildLauncher.hpp"
#include "sweep/RetentionCleanup.hpp"

namespace {

constexpr const char* kEnableRemovalAction = "enable_automatic_removal";

constexpr const char* kEnableRemovalWarning =
    "AUTOMATIC REMOVAL WILL DELETE OLD ARTIFACTS\n"
    "\n"
    "Please verify your build directories in the list above.\n"
    "Any directories matching common build paths older than\n"
    "retention days will be permanently deleted.\n"
    "\n"
    "Enable automatic removal? (Enter: Yes, Esc: No)";

std::string FormatHistoryLine(const BuildEvent& event) {
    std::tm tm{};
    gmtime_r(&event.build_time, &tm);
    char stamp[32];
    if (std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M", &tm) == 0) {
        stamp[0] = '\0';
    }
    return event.project_path + " - " + event.language + " - " + stamp;
}

std::string ProjectOf(const std::string& artifact_path) {
    std::filesystem::path project = std::filesystem::path(artifact_path).parent_path();
    return project.empty() ? "." : project.string();
}

} // namespace

Session::Session(Config config,
                 ConfigStore config_store,
                 std::shared_ptr<ArtifactStore> store,
                 std::shared_ptr<PrivilegedRemover> remover,
                 std::shared_ptr<BuildWatcher> watcher)
    : config_(std::move(config)),
      config_store_(std::move(config_store)),
      store_(std::move(store)),
      remover_(std::move(remover)),
      watcher_(std::move(watcher)),
      logs_(std::make_shared<LogBuffer>()),
      pipeline_(store_, watcher_, logs_),
      automatic_removal_(config_.automatic_removal),
      history_stale_(std::make_shared<std::atomic<bool>>(false)) {}

void Session::Initialize() {
    try {
        artifacts_ = store_->RecentArtifactPaths();
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Could not load recent artifacts: {}", e.what());
        artifacts_.clear();
    }
    ClampSelection();
    ReloadHistory();
}

void Session::Tick() {
    if (!scanned_ && !scanning_) {
        TriggerScan();
    }

    std::optional<std::vector<std::string>> result = pipeline_.TryTakeResult();
    if (result) {
        OnScanComplete(std::move(*result));
    }
    if (history_stale_->exchange(false)) {
        ReloadHistory();
    }
    SyncPendingAction();
}

void Session::HandleKey(const KeyEvent& key) {
    if (popup_.IsNone()) {
        HandleMainKey(key);
    } else {
        std::optional<PopupCommand> command = popup_.HandleKey(key);
        if (command) {
            Dispatch(*command);
        }
    }
    SyncPendingAction();
}

void Session::TriggerScan() {
    if (scanning_) {
        return;
    }
    scanning_ = true;
    popup_.Open(PopupState::Scanning{logs_});

    ScanRequest request;
    request.roots = config_.scan_paths;
    request.excluded = config_.excluded_paths;
    if (!pipeline_.Launch(request)) {
        scanning_ = false;
        ShowInfo("Could not start the scan. See the log file for details.");
    }
}

void Session::ReloadHistory() {
    try {
        history_.clear();
        for (const BuildEvent& event : store_->RecentBuilds()) {
            history_.push_back(FormatHistoryLine(event));
        }
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Could not load history: {}", e.what());
        history_ = {"Failed to load history"};
    }

    try {
        total_builds_ = store_->CountBuilds();
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Could not count builds: {}", e.what());
        total_builds_ = 0;
    }

    // Only artifacts still listed are charted.
    chart_data_.clear();
    try {
        const std::unordered_set<std::string> listed(artifacts_.begin(), artifacts_.end());
        for (ArtifactSize& entry : store_->MaxSizeByArtifact()) {
            if (listed.count(entry.artifact_path) != 0) {
                chart_data_.push_back(std::move(entry));
            }
        }
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Could not load artifact sizes: {}", e.what());
        chart_data_.clear();
    }
    ClampSelection();
}

bool Session::WatcherRunning() const {
    return watcher_ != nullptr && watcher_->IsRunning();
}

void Session::HandleMainKey(const KeyEvent& key) {
    if (key.code == KeyCode::Char) {
        switch (key.ch) {
        case 'D':
            popup_.Open(PopupState::ClearAllConfirmation{});
            break;
        case 'q':
            should_quit_ = true;
            break;
        case 's':
            TriggerScan();
            break;
        case 'd':
            if (artifacts_.empty()) {
                ShowInfo("No artifact selected.");
            } else {
                popup_.Open(PopupState::ConfirmAction{"Delete this artifact?", "delete"});
            }
            break;
        case 'x':
        case 'X':
            if (focused_panel_ == Panel::Artifacts && selected_ < artifacts_.size()) {
                popup_.Open(PopupState::ConfirmAction{"Exclude this path from scanning?", "exclude"});
            }
            break;
        case 'r':
            RebuildSelected(false);
            break;
        case 'h':
            ReloadHistory();
            break;
        case 'e':
            popup_.Open(PopupState::SettingsList{});
            break;
        case 'l':
            popup_.Open(PopupState::Logs{logs_});
            break;
        default:
            break;
        }
        return;
    }

    switch (key.code) {
    case KeyCode::Tab:
        focused_panel_ = static_cast<Panel>((static_cast<std::size_t>(focused_panel_) + 1) % kPanelCount);
        break;
    case KeyCode::Enter:
        if (focused_panel_ == Panel::Artifacts) {
            popup_.Open(PopupState::ArtifactActions{});
        } else if (focused_panel_ == Panel::Settings) {
            popup_.Open(PopupState::SettingsList{});
        }
        break;
    case KeyCode::Up:
    case KeyCode::PageUp:
        if (focused_panel_ == Panel::Artifacts && selected_ > 0) {
            --selected_;
        } else if (focused_panel_ == Panel::Charts && chart_selected_ > 0) {
            --chart_selected_;
        }
        break;
    case KeyCode::Down:
    case KeyCode::PageDown:
        if (focused_panel_ == Panel::Artifacts && selected_ + 1 < artifacts_.size()) {
            ++selected_;
        } else if (focused_panel_ == Panel::Charts && chart_selected_ + 1 < chart_data_.size()) {
            ++chart_selected_;
        }
        break;
    default:
        break;
    }
}

void Session::Dispatch(const PopupCommand& command) {
    switch (command.kind) {
    case PopupCommand::Kind::OpenInput: {
        std::string initial;
        if (command.key == kRetentionDaysTitle) {
            initial = std::to_string(config_.retention_days);
        }
        popup_.Open(PopupState::Input{command.key, initial});
        break;
    }
    case PopupCommand::Kind::OpenDirBrowse: {
        DirectoryBrowser browser("/");
        if (!config_.scan_paths.empty()) {
            browser.Load(config_.scan_paths.front());
        }
        popup_.Open(PopupState::DirBrowse{std::move(browser)});
        break;
    }
    case PopupCommand::Kind::ToggleRemoval:
        if (!automatic_removal_) {
            popup_.Open(PopupState::ConfirmAction{kEnableRemovalWarning, kEnableRemovalAction});
        } else {
            automatic_removal_ = false;
            config_.automatic_removal = false;
            SaveConfig();
            spdlog::info("Automatic removal disabled");
        }
        break;
    case PopupCommand::Kind::OpenExcludedPaths:
        popup_.Open(PopupState::ExcludedPathsList{config_.excluded_paths, 0});
        break;
    case PopupCommand::Kind::SetValue:
        HandleSetValue(command.key, command.value);
        break;
    case PopupCommand::Kind::DeleteArtifact:
        popup_.Open(PopupState::ConfirmAction{"Delete this artifact?", "delete"});
        break;
    case PopupCommand::Kind::RebuildArtifact:
        popup_.Open(PopupState::ConfirmAction{"Rebuild this project?", "rebuild"});
        break;
    case PopupCommand::Kind::ClearAllBuilds:
        ClearAllBuilds();
        break;
    case PopupCommand::Kind::ConfirmAction:
        HandleConfirm(command.key);
        break;
    }
}

void Session::HandleSetValue(const std::string& key, const std::string& value) {
    if (key == kRetentionDaysTitle) {
        uint32_t days = 0;
        if (ParseUnsigned(value, days)) {
            config_.retention_days = days;
            SaveConfig();
        } else {
            spdlog::debug("Ignoring invalid retention days '{}'", value);
        }
    } else if (key == kScanPathKey) {
        config_.scan_paths = {value};
        SaveConfig();
    } else if (key == kPasswordPromptTitle) {
        ResumePendingAction(value);
    }
}

void Session::HandleConfirm(const std::string& action) {
    const std::string prefix = kRemoveExcludedPrefix;
    if (action.compare(0, prefix.size(), prefix) == 0) {
        const std::string path = action.substr(prefix.size());
        auto& excluded = config_.excluded_paths;
        excluded.erase(std::remove(excluded.begin(), excluded.end(), path), excluded.end());
        SaveConfig();
        logs_->Append("Removed from exclusion list: " + path);
        if (scanning_) {
            ShowInfo("Removed from exclusion list. It applies from the next scan.");
        } else {
            TriggerScan();
        }
        return;
    }

    if (action == "delete") {
        DeleteSelected();
    } else if (action == "rebuild") {
        RebuildSelected(true);
    } else if (action == "exclude") {
        ExcludeSelected();
    } else if (action == kEnableRemovalAction) {
        automatic_removal_ = true;
        config_.automatic_removal = true;
        SaveConfig();
        ShowInfo("Automatic removal enabled. Old artifacts will be cleaned up after scans.");
    }
}

void Session::OnScanComplete(std::vector<std::string> artifacts) {
    const std::string previous = selected_ < artifacts_.size() ? artifacts_[selected_] : std::string();
    artifacts_ = std::move(artifacts);
    scanning_ = false;
    scanned_ = true;

    // Follow the selected path into the new list; indexes from the old list mean nothing now.
    auto it = std::find(artifacts_.begin(), artifacts_.end(), previous);
    selected_ = it != artifacts_.end() ? static_cast<std::size_t>(it - artifacts_.begin()) : 0;
    ClampSelection();

    // The summary replaces any dialog bound to the old list. Only the password prompt survives:
    // its pending action is keyed by path, not by selection.
    const std::string summary = "Scan complete. Found " + std::to_string(artifacts_.size()) + " artifacts.";
    if (PasswordPromptOpen()) {
        logs_->Append(summary);
    } else {
        ShowInfo(summary);
    }
    ReloadHistory();

    if (automatic_removal_) {
        std::shared_ptr<ArtifactStore> store = store_;
        std::shared_ptr<std::atomic<bool>> stale = history_stale_;
        const uint32_t days = config_.retention_days;
        const bool started = RunDetached("retention cleanup", [store, stale, days]() {
            RunRetentionCleanup(*store, days);
            stale->store(true);
        });
        if (!started) {
            spdlog::warn("Retention cleanup skipped after this scan");
        }
    }
}

void Session::DeleteSelected() {
    if (artifacts_.empty()) {
        ShowInfo("No artifact selected.");
        return;
    }

    const std::string path = artifacts_[selected_];
    if (remover_->Remove(path, std::nullopt)) {
        EraseArtifact(path);
        DeleteRecordInBackground(path);
        ShowInfo("Artifact deleted.");
        return;
    }
    pending_delete_path_ = path;
    PromptForPassword(PendingAction::Delete);
}

void Session::ClearAllBuilds() {
    pending_failed_paths_.clear();
    pending_batch_paths_ = artifacts_;

    std::vector<std::string> failed;
    for (const std::string& path : artifacts_) {
        if (!remover_->Remove(path, std::nullopt)) {
            failed.push_back(path);
        }
    }

    if (!failed.empty()) {
        spdlog::info("{} of {} artifacts need a password to remove", failed.size(), artifacts_.size());
        pending_failed_paths_ = std::move(failed);
        PromptForPassword(PendingAction::ClearAll);
        return;
    }

    artifacts_.clear();
    ClampSelection();
    try {
        store_->DeleteAll();
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Could not clear build records: {}", e.what());
    }
    ReloadHistory();
    ShowInfo("All builds cleared.");
}

void Session::ResumePendingAction(const std::string& credential) {
    const PendingAction action = pending_action_;
    pending_action_ = PendingAction::None;

    if (action == PendingAction::Delete) {
        const std::string path = std::move(pending_delete_path_);
        pending_delete_path_.clear();
        if (remover_->Remove(path, credential)) {
            EraseArtifact(path);
            DeleteRecordInBackground(path);
            ShowInfo("Artifact deleted successfully.");
        } else {
            ShowInfo("Deletion failed - please check permissions or try again.");
        }
        return;
    }

    if (action == PendingAction::ClearAll) {
        const std::vector<std::string> retry = std::move(pending_failed_paths_);
        pending_failed_paths_.clear();
        for (const std::string& path : retry) {
            if (!remover_->Remove(path, credential)) {
                pending_failed_paths_.push_back(path);
            }
        }

        const std::vector<std::string> batch = std::move(pending_batch_paths_);
        pending_batch_paths_.clear();

        if (pending_failed_paths_.empty()) {
            artifacts_.clear();
            chart_data_.clear();
            ClampSelection();
            UpdateStoreInBackground("clear records", [](ArtifactStore& store) { store.DeleteAll(); });
            ShowInfo("All builds cleared successfully.");
            return;
        }

        // The rest of the batch is gone from disk by now. Artifacts outside the batch are untouched.
        const std::unordered_set<std::string> remaining(pending_failed_paths_.begin(), pending_failed_paths_.end());
        for (const std::string& path : batch) {
            if (remaining.count(path) != 0) {
                continue;
            }
            EraseArtifact(path);
            DeleteRecordInBackground(path);
        }
        ShowInfo("Some deletions failed - please check permissions. " + std::to_string(pending_failed_paths_.size()) +
                 " artifacts could not be removed.");
    }
}

void Session::RebuildSelected(bool show_progress) {
    if (artifacts_.empty()) {
        if (show_progress) {
            ShowInfo("No artifact selected.");
        }
        return;
    }

    const std::string path = artifacts_[selected_];
    if (!LaunchRebuild(path)) {
        ShowInfo("No supported build system found for " + ProjectOf(path) + ".");
        return;
    }
    logs_->Append("Rebuild started for " + ProjectOf(path));
    if (show_progress) {
        popup_.Open(PopupState::Progress{"Rebuilding project..."});
    }
}

void Session::ExcludeSelected() {
    if (selected_ >= artifacts_.size()) {
        return;
    }
    const std::string path = artifacts_[selected_];
    config_.excluded_paths.push_back(path);
    EraseArtifact(path);
    SaveConfig();
    ShowInfo("Path added to exclusion list.");
}

void Session::PromptForPassword(PendingAction action) {
    pending_action_ = action;
    popup_.Open(PopupState::Input{kPasswordPromptTitle, ""});
}

bool Session::PasswordPromptOpen() const {
    const PopupState::Input* input = popup_.As<PopupState::Input>();
    return input != nullptr && input->title == kPasswordPromptTitle;
}

void Session::SyncPendingAction() {
    if (pending_action_ == PendingAction::None) {
        return;
    }
    if (!PasswordPromptOpen()) {
        pending_action_ = PendingAction::None;
        pending_delete_path_.clear();
        pending_batch_paths_.clear();
    }
}

void Session::EraseArtifact(const std::string& path) {
    auto it = std::find(artifacts_.begin(), artifacts_.end(), path);
    if (it != artifacts_.end()) {
        artifacts_.erase(it);
    }
    chart_data_.erase(std::remove_if(chart_data_.begin(),
                                     chart_data_.end(),
                                     [&path](const ArtifactSize& entry) { return entry.artifact_path == path; }),
                      chart_data_.end());
    ClampSelection();
}

void Session::ClampSelection() {
    if (artifacts_.empty()) {
        selected_ = 0;
    } else if (selected_ >= artifacts_.size()) {
        selected_ = artifacts_.size() - 1;
    }
    if (chart_data_.empty()) {
        chart_selected_ = 0;
    } else if (chart_selected_ >= chart_data_.size()) {
        chart_selected_ = chart_data_.size() - 1;
    }
}

void Session::DeleteRecordInBackground(const std::string& path) {
    UpdateStoreInBackground("delete record", [path](ArtifactStore& store) { store.DeleteArtifact(path); });
}

void Session::UpdateStoreInBackground(const std::string& name, std::function<void(ArtifactStore&)> update) {
    std::shared_ptr<ArtifactStore> store = store_;
    std::shared_ptr<std::atomic<bool>> stale = history_stale_;
    auto task = [store, stale, update]() {
        update(*store);
        stale->store(true);
    };
    if (RunDetached(name, task)) {
        return;
    }
    try {
        task();
    } catch (const ArtifactStoreError& e) {
        spdlog::warn("Store update '{}' failed: {}", name, e.what());
    }
}

void Session::SaveConfig() {
    if (!config_store_.Save(config_)) {
        spdlog::warn("Could not save settings to {}", config_store_.Path().string());
    }
}

void Session::ShowInfo(std::string message) {
    popup_.Open(PopupState::Info{std::move(message)});
}
