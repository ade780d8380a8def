#ifndef SWEEP_SESSION_HPP
#define SWEEP_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sweep/ArtifactStore.hpp"
#include "sweep/Config.hpp"
#include "sweep/Key.hpp"
#include "sweep/Popup.hpp"
#include "sweep/ScanPipeline.hpp"

class BuildWatcher;
class LogBuffer;
class PrivilegedRemover;

enum class Panel { Artifacts, History, Charts, Settings, Summary };
constexpr std::size_t kPanelCount = 5;

// Destructive operation waiting for a password.
enum class PendingAction { None, Delete, ClearAll };

// Owns all session state and is only touched from the UI loop.
// Background work reports back through the shared LogBuffer and the scan pipeline's result slot.
class Session {
public:
    // `watcher` may be null.
    Session(Config config,
            ConfigStore config_store,
            std::shared_ptr<ArtifactStore> store,
            std::shared_ptr<PrivilegedRemover> remover,
            std::shared_ptr<BuildWatcher> watcher);

    // Loads the recent artifacts and history from the store.
    void Initialize();

    // Once per loop iteration: starts the first scan, collects at most one finished scan,
    // and reloads history once a background store update has landed.
    void Tick();

    void HandleKey(const KeyEvent& key);

    // No-op while a scan is in flight.
    void TriggerScan();
    void ReloadHistory();

    bool ShouldQuit() const { return should_quit_; }

    const std::vector<std::string>& Artifacts() const { return artifacts_; }
    std::size_t Selected() const { return selected_; }
    Panel FocusedPanel() const { return focused_panel_; }
    bool IsScanning() const { return scanning_; }
    bool HasScanned() const { return scanned_; }
    bool AutomaticRemoval() const { return automatic_removal_; }
    PendingAction Pending() const { return pending_action_; }
    const std::vector<std::string>& PendingFailedPaths() const { return pending_failed_paths_; }
    const std::vector<ArtifactSize>& ChartData() const { return chart_data_; }
    std::size_t ChartSelected() const { return chart_selected_; }
    const std::vector<std::string>& History() const { return history_; }
    std::size_t TotalBuilds() const { return total_builds_; }
    const PopupState& Popup() const { return popup_; }
    const Config& Settings() const { return config_; }
    const std::shared_ptr<LogBuffer>& Logs() const { return logs_; }
    bool WatcherRunning() const;

private:
    void HandleMainKey(const KeyEvent& key);
    void Dispatch(const PopupCommand& command);
    void HandleSetValue(const std::string& key, const std::string& value);
    void HandleConfirm(const std::string& action);

    void OnScanComplete(std::vector<std::string> artifacts);

    void DeleteSelected();
    void ClearAllBuilds();
    void ResumePendingAction(const std::string& credential);
    void RebuildSelected(bool show_progress);
    void ExcludeSelected();

    void PromptForPassword(PendingAction action);
    bool PasswordPromptOpen() const;
    // A pending action only lives as long as its password prompt.
    void SyncPendingAction();

    void EraseArtifact(const std::string& path);
    void ClampSelection();
    void DeleteRecordInBackground(const std::string& path);
    // Runs `update` on a worker (inline if no thread can be started) and flags history for reload.
    void UpdateStoreInBackground(const std::string& name, std::function<void(ArtifactStore&)> update);
    void SaveConfig();
    void ShowInfo(std::string message);

    Config config_;
    ConfigStore config_store_;
    std::shared_ptr<ArtifactStore> store_;
    std::shared_ptr<PrivilegedRemover> remover_;
    std::shared_ptr<BuildWatcher> watcher_;
    std::shared_ptr<LogBuffer> logs_;
    ScanPipeline pipeline_;

    std::vector<std::string> artifacts_;
    std::size_t selected_ = 0;
    Panel focused_panel_ = Panel::Artifacts;
    bool scanning_ = false;
    bool scanned_ = false;
    bool automatic_removal_;
    bool should_quit_ = false;

    PendingAction pending_action_ = PendingAction::None;
    std::string pending_delete_path_;
    std::vector<std::string> pending_failed_paths_;
    std::vector<std::string> pending_batch_paths_; // everything the clear-all attempted

    std::vector<ArtifactSize> chart_data_;
    std::size_t chart_selected_ = 0;
    std::vector<std::string> history_;
    std::size_t total_builds_ = 0;
    std::shared_ptr<std::atomic<bool>> history_stale_;

    PopupState popup_;
};

#endif // SWEEP_SESSION_HPP
