// test_session.cpp - Tests for the session controller: scans, deletion fallback, batch clear and settings

#include "sweep/LogBuffer.hpp"
#include "sweep/PrivilegedRemover.hpp"
#include "sweep/RebuildLauncher.hpp"
#include "sweep/Session.hpp"
#include "sweep/SqliteArtifactStore.hpp"

#include "test_harness.hpp"

#include <algorithm>
#include <ctime>
#include <memory>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kGoodPassword = "hunter2";

// Stands in for sudo. Paths in `locked` refuse passwordless removal and need kGoodPassword.
class FakeRemover : public PrivilegedRemover {
public:
    struct Call {
        std::string path;
        std::optional<std::string> credential;
    };

    bool Remove(const std::string& path, const std::optional<std::string>& credential) override {
        calls.push_back(Call{path, credential});
        if (locked.count(path) != 0 && credential != std::optional<std::string>(kGoodPassword)) {
            return false;
        }
        std::error_code ec;
        fs::remove_all(path, ec);
        locked.erase(path);
        return !ec;
    }

    std::set<std::string> locked;
    std::vector<Call> calls;
};

// Store whose writes fail with an OS error; reads come back empty.
class FailingStore : public ArtifactStore {
public:
    void InsertBuild(const BuildEvent&) override {
        throw std::system_error(std::make_error_code(std::errc::io_error));
    }
    std::vector<std::string> RecentArtifactPaths(std::size_t) override { return {}; }
    std::vector<BuildEvent> RecentBuilds(std::size_t) override { return {}; }
    std::size_t CountBuilds() override { return 0; }
    std::vector<ArtifactSize> MaxSizeByArtifact() override { return {}; }
    void DeleteArtifact(const std::string&) override {}
    void DeleteAll() override {}
    std::vector<std::string> OldArtifactPaths(uint32_t) override { return {}; }
    void DeleteBuildsOlderThan(uint32_t) override {}
};

BuildEvent RecordedBuild(const std::string& artifact) {
    BuildEvent event;
    event.project_path = fs::path(artifact).parent_path().string();
    event.language = "Unknown";
    event.artifact_path = artifact;
    event.size_bytes = 1;
    event.build_time = std::time(nullptr) - 60;
    return event;
}

struct Harness {
    explicit Harness(bool automatic_removal = false)
        : dir("buildsweep_session"),
          store(std::make_shared<SqliteArtifactStore>(":memory:")),
          remover(std::make_shared<FakeRemover>()) {
        root = dir.MakeDir("work");
        config.scan_paths = {root.string()};
        config.automatic_removal = automatic_removal;
    }

    Session& Start() {
        session = std::make_unique<Session>(config, ConfigStore(ConfigPath()), store, remover, nullptr);
        session->Initialize();
        return *session;
    }

    fs::path ConfigPath() const { return dir.Path() / "buildsweep.yml"; }

    std::string Artifact(const std::string& relative) const {
        return dir.MakeDir("work/" + relative).string();
    }

    TempDir dir;
    fs::path root;
    Config config;
    std::shared_ptr<SqliteArtifactStore> store;
    std::shared_ptr<FakeRemover> remover;
    std::unique_ptr<Session> session;
};

void Press(Session& session, KeyCode code) {
    session.HandleKey(KeyEvent::Of(code));
}

void Press(Session& session, char32_t ch) {
    session.HandleKey(KeyEvent::Character(ch));
}

void Type(Session& session, const std::string& text) {
    for (char ch : text) {
        Press(session, static_cast<char32_t>(ch));
    }
}

// Ticks until the running (or first) scan has been collected.
bool FinishScan(Session& session) {
    return WaitUntil([&session]() {
        session.Tick();
        return session.HasScanned() && !session.IsScanning();
    });
}

// Runs the initial scan and dismisses its summary.
void ScanAndDismiss(Session& session) {
    if (!FinishScan(session)) {
        throw std::runtime_error("scan did not finish");
    }
    Press(session, KeyCode::Esc);
}

std::string InfoMessage(const Session& session) {
    const PopupState::Info* info = session.Popup().As<PopupState::Info>();
    return info != nullptr ? info->message : std::string();
}

bool Listed(const Session& session, const std::string& path) {
    const std::vector<std::string>& artifacts = session.Artifacts();
    return std::find(artifacts.begin(), artifacts.end(), path) != artifacts.end();
}

void SelectArtifact(Session& session, const std::string& path) {
    for (std::size_t i = 0; i < session.Artifacts().size(); ++i) {
        Press(session, KeyCode::Up);
    }
    while (session.Artifacts()[session.Selected()] != path) {
        Press(session, KeyCode::Down);
    }
}

} // namespace

// =============================================================================
// Scanning
// =============================================================================

void test_first_tick_scans_and_reports() {
    Harness h;
    const std::string target = h.Artifact("proj/target");
    Session& session = h.Start();

    session.Tick();
    ASSERT(session.IsScanning());
    ASSERT(session.Popup().Is<PopupState::Scanning>());

    ASSERT(FinishScan(session));
    ASSERT_EQ(InfoMessage(session), "Scan complete. Found 1 artifacts.");
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT_EQ(session.Artifacts()[0], target);
    ASSERT_EQ(session.TotalBuilds(), 1u);
    ASSERT_EQ(session.History().size(), 1u);
}

void test_second_trigger_while_scanning_is_ignored() {
    Harness h;
    h.Artifact("proj/target");
    Session& session = h.Start();

    session.Tick();
    session.TriggerScan();
    Press(session, KeyCode::Esc); // dismiss the scanning popup
    Press(session, 's');
    ASSERT(FinishScan(session));

    const std::vector<std::string> lines = session.Logs()->Snapshot();
    ASSERT_EQ(std::count(lines.begin(), lines.end(), std::string("Starting scan...")), 1);
}

void test_scan_summary_closes_selection_dialogs() {
    Harness h;
    const std::string listed = h.dir.MakeDir("old/proj/target").string();
    const std::string scanned = h.Artifact("app/node_modules");
    h.store->InsertBuild(RecordedBuild(listed));
    Session& session = h.Start();
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT_EQ(session.Artifacts()[0], listed);

    // Ask to delete the stored artifact, then let the scan replace the list underneath the dialog.
    session.Tick();
    Press(session, KeyCode::Esc);
    Press(session, 'd');
    ASSERT(session.Popup().Is<PopupState::ConfirmAction>());
    ASSERT(FinishScan(session));
    ASSERT_EQ(InfoMessage(session), "Scan complete. Found 1 artifacts.");

    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().IsNone());
    ASSERT(h.remover->calls.empty());
    ASSERT(fs::exists(listed));
    ASSERT(fs::exists(scanned));
}

void test_scan_summary_closes_actions_menu() {
    Harness h;
    const std::string listed = h.dir.MakeDir("old/proj/target").string();
    h.Artifact("app/build");
    h.store->InsertBuild(RecordedBuild(listed));
    Session& session = h.Start();

    session.Tick();
    Press(session, KeyCode::Esc);
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ArtifactActions>());
    ASSERT(FinishScan(session));
    ASSERT(session.Popup().Is<PopupState::Info>());

    Press(session, KeyCode::Enter);
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ArtifactActions>());
    ASSERT(h.remover->calls.empty());
}

void test_scan_keeps_password_prompt() {
    Harness h;
    const std::string target = h.Artifact("app/target");
    h.remover->locked.insert(target);
    h.store->InsertBuild(RecordedBuild(target));
    Session& session = h.Start();

    session.Tick();
    Press(session, KeyCode::Esc);
    Press(session, 'd');
    Press(session, KeyCode::Enter);
    ASSERT(session.Pending() == PendingAction::Delete);

    ASSERT(FinishScan(session));
    ASSERT(session.Popup().Is<PopupState::Input>());
    ASSERT(session.Pending() == PendingAction::Delete);
    ASSERT_EQ(session.Logs()->Snapshot().back(), "Scan complete. Found 1 artifacts.");

    Type(session, kGoodPassword);
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Artifact deleted successfully.");
    ASSERT(!fs::exists(target));
}

void test_selection_follows_path_across_scans() {
    Harness h;
    h.Artifact("a/target");
    h.Artifact("b/build");
    const std::string chosen = h.Artifact("c/dist");
    Session& session = h.Start();
    ScanAndDismiss(session);

    SelectArtifact(session, chosen);
    h.Artifact("d/out");
    h.Artifact("0/node_modules");
    Press(session, 's');
    ASSERT(FinishScan(session));
    ASSERT_EQ(session.Artifacts().size(), 5u);
    ASSERT_EQ(session.Artifacts()[session.Selected()], chosen);
}

void test_scan_completes_when_store_writes_fail() {
    TempDir dir("buildsweep_session");
    const std::string target = dir.MakeDir("work/proj/target").string();
    Config config;
    config.scan_paths = {(dir.Path() / "work").string()};
    config.automatic_removal = false;

    Session session(config,
                    ConfigStore(dir.Path() / "buildsweep.yml"),
                    std::make_shared<FailingStore>(),
                    std::make_shared<FakeRemover>(),
                    nullptr);
    session.Initialize();

    ASSERT(FinishScan(session));
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT_EQ(session.Artifacts()[0], target);

    // Scanning is not wedged: a manual rescan starts again.
    Press(session, KeyCode::Esc);
    Press(session, 's');
    ASSERT(session.IsScanning());
    ASSERT(session.Popup().Is<PopupState::Scanning>());
    ASSERT(FinishScan(session));
}

void test_info_dismissed_twice() {
    Harness h;
    h.Artifact("proj/target");
    Session& session = h.Start();
    ASSERT(FinishScan(session));

    Press(session, KeyCode::Esc);
    ASSERT(session.Popup().IsNone());
    Press(session, KeyCode::Esc);
    ASSERT(session.Popup().IsNone());
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT(!session.ShouldQuit());
}

void test_quit_only_without_popup() {
    Harness h;
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'l');
    Press(session, 'q');
    ASSERT(!session.ShouldQuit());
    Press(session, KeyCode::Esc);
    Press(session, 'q');
    ASSERT(session.ShouldQuit());
}

// =============================================================================
// Navigation
// =============================================================================

void test_selection_is_clamped() {
    Harness h;
    h.Artifact("a/target");
    h.Artifact("b/build");
    h.Artifact("c/dist");
    Session& session = h.Start();
    ScanAndDismiss(session);
    ASSERT_EQ(session.Artifacts().size(), 3u);

    for (int i = 0; i < 5; ++i) {
        Press(session, KeyCode::Down);
    }
    ASSERT_EQ(session.Selected(), 2u);
    for (int i = 0; i < 5; ++i) {
        Press(session, KeyCode::PageUp);
    }
    ASSERT_EQ(session.Selected(), 0u);

    // Deleting the last row moves the selection onto the new last row.
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Down);
    Press(session, 'd');
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Artifact deleted.");
    ASSERT_EQ(session.Artifacts().size(), 2u);
    ASSERT_EQ(session.Selected(), 1u);
}

void test_tab_cycles_focus() {
    Harness h;
    Session& session = h.Start();
    ScanAndDismiss(session);

    ASSERT(session.FocusedPanel() == Panel::Artifacts);
    for (std::size_t i = 0; i < kPanelCount; ++i) {
        Press(session, KeyCode::Tab);
    }
    ASSERT(session.FocusedPanel() == Panel::Artifacts);

    Press(session, KeyCode::Tab);
    Press(session, KeyCode::Tab);
    Press(session, KeyCode::Tab);
    ASSERT(session.FocusedPanel() == Panel::Settings);
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::SettingsList>());
}

void test_delete_without_artifacts() {
    Harness h;
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'd');
    ASSERT_EQ(InfoMessage(session), "No artifact selected.");
}

// =============================================================================
// Deletion with password fallback
// =============================================================================

void test_delete_falls_back_to_password() {
    Harness h;
    const std::string target = h.Artifact("proj/target");
    h.remover->locked.insert(target);
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'd');
    ASSERT(session.Popup().Is<PopupState::ConfirmAction>());
    Press(session, KeyCode::Enter);
    ASSERT(session.Pending() == PendingAction::Delete);
    const PopupState::Input* prompt = session.Popup().As<PopupState::Input>();
    ASSERT(prompt != nullptr);
    ASSERT_EQ(prompt->title, kPasswordPromptTitle);

    Type(session, kGoodPassword);
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Artifact deleted successfully.");
    ASSERT(session.Pending() == PendingAction::None);
    ASSERT(session.Artifacts().empty());
    ASSERT(!fs::exists(target));

    ASSERT_EQ(h.remover->calls.size(), 2u);
    ASSERT(!h.remover->calls[0].credential.has_value());
    ASSERT(h.remover->calls[1].credential == std::optional<std::string>(kGoodPassword));

    ASSERT(WaitUntil([&h]() { return h.store->RecentArtifactPaths().empty(); }));
    ASSERT(WaitUntil([&session]() {
        session.Tick();
        return session.TotalBuilds() == 0 && session.History().empty();
    }));
}

void test_delete_with_wrong_password_keeps_artifact() {
    Harness h;
    const std::string target = h.Artifact("proj/target");
    h.remover->locked.insert(target);
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'd');
    Press(session, KeyCode::Enter);
    Type(session, "nope");
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Deletion failed - please check permissions or try again.");
    ASSERT(session.Pending() == PendingAction::None);
    ASSERT(Listed(session, target));
    ASSERT(fs::exists(target));
}

void test_dismissing_prompt_clears_pending_action() {
    Harness h;
    const std::string target = h.Artifact("proj/target");
    h.remover->locked.insert(target);
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'd');
    Press(session, KeyCode::Enter);
    ASSERT(session.Pending() == PendingAction::Delete);
    Press(session, KeyCode::Esc);
    ASSERT(session.Pending() == PendingAction::None);
    ASSERT(session.Popup().IsNone());
    ASSERT(Listed(session, target));
}

void test_passwordless_delete_via_actions_menu() {
    Harness h;
    const std::string target = h.Artifact("proj/target");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ArtifactActions>());
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ConfirmAction>());
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Artifact deleted.");
    ASSERT(session.Pending() == PendingAction::None);
    ASSERT(!fs::exists(target));
    ASSERT_EQ(h.remover->calls.size(), 1u);
}

// =============================================================================
// Clear all
// =============================================================================

void test_clear_all_retries_only_failures() {
    Harness h;
    const std::string a = h.Artifact("a/target");
    const std::string b = h.Artifact("b/build");
    const std::string c = h.Artifact("c/dist");
    h.remover->locked.insert(b);
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'D');
    ASSERT(session.Popup().Is<PopupState::ClearAllConfirmation>());
    Press(session, 'y');
    ASSERT(session.Pending() == PendingAction::ClearAll);
    ASSERT_EQ(session.PendingFailedPaths().size(), 1u);
    ASSERT_EQ(session.PendingFailedPaths()[0], b);
    ASSERT(!fs::exists(a));
    ASSERT(!fs::exists(c));

    h.remover->calls.clear();
    Type(session, kGoodPassword);
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "All builds cleared successfully.");
    ASSERT(session.Artifacts().empty());
    ASSERT(session.Pending() == PendingAction::None);
    ASSERT_EQ(h.remover->calls.size(), 1u);
    ASSERT_EQ(h.remover->calls[0].path, b);
    ASSERT(WaitUntil([&session]() {
        session.Tick();
        return session.TotalBuilds() == 0;
    }));
    ASSERT_EQ(h.store->CountBuilds(), 0u);
}

void test_clear_all_partial_failure_keeps_failed_subset() {
    Harness h;
    const std::string a = h.Artifact("a/target");
    const std::string b = h.Artifact("b/build");
    h.remover->locked.insert(b);
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'D');
    Press(session, 'Y');
    Type(session, "wrong");
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session),
              "Some deletions failed - please check permissions. 1 artifacts could not be removed.");
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT_EQ(session.Artifacts()[0], b);
    ASSERT(fs::exists(b));
    ASSERT(!fs::exists(a));
}

void test_clear_all_retry_spares_newly_scanned_artifacts() {
    Harness h;
    const std::string locked = h.Artifact("a/target");
    const std::string open = h.Artifact("b/build");
    h.remover->locked.insert(locked);
    h.store->InsertBuild(RecordedBuild(locked));
    h.store->InsertBuild(RecordedBuild(open));
    const std::string fresh = h.Artifact("c/dist"); // on disk but not yet recorded
    Session& session = h.Start();
    ASSERT_EQ(session.Artifacts().size(), 2u);
    ASSERT(!Listed(session, fresh));

    session.Tick();
    Press(session, KeyCode::Esc);
    Press(session, 'D');
    Press(session, 'y');
    ASSERT(session.Pending() == PendingAction::ClearAll);

    // The scan lands while the password prompt is open.
    ASSERT(FinishScan(session));
    ASSERT(session.Popup().Is<PopupState::Input>());
    ASSERT(Listed(session, fresh));

    Type(session, "wrong");
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session),
              "Some deletions failed - please check permissions. 1 artifacts could not be removed.");
    ASSERT(Listed(session, locked));
    ASSERT(Listed(session, fresh));
    ASSERT(!Listed(session, open));
    ASSERT(fs::exists(fresh));

    ASSERT(WaitUntil([&h, &open]() {
        const std::vector<std::string> paths = h.store->RecentArtifactPaths();
        return std::find(paths.begin(), paths.end(), open) == paths.end();
    }));
    const std::vector<std::string> paths = h.store->RecentArtifactPaths();
    ASSERT(std::find(paths.begin(), paths.end(), fresh) != paths.end());
}

void test_clear_all_without_password() {
    Harness h;
    h.Artifact("a/target");
    h.Artifact("b/build");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'D');
    Press(session, 'y');
    ASSERT_EQ(InfoMessage(session), "All builds cleared.");
    ASSERT(session.Artifacts().empty());
    ASSERT_EQ(session.TotalBuilds(), 0u);
    ASSERT(session.Pending() == PendingAction::None);
}

void test_clear_all_cancelled() {
    Harness h;
    h.Artifact("a/target");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'D');
    Press(session, 'n');
    ASSERT(session.Popup().IsNone());
    ASSERT_EQ(session.Artifacts().size(), 1u);
    ASSERT(h.remover->calls.empty());
}

// =============================================================================
// Settings
// =============================================================================

void test_malformed_retention_is_ignored() {
    Harness h;
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'e');
    Press(session, KeyCode::Enter);
    const PopupState::Input* input = session.Popup().As<PopupState::Input>();
    ASSERT(input != nullptr);
    ASSERT_EQ(input->buffer, "30");

    Press(session, KeyCode::Backspace);
    Press(session, KeyCode::Backspace);
    Type(session, "-5");
    Press(session, KeyCode::Enter);
    ASSERT_EQ(session.Settings().retention_days, 30u);

    Press(session, 'e');
    Press(session, KeyCode::Enter);
    Press(session, KeyCode::Backspace);
    Press(session, KeyCode::Backspace);
    Type(session, "14");
    Press(session, KeyCode::Enter);
    ASSERT_EQ(session.Settings().retention_days, 14u);

    Config reloaded;
    ASSERT(ConfigStore(h.ConfigPath()).Load(reloaded));
    ASSERT_EQ(reloaded.retention_days, 14u);
}

void test_scan_path_from_directory_browser() {
    Harness h;
    const fs::path other = h.dir.MakeDir("work/sub");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'e');
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Enter);
    const PopupState::DirBrowse* browse = session.Popup().As<PopupState::DirBrowse>();
    ASSERT(browse != nullptr);
    ASSERT(browse->browser.CurrentPath() == h.root);

    Press(session, KeyCode::Down); // "sub"
    Press(session, 's');
    ASSERT_EQ(session.Settings().scan_paths.size(), 1u);
    ASSERT_EQ(session.Settings().scan_paths[0], other.string());
}

void test_automatic_removal_toggle() {
    Harness h(true);
    Session& session = h.Start();
    ScanAndDismiss(session);
    ASSERT(session.AutomaticRemoval());

    // Disabling is immediate.
    Press(session, 'e');
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Enter);
    ASSERT(!session.AutomaticRemoval());
    ASSERT(session.Popup().IsNone());

    // Enabling asks first.
    Press(session, 'e');
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Down);
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ConfirmAction>());
    ASSERT(!session.AutomaticRemoval());
    Press(session, KeyCode::Enter);
    ASSERT(session.AutomaticRemoval());
    ASSERT_EQ(InfoMessage(session), "Automatic removal enabled. Old artifacts will be cleaned up after scans.");

    Config reloaded;
    reloaded.automatic_removal = false;
    ASSERT(ConfigStore(h.ConfigPath()).Load(reloaded));
    ASSERT(reloaded.automatic_removal);
}

void test_exclude_and_restore_path() {
    Harness h;
    const std::string keep = h.Artifact("keep/target");
    const std::string skip = h.Artifact("skip/build");
    Session& session = h.Start();
    ScanAndDismiss(session);

    SelectArtifact(session, skip);
    Press(session, 'x');
    Press(session, KeyCode::Enter);
    ASSERT_EQ(InfoMessage(session), "Path added to exclusion list.");
    ASSERT(!Listed(session, skip));
    ASSERT_EQ(session.Settings().excluded_paths.size(), 1u);
    ASSERT_EQ(session.Settings().excluded_paths[0], skip);
    Press(session, KeyCode::Esc);

    Press(session, 's');
    ASSERT(FinishScan(session));
    ASSERT(Listed(session, keep));
    ASSERT(!Listed(session, skip));
    Press(session, KeyCode::Esc);

    // Settings > Excluded paths > remove the entry, which rescans.
    Press(session, 'e');
    Press(session, KeyCode::Up);
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ExcludedPathsList>());
    Press(session, KeyCode::Enter);
    ASSERT(session.Popup().Is<PopupState::ConfirmAction>());
    Press(session, KeyCode::Enter);
    ASSERT(session.Settings().excluded_paths.empty());
    ASSERT(session.IsScanning());
    ASSERT(FinishScan(session));
    ASSERT(Listed(session, skip));
}

void test_exclude_needs_artifact_focus() {
    Harness h;
    h.Artifact("proj/target");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, KeyCode::Tab);
    Press(session, 'x');
    ASSERT(session.Popup().IsNone());
}

// =============================================================================
// Rebuild
// =============================================================================

void test_rebuild_without_build_system() {
    Harness h;
    const std::string target = h.Artifact("plain/target");
    Session& session = h.Start();
    ScanAndDismiss(session);

    Press(session, 'r');
    ASSERT_EQ(InfoMessage(session),
              "No supported build system found for " + fs::path(target).parent_path().string() + ".");
}

void test_detect_rebuild_command() {
    TempDir dir("buildsweep_rebuild");
    dir.WriteFile("rust/Cargo.toml", "");
    dir.WriteFile("web/package.json", "{}");
    dir.WriteFile("cpp/CMakeLists.txt", "");
    dir.WriteFile("cpp/build/CMakeCache.txt", "");
    dir.WriteFile("bare/CMakeLists.txt", "");
    dir.MakeDir("bare/build");

    std::optional<RebuildCommand> rust = DetectRebuildCommand(dir.Path() / "rust" / "target");
    ASSERT(rust.has_value());
    ASSERT_EQ(rust->args[0], "cargo");
    ASSERT(rust->working_dir == dir.Path() / "rust");

    std::optional<RebuildCommand> web = DetectRebuildCommand(dir.Path() / "web" / "dist");
    ASSERT(web.has_value());
    ASSERT_EQ(web->args[0], "npm");

    std::optional<RebuildCommand> cpp = DetectRebuildCommand(dir.Path() / "cpp" / "build");
    ASSERT(cpp.has_value());
    ASSERT_EQ(cpp->args[0], "cmake");
    ASSERT_EQ(cpp->args[2], (dir.Path() / "cpp" / "build").string());

    ASSERT(!DetectRebuildCommand(dir.Path() / "bare" / "build").has_value());
}

// =============================================================================
// Retention
// =============================================================================

void test_retention_cleanup_after_scan() {
    Harness h(true);
    h.config.retention_days = 7;
    const std::string fresh = h.Artifact("proj/target");
    const fs::path old = h.dir.MakeDir("elsewhere/old/target");

    BuildEvent event;
    event.project_path = old.parent_path().string();
    event.language = "Rust";
    event.artifact_path = old.string();
    event.size_bytes = 1;
    event.build_time = std::time(nullptr) - 8 * 24 * 60 * 60;
    h.store->InsertBuild(event);

    Session& session = h.Start();
    ASSERT(FinishScan(session));
    ASSERT(WaitUntil([&]() { return !fs::exists(old) && h.store->OldArtifactPaths(7).empty(); }));
    ASSERT(fs::exists(fresh));
    ASSERT_EQ(h.store->RecentArtifactPaths().size(), 1u);
}

void test_no_retention_cleanup_when_disabled() {
    Harness h(false);
    const fs::path old = h.dir.MakeDir("elsewhere/old/target");

    BuildEvent event;
    event.project_path = old.parent_path().string();
    event.language = "Rust";
    event.artifact_path = old.string();
    event.build_time = std::time(nullptr) - 40 * 24 * 60 * 60;
    h.store->InsertBuild(event);

    Session& session = h.Start();
    ASSERT(FinishScan(session));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT(fs::exists(old));
    ASSERT_EQ(h.store->OldArtifactPaths(30).size(), 1u);
}

int main() {
    std::cout << "Scan Tests:\n";
    TEST(first_tick_scans_and_reports);
    TEST(second_trigger_while_scanning_is_ignored);
    TEST(scan_summary_closes_selection_dialogs);
    TEST(scan_summary_closes_actions_menu);
    TEST(scan_keeps_password_prompt);
    TEST(selection_follows_path_across_scans);
    TEST(scan_completes_when_store_writes_fail);
    TEST(info_dismissed_twice);
    TEST(quit_only_without_popup);

    std::cout << "\nNavigation Tests:\n";
    TEST(selection_is_clamped);
    TEST(tab_cycles_focus);
    TEST(delete_without_artifacts);

    std::cout << "\nDeletion Tests:\n";
    TEST(delete_falls_back_to_password);
    TEST(delete_with_wrong_password_keeps_artifact);
    TEST(dismissing_prompt_clears_pending_action);
    TEST(passwordless_delete_via_actions_menu);

    std::cout << "\nClear All Tests:\n";
    TEST(clear_all_retries_only_failures);
    TEST(clear_all_partial_failure_keeps_failed_subset);
    TEST(clear_all_retry_spares_newly_scanned_artifacts);
    TEST(clear_all_without_password);
    TEST(clear_all_cancelled);

    std::cout << "\nSettings Tests:\n";
    TEST(malformed_retention_is_ignored);
    TEST(scan_path_from_directory_browser);
    TEST(automatic_removal_toggle);
    TEST(exclude_and_restore_path);
    TEST(exclude_needs_artifact_focus);

    std::cout << "\nRebuild Tests:\n";
    TEST(rebuild_without_build_system);
    TEST(detect_rebuild_command);

    std::cout << "\nRetention Tests:\n";
    TEST(retention_cleanup_after_scan);
    TEST(no_retention_cleanup_when_disabled);

    return PrintResults();
}
