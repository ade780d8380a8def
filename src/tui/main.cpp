#include <memory>
#include <filesystem>
#include <iostream>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>
#include <spdlog/spdlog.h>

#include "sweep/BuildWatcher.hpp"
#include "sweep/Config.hpp"
#include "sweep/Logging.hpp"
#include "sweep/PrivilegedRemover.hpp"
#include "sweep/Session.hpp"
#include "sweep/SqliteArtifactStore.hpp"
#include "tui/DashboardScreen.hpp"
#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"

int main() {
    // Install the stop handlers early so Ctrl-C can cleanly exit the loop.
    InitSignalHandlers();

    ConfigStore config_store(ConfigStore::DefaultPath());
    Config config = DefaultConfig();
    if (!config_store.Load(config)) {
        std::cerr << "Warning: could not load config from " << config_store.Path() << "; using defaults.\n";
    }

    const std::filesystem::path log_path = DefaultLogPath();
    if (!InitLogging(log_path, config.debug_logs_enabled)) {
        std::cerr << "Warning: could not open log file " << log_path << "; logging disabled.\n";
    }

    std::shared_ptr<ArtifactStore> store;
    try {
        store = std::make_shared<SqliteArtifactStore>(config.database_path);
    } catch (const ArtifactStoreError& e) {
        std::cerr << "Error: could not open database " << config.database_path << ": " << e.what() << "\n";
        spdlog::critical("Could not open database {}: {}", config.database_path, e.what());
        return 1;
    }

    auto watcher = std::make_shared<BuildWatcher>(config.debug_logs_enabled);
    Session session(config, config_store, store, std::make_shared<SudoRemover>(), watcher);
    session.Initialize();
    spdlog::info("Session started with {} known artifacts", session.Artifacts().size());

    // Configure NotCurses and suppress the startup banner.
    notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
    nc_options.flags |= NCOPTION_SUPPRESS_BANNERS;
    ncpp::NotCurses nc(nc_options);

    // Grab the root plane; it tracks the terminal size automatically.
    std::unique_ptr<ncpp::Plane> stdplane{nc.get_stdplane()};

    StateMachine machine;
    machine.AddState("dashboard", std::make_shared<DashboardScreen>(session));
    machine.TransitionTo("dashboard", nc, *stdplane);

    // Enter the main loop: draw, poll, and dispatch to the active state.
    machine.Run(nc, *stdplane);

    // Detached scans and cleanups are not joined; each holds its own references.
    spdlog::info("Session ended");
    spdlog::shutdown();
    return 0;
}
