#ifndef SWEEP_BUILDWATCHER_HPP
#define SWEEP_BUILDWATCHER_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

// Registers artifact directories with inotify so later rebuilds can be noticed.
// Registration failures are reported but never fatal. Safe to share between threads.
class BuildWatcher {
public:
    explicit BuildWatcher(bool debug_logs);
    ~BuildWatcher();

    BuildWatcher(const BuildWatcher&) = delete;
    BuildWatcher& operator=(const BuildWatcher&) = delete;

    // Returns false if the path could not be watched. Re-registering a path is a no-op.
    bool Watch(const std::string& path);

    std::size_t WatchCount() const;
    bool IsRunning() const { return fd_ >= 0; }

private:
    int fd_;
    bool debug_logs_;
    std::unordered_map<std::string, int> watches_;
    mutable std::mutex mutex_;
};

#endif // SWEEP_BUILDWATCHER_HPP
