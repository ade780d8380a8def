#include "sweep/BuildWatcher.hpp"

#include <cerrno>
#include <cstring>

#include <sys/inotify.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {
constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_MOVED_TO | IN_DELETE_SELF;
}

BuildWatcher::BuildWatcher(bool debug_logs) : fd_(inotify_init1(IN_NONBLOCK | IN_CLOEXEC)), debug_logs_(debug_logs) {
    if (fd_ < 0) {
        spdlog::warn("Build watcher unavailable: {}", std::strerror(errno));
    }
}

BuildWatcher::~BuildWatcher() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

bool BuildWatcher::Watch(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return false;
    }
    if (watches_.find(path) != watches_.end()) {
        return true;
    }

    const int wd = inotify_add_watch(fd_, path.c_str(), kWatchMask);
    if (wd < 0) {
        if (debug_logs_) {
            spdlog::debug("Could not watch {}: {}", path, std::strerror(errno));
        }
        return false;
    }

    watches_.emplace(path, wd);
    if (debug_logs_) {
        spdlog::debug("Watching {}", path);
    }
    return true;
}

std::size_t BuildWatcher::WatchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watches_.size();
}
