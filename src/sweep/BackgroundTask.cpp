#include "sweep/BackgroundTask.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

bool RunDetached(const std::string& name, std::function<void()> task) {
    try {
        std::thread([name, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("Background task '{}' failed: {}", name, e.what());
            }
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("Could not start background task '{}': {}", name, e.what());
        return false;
    }
    return true;
}
