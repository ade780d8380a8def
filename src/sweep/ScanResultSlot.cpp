#include "sweep/ScanResultSlot.hpp"

#include <utility>

bool ScanResultSlot::Offer(std::vector<std::string> artifacts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value_.has_value()) {
        return false;
    }
    value_ = std::move(artifacts);
    return true;
}

std::optional<std::vector<std::string>> ScanResultSlot::TryTake() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::vector<std::string>> taken = std::move(value_);
    value_.reset();
    return taken;
}
