#include "sweep/LogBuffer.hpp"

#include <algorithm>
#include <utility>

LogBuffer::LogBuffer(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

void LogBuffer::Append(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

std::vector<std::string> LogBuffer::Tail(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t take = std::min(count, lines_.size());
    return std::vector<std::string>(lines_.end() - static_cast<std::ptrdiff_t>(take), lines_.end());
}

std::vector<std::string> LogBuffer::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

std::size_t LogBuffer::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}
