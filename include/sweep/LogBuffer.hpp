#ifndef SWEEP_LOGBUFFER_HPP
#define SWEEP_LOGBUFFER_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Bounded, append-only list of progress lines shared between background work and the UI.
// Oldest lines are dropped once capacity is reached.
class LogBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 500;

    explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

    void Append(std::string line);

    // Copy of the newest `count` lines, oldest first.
    std::vector<std::string> Tail(std::size_t count) const;
    std::vector<std::string> Snapshot() const;
    std::size_t Size() const;

private:
    std::size_t capacity_;
    std::deque<std::string> lines_;
    mutable std::mutex mutex_;
};

#endif // SWEEP_LOGBUFFER_HPP
