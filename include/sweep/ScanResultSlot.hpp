#ifndef SWEEP_SCANRESULTSLOT_HPP
#define SWEEP_SCANRESULTSLOT_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Single-slot handoff for a finished scan. One producer per scan, one consumer (the session loop).
class ScanResultSlot {
public:
    // Stores the result; returns false if a previous result has not been taken yet.
    bool Offer(std::vector<std::string> artifacts);

    // Empties the slot. Returns nullopt when nothing is waiting.
    std::optional<std::vector<std::string>> TryTake();

private:
    std::optional<std::vector<std::string>> value_;
    std::mutex mutex_;
};

#endif // SWEEP_SCANRESULTSLOT_HPP
