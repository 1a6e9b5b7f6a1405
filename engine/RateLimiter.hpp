#pragma once

#include "core/Config.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace homescout {

// Accepted timestamps for one source key inside the trailing window.
struct RateWindow {
    std::mutex mutex;
    std::deque<uint64_t> timestamps;
    uint64_t last_activity = 0;
    bool retired = false;          // removed from the key map; callers must look up again
};

// Sliding-window limiter keyed by source. The key map is guarded by a
// shared_mutex; each window carries its own mutex so check-and-record is
// atomic per key while distinct keys proceed in parallel.
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config = RateLimitConfig{});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Returns true and records the timestamp when the key is under its
    // threshold; returns false and counts a suppression otherwise.
    bool CheckAndRecord(const std::string& source_key, uint64_t timestamp_ms);

    uint64_t GetSuppressedCount() const { return suppressed_.load(); }
    size_t GetTrackedKeyCount() const;
    size_t GetWindowCount(const std::string& source_key, uint64_t now_ms) const;
    const RateLimitConfig& GetConfig() const { return config_; }

    void Reset();

private:
    std::shared_ptr<RateWindow> GetOrCreateWindow(const std::string& source_key, uint64_t now_ms);
    void PurgeStale(RateWindow& window, uint64_t now_ms) const;
    void SweepIdleWindows(uint64_t now_ms);

    RateLimitConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RateWindow>> windows_;
    std::atomic<uint64_t> suppressed_{0};
};

} // namespace homescout
