#include "engine/RateLimiter.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace homescout {

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_(config) {
    if (config_.threshold == 0) {
        LOG_WARN("RateLimiter: threshold 0 would suppress every event, using 1");
        config_.threshold = 1;
    }
}

bool RateLimiter::CheckAndRecord(const std::string& source_key, uint64_t timestamp_ms) {
    std::shared_ptr<RateWindow> window;
    std::unique_lock<std::mutex> lock;
    for (;;) {
        window = GetOrCreateWindow(source_key, timestamp_ms);
        lock = std::unique_lock<std::mutex>(window->mutex);
        if (!window->retired) {
            break;
        }
        lock.unlock();
    }

    // Out-of-order timestamps are clamped so the deque stays sorted.
    uint64_t now = std::max(timestamp_ms, window->last_activity);
    PurgeStale(*window, now);

    if (window->timestamps.size() >= config_.threshold) {
        ++suppressed_;
        LOG_TRACE("RateLimiter: suppressed event from {} ({} in window)",
                  source_key, window->timestamps.size());
        return false;
    }

    window->timestamps.push_back(now);
    window->last_activity = now;
    return true;
}

size_t RateLimiter::GetTrackedKeyCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return windows_.size();
}

size_t RateLimiter::GetWindowCount(const std::string& source_key, uint64_t now_ms) const {
    std::shared_ptr<RateWindow> window;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = windows_.find(source_key);
        if (it == windows_.end()) {
            return 0;
        }
        window = it->second;
    }

    std::lock_guard<std::mutex> lock(window->mutex);
    return static_cast<size_t>(std::count_if(
        window->timestamps.begin(), window->timestamps.end(),
        [this, now_ms](uint64_t ts) { return ts + config_.window_ms > now_ms; }));
}

void RateLimiter::Reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : windows_) {
        std::lock_guard<std::mutex> window_lock(entry.second->mutex);
        entry.second->retired = true;
    }
    windows_.clear();
    suppressed_ = 0;
}

std::shared_ptr<RateWindow> RateLimiter::GetOrCreateWindow(const std::string& source_key,
                                                           uint64_t now_ms) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = windows_.find(source_key);
        if (it != windows_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = windows_.find(source_key);
    if (it != windows_.end()) {
        return it->second;
    }

    if (windows_.size() >= config_.max_tracked_keys) {
        SweepIdleWindows(now_ms);
    }

    auto window = std::make_shared<RateWindow>();
    windows_.emplace(source_key, window);
    return window;
}

void RateLimiter::PurgeStale(RateWindow& window, uint64_t now_ms) const {
    while (!window.timestamps.empty() &&
           window.timestamps.front() + config_.window_ms <= now_ms) {
        window.timestamps.pop_front();
    }
}

// Caller holds mutex_ exclusively.
void RateLimiter::SweepIdleWindows(uint64_t now_ms) {
    size_t before = windows_.size();
    for (auto it = windows_.begin(); it != windows_.end();) {
        std::unique_lock<std::mutex> window_lock(it->second->mutex);
        PurgeStale(*it->second, now_ms);
        bool idle = it->second->timestamps.empty();
        if (idle) {
            it->second->retired = true;
        }
        window_lock.unlock();

        if (idle) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
    LOG_DEBUG("RateLimiter: swept {} idle windows ({} still tracked)",
              before - windows_.size(), windows_.size());
}

} // namespace homescout
