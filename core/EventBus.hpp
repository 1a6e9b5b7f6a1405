#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declare ThreadPool to avoid circular includes
namespace homescout { class ThreadPool; }

namespace homescout {

enum class EventType {
    SCAN_STATE_CHANGE,
    SCAN_PROGRESS,
    SCAN_DEGRADED,
    DEVICE_ADDED,
    DEVICE_UPDATED,
    DEVICE_EVICTED,
    THREAT_DETECTED,
    REGISTRY_FAULT
};

struct Event {
    EventType type;
    uint64_t timestamp;
    std::string session_id;
    std::string device_key;
    std::map<std::string, std::string> metadata;

    Event(EventType t, const std::string& session, const std::string& key = "")
        : type(t), timestamp(GetCurrentTimestamp()), session_id(session), device_key(key) {}

    Event(EventType t, uint64_t ts, const std::string& session, const std::string& key = "")
        : type(t), timestamp(ts), session_id(session), device_key(key) {}

private:
    static uint64_t GetCurrentTimestamp();
};

using EventHandler = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

// Observer channel for one scan session. Publish() delivers on the calling
// thread in subscription order; PublishAsync() hands delivery to a
// single-worker pool so ordering across publishes is preserved.
class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(EventType type, EventHandler handler);
    SubscriptionId SubscribeAll(EventHandler handler);
    void Unsubscribe(SubscriptionId id);
    void Publish(const Event& event);
    void PublishAsync(Event event);

    void InitAsyncPool();

    // Drain all pending async deliveries and shut down the pool.
    void ShutdownAsyncPool();

    size_t GetSubscriberCount(EventType type) const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<EventType, std::vector<std::pair<SubscriptionId, EventHandler>>> subscribers_;
    std::vector<std::pair<SubscriptionId, EventHandler>> wildcard_subscribers_;
    SubscriptionId next_id_ = 1;

    std::unique_ptr<ThreadPool> async_pool_;
};

inline std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::SCAN_STATE_CHANGE: return "SCAN_STATE_CHANGE";
        case EventType::SCAN_PROGRESS:     return "SCAN_PROGRESS";
        case EventType::SCAN_DEGRADED:     return "SCAN_DEGRADED";
        case EventType::DEVICE_ADDED:      return "DEVICE_ADDED";
        case EventType::DEVICE_UPDATED:    return "DEVICE_UPDATED";
        case EventType::DEVICE_EVICTED:    return "DEVICE_EVICTED";
        case EventType::THREAT_DETECTED:   return "THREAT_DETECTED";
        case EventType::REGISTRY_FAULT:    return "REGISTRY_FAULT";
        default:                           return "UNKNOWN";
    }
}

} // namespace homescout
