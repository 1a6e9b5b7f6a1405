#pragma once

#include "engine/DeviceTypes.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace homescout {

class EventBus;

struct DeviceRecord {
    DiscoveredDevice device;
    ConfidenceAssessment assessment;
};

struct RegistryDelta {
    bool added = false;
    bool updated = false;
    bool evicted = false;
    std::string key;
    std::optional<DeviceRecord> evicted_record;
};

// Bounded key -> device map. When full, admitting a new key evicts the
// entry with the oldest first_seen (ties broken by key).
class DeviceRegistry {
public:
    explicit DeviceRegistry(size_t capacity = 500, EventBus* fault_bus = nullptr,
                            std::string session_id = "");

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    RegistryDelta Upsert(const DiscoveredDevice& device, const ConfidenceAssessment& assessment);

    std::optional<DeviceRecord> Get(const std::string& key) const;

    // Snapshot ordered by (first_seen, key).
    std::vector<DeviceRecord> All() const;

    bool Remove(const std::string& key);
    void Clear();

    // Returns the updated record, or nullopt when the key is unknown or the
    // device is already offline.
    std::optional<DeviceRecord> MarkOffline(const std::string& key, uint64_t timestamp_ms);

    size_t Size() const;
    size_t Capacity() const { return capacity_; }
    size_t GetThreatCount(ThreatLevel level) const;

private:
    using OrderKey = std::pair<uint64_t, std::string>;

    void CountThreat(ThreatLevel level, int delta);
    std::optional<std::string> CheckInvariants() const;
    void ReportFault(const std::string& message);

    size_t capacity_;
    EventBus* fault_bus_;
    std::string session_id_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeviceRecord> records_;
    std::set<OrderKey> order_;
    std::array<size_t, 3> threat_counts_{};
};

} // namespace homescout
