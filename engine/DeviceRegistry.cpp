#include "engine/DeviceRegistry.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace homescout {

DeviceRegistry::DeviceRegistry(size_t capacity, EventBus* fault_bus, std::string session_id)
    : capacity_(capacity), fault_bus_(fault_bus), session_id_(std::move(session_id)) {
    if (capacity_ == 0) {
        LOG_WARN("DeviceRegistry: capacity 0 requested, using 1");
        capacity_ = 1;
    }
}

RegistryDelta DeviceRegistry::Upsert(const DiscoveredDevice& device,
                                     const ConfidenceAssessment& assessment) {
    RegistryDelta delta;
    delta.key = device.key;
    std::optional<std::string> fault;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = records_.find(device.key);
        if (it != records_.end()) {
            DeviceRecord& record = it->second;
            uint64_t first_seen = record.device.first_seen;
            uint64_t last_seen = std::max(record.device.last_seen, device.last_seen);

            CountThreat(record.assessment.threat, -1);
            record.device = device;
            record.device.first_seen = first_seen;
            record.device.last_seen = last_seen;
            record.assessment = assessment;
            CountThreat(assessment.threat, +1);

            delta.updated = true;
        } else {
            if (records_.size() >= capacity_ && !order_.empty()) {
                auto oldest = order_.begin();
                auto victim = records_.find(oldest->second);
                if (victim != records_.end()) {
                    CountThreat(victim->second.assessment.threat, -1);
                    delta.evicted_record = std::move(victim->second);
                    records_.erase(victim);
                }
                order_.erase(oldest);
                delta.evicted = true;
            }

            order_.emplace(device.first_seen, device.key);
            records_.emplace(device.key, DeviceRecord{device, assessment});
            CountThreat(assessment.threat, +1);
            delta.added = true;
        }

        fault = CheckInvariants();
    }

    if (fault) {
        ReportFault(*fault);
    }

    if (delta.evicted && delta.evicted_record) {
        LOG_DEBUG("DeviceRegistry: evicted {} to admit {}", delta.evicted_record->device.key, device.key);
    }
    return delta;
}

std::optional<DeviceRecord> DeviceRegistry::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<DeviceRecord> DeviceRegistry::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> snapshot;
    snapshot.reserve(records_.size());
    for (const auto& [first_seen, key] : order_) {
        auto it = records_.find(key);
        if (it != records_.end()) {
            snapshot.push_back(it->second);
        }
    }
    return snapshot;
}

bool DeviceRegistry::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    order_.erase({it->second.device.first_seen, key});
    CountThreat(it->second.assessment.threat, -1);
    records_.erase(it);
    return true;
}

void DeviceRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    order_.clear();
    threat_counts_.fill(0);
}

std::optional<DeviceRecord> DeviceRegistry::MarkOffline(const std::string& key, uint64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end() || !it->second.device.online) {
        return std::nullopt;
    }
    it->second.device.online = false;
    it->second.device.last_seen = std::max(it->second.device.last_seen, timestamp_ms);
    return it->second;
}

size_t DeviceRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t DeviceRegistry::GetThreatCount(ThreatLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threat_counts_[static_cast<size_t>(level)];
}

// Caller holds mutex_.
void DeviceRegistry::CountThreat(ThreatLevel level, int delta) {
    size_t& count = threat_counts_[static_cast<size_t>(level)];
    if (delta < 0) {
        if (count > 0) --count;
    } else {
        ++count;
    }
}

// Caller holds mutex_.
std::optional<std::string> DeviceRegistry::CheckInvariants() const {
    if (records_.size() > capacity_) {
        return fmt::format("registry size {} exceeds capacity {}", records_.size(), capacity_);
    }
    if (records_.size() != order_.size()) {
        return fmt::format("eviction index has {} entries for {} devices", order_.size(), records_.size());
    }
    return std::nullopt;
}

void DeviceRegistry::ReportFault(const std::string& message) {
    LOG_CRITICAL("DeviceRegistry invariant violated: {}", message);
    if (fault_bus_) {
        Event event(EventType::REGISTRY_FAULT, session_id_);
        event.metadata["message"] = message;
        fault_bus_->Publish(event);
    }
}

} // namespace homescout
