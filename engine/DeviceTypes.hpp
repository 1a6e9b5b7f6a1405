#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace homescout {

enum class ServiceCategory {
    HOME_AUTOMATION,
    MEDIA_STREAMING,
    GENERIC_NETWORK,
    UNKNOWN
};

enum class ThreatLevel {
    NONE,
    LOW,
    HIGH
};

enum class AnomalyType {
    NAME_CHANGED,
    IP_HOPPING,
    UNEXPECTED_PORT
};

struct Anomaly {
    AnomalyType type;
    std::string description;
};

// One service advertisement as delivered by a discovery source, before any
// validation. Every field is untrusted.
struct RawAdvertisement {
    std::string instance_name;
    std::string host;
    int port = 0;
    std::string service_type;
    std::map<std::string, std::string> metadata;
    uint64_t received_at_ms = 0;   // 0 = stamp with the engine clock
    bool removed = false;          // goodbye packet (TTL 0)
};

struct DiscoveredDevice {
    std::string key;
    std::string name;
    bool name_malformed = false;
    std::string ip;
    std::optional<std::string> mac;
    ServiceCategory category = ServiceCategory::UNKNOWN;
    std::vector<std::string> service_types;
    std::map<std::string, std::string> metadata;
    std::vector<uint16_t> ports;        // sorted, unique
    std::vector<Anomaly> anomalies;     // insertion order, deduplicated
    uint64_t first_seen = 0;
    uint64_t last_seen = 0;
    bool online = true;
};

struct ConfidenceAssessment {
    uint32_t score = 0;
    std::vector<std::string> reasons;
    ThreatLevel threat = ThreatLevel::NONE;
    bool unpaired = false;
    uint64_t computed_at = 0;
};

inline std::string ServiceCategoryToString(ServiceCategory category) {
    switch (category) {
        case ServiceCategory::HOME_AUTOMATION: return "HOME_AUTOMATION";
        case ServiceCategory::MEDIA_STREAMING: return "MEDIA_STREAMING";
        case ServiceCategory::GENERIC_NETWORK: return "GENERIC_NETWORK";
        case ServiceCategory::UNKNOWN:         return "UNKNOWN";
        default:                               return "UNKNOWN";
    }
}

inline std::string ThreatLevelToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::NONE: return "NONE";
        case ThreatLevel::LOW:  return "LOW";
        case ThreatLevel::HIGH: return "HIGH";
        default:                return "NONE";
    }
}

inline std::string AnomalyTypeToString(AnomalyType type) {
    switch (type) {
        case AnomalyType::NAME_CHANGED:    return "NAME_CHANGED";
        case AnomalyType::IP_HOPPING:      return "IP_HOPPING";
        case AnomalyType::UNEXPECTED_PORT: return "UNEXPECTED_PORT";
        default:                           return "UNKNOWN";
    }
}

} // namespace homescout
