#include "persistence/DeviceSerializer.hpp"
#include "core/Logger.hpp"
#include <cstdio>
#include <ctime>

namespace homescout {

nlohmann::json DeviceToJson(const DiscoveredDevice& device) {
    nlohmann::json j;
    j["key"] = device.key;
    j["name"] = device.name;
    j["name_malformed"] = device.name_malformed;
    j["ip"] = device.ip;
    j["mac"] = device.mac ? nlohmann::json(*device.mac) : nlohmann::json(nullptr);
    j["category"] = ServiceCategoryToString(device.category);
    j["service_types"] = device.service_types;
    j["metadata"] = device.metadata;
    j["ports"] = device.ports;

    nlohmann::json anomalies = nlohmann::json::array();
    for (const auto& anomaly : device.anomalies) {
        anomalies.push_back({{"type", AnomalyTypeToString(anomaly.type)},
                             {"description", anomaly.description}});
    }
    j["anomalies"] = anomalies;

    j["first_seen"] = device.first_seen;
    j["last_seen"] = device.last_seen;
    j["online"] = device.online;
    return j;
}

nlohmann::json AssessmentToJson(const ConfidenceAssessment& assessment) {
    nlohmann::json j;
    j["score"] = assessment.score;
    j["reasons"] = assessment.reasons;
    j["threat"] = ThreatLevelToString(assessment.threat);
    j["unpaired"] = assessment.unpaired;
    j["computed_at"] = assessment.computed_at;
    return j;
}

std::optional<DiscoveredDevice> DeviceFromJson(const nlohmann::json& j) {
    try {
        DiscoveredDevice device;
        device.key = j.at("key").get<std::string>();
        device.name = j.value("name", "");
        device.name_malformed = j.value("name_malformed", false);
        device.ip = j.value("ip", "");
        if (j.contains("mac") && j["mac"].is_string()) {
            device.mac = j["mac"].get<std::string>();
        }
        device.category = StringToServiceCategory(j.value("category", "UNKNOWN"));
        if (j.contains("service_types")) {
            device.service_types = j["service_types"].get<std::vector<std::string>>();
        }
        if (j.contains("metadata")) {
            device.metadata = j["metadata"].get<std::map<std::string, std::string>>();
        }
        if (j.contains("ports")) {
            device.ports = j["ports"].get<std::vector<uint16_t>>();
        }
        if (j.contains("anomalies")) {
            for (const auto& aj : j["anomalies"]) {
                device.anomalies.push_back({StringToAnomalyType(aj.value("type", "")),
                                            aj.value("description", "")});
            }
        }
        device.first_seen = j.value("first_seen", uint64_t{0});
        device.last_seen = j.value("last_seen", uint64_t{0});
        device.online = j.value("online", true);
        return device;
    } catch (const nlohmann::json::exception& ex) {
        LOG_WARN("DeviceSerializer: malformed device document: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<ConfidenceAssessment> AssessmentFromJson(const nlohmann::json& j) {
    try {
        ConfidenceAssessment assessment;
        assessment.score = j.at("score").get<uint32_t>();
        if (j.contains("reasons")) {
            assessment.reasons = j["reasons"].get<std::vector<std::string>>();
        }
        assessment.threat = StringToThreatLevel(j.value("threat", "NONE"));
        assessment.unpaired = j.value("unpaired", false);
        assessment.computed_at = j.value("computed_at", uint64_t{0});
        return assessment;
    } catch (const nlohmann::json::exception& ex) {
        LOG_WARN("DeviceSerializer: malformed assessment document: {}", ex.what());
        return std::nullopt;
    }
}

std::string TimestampToISO8601(uint64_t ms_epoch) {
    time_t seconds = static_cast<time_t>(ms_epoch / 1000);
    unsigned millis = static_cast<unsigned>(ms_epoch % 1000);

    struct tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);
    return buf;
}

ServiceCategory StringToServiceCategory(const std::string& s) {
    if (s == "HOME_AUTOMATION") return ServiceCategory::HOME_AUTOMATION;
    if (s == "MEDIA_STREAMING") return ServiceCategory::MEDIA_STREAMING;
    if (s == "GENERIC_NETWORK") return ServiceCategory::GENERIC_NETWORK;
    return ServiceCategory::UNKNOWN;
}

ThreatLevel StringToThreatLevel(const std::string& s) {
    if (s == "HIGH") return ThreatLevel::HIGH;
    if (s == "LOW") return ThreatLevel::LOW;
    return ThreatLevel::NONE;
}

AnomalyType StringToAnomalyType(const std::string& s) {
    if (s == "IP_HOPPING") return AnomalyType::IP_HOPPING;
    if (s == "UNEXPECTED_PORT") return AnomalyType::UNEXPECTED_PORT;
    return AnomalyType::NAME_CHANGED;
}

} // namespace homescout
