#pragma once

#include "engine/DeviceTypes.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace homescout {

nlohmann::json DeviceToJson(const DiscoveredDevice& device);
nlohmann::json AssessmentToJson(const ConfidenceAssessment& assessment);

// Return nullopt (and log) when the document does not describe a device.
std::optional<DiscoveredDevice> DeviceFromJson(const nlohmann::json& j);
std::optional<ConfidenceAssessment> AssessmentFromJson(const nlohmann::json& j);

// "2026-01-31T12:00:00.123Z"
std::string TimestampToISO8601(uint64_t ms_epoch);

ServiceCategory StringToServiceCategory(const std::string& s);
ThreatLevel StringToThreatLevel(const std::string& s);
AnomalyType StringToAnomalyType(const std::string& s);

} // namespace homescout
