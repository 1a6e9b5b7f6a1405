#include "engine/ConfidenceScorer.hpp"
#include "engine/InputValidator.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace homescout {

namespace {

constexpr size_t kMaxReasonValueLength = 64;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::string* FindMetadata(const DiscoveredDevice& device, const std::string& key) {
    std::string wanted = ToLower(key);
    for (const auto& [name, value] : device.metadata) {
        if (ToLower(name) == wanted) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace

ConfidenceScorer::ConfidenceScorer(ScoringPolicy policy)
    : policy_(std::move(policy)) {
    for (auto& type : policy_.smart_home_service_types) {
        type = InputValidator::NormalizeServiceType(type).value_or(ToLower(type));
    }
    for (auto& pattern : policy_.known_vendor_patterns) {
        pattern = ToLower(pattern);
    }
    for (auto& prefix : policy_.smart_home_oui_prefixes) {
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        std::replace(prefix.begin(), prefix.end(), '-', ':');
    }
    if (policy_.low_threshold > policy_.high_threshold) {
        LOG_WARN("ConfidenceScorer: low threshold {} above high threshold {}",
                 policy_.low_threshold, policy_.high_threshold);
    }
}

ConfidenceAssessment ConfidenceScorer::Score(const DiscoveredDevice& device,
                                             const std::vector<Anomaly>& anomalies) const {
    ConfidenceAssessment assessment;
    assessment.computed_at = device.last_seen;
    int score = 0;

    // 1. Smart-home service type
    for (const auto& type : device.service_types) {
        auto it = std::find(policy_.smart_home_service_types.begin(),
                            policy_.smart_home_service_types.end(), ToLower(type));
        if (it != policy_.smart_home_service_types.end()) {
            score += policy_.service_type_weight;
            assessment.reasons.push_back(fmt::format("Advertises smart-home service {} (+{})",
                                                     type, policy_.service_type_weight));
            break;
        }
    }

    // 2. Unpaired / setup-required flag
    if (auto flag = FindUnpairedFlag(device)) {
        assessment.unpaired = true;
        score += policy_.unpaired_weight;
        assessment.reasons.push_back(fmt::format("Setup flag '{}' reports an unpaired accessory (+{})",
                                                 *flag, policy_.unpaired_weight));
    }

    // 3. Vendor, once
    if (auto vendor = FindVendorMatch(device)) {
        score += policy_.vendor_weight;
        assessment.reasons.push_back(fmt::format("{} (+{})", *vendor, policy_.vendor_weight));
    }

    // 4. Accessory port, once
    for (uint16_t port : device.ports) {
        auto it = std::find(policy_.accessory_ports.begin(), policy_.accessory_ports.end(), port);
        if (it != policy_.accessory_ports.end()) {
            score += policy_.accessory_port_weight;
            assessment.reasons.push_back(fmt::format("Accessory port {} open (+{})",
                                                     port, policy_.accessory_port_weight));
            break;
        }
    }

    // 5. Anomalies, capped in total
    int anomaly_points = 0;
    size_t unscored = 0;
    for (const auto& anomaly : anomalies) {
        int points = std::min(policy_.anomaly_weight, policy_.anomaly_cap - anomaly_points);
        points = std::max(points, 0);
        if (points == 0 && policy_.anomaly_weight > 0) {
            ++unscored;
            continue;
        }
        anomaly_points += points;
        score += points;
        assessment.reasons.push_back(fmt::format("Anomaly: {} (+{})", anomaly.description, points));
    }
    if (unscored > 0) {
        assessment.reasons.push_back(fmt::format("{} further anomalies not scored (cap +{} reached)",
                                                 unscored, policy_.anomaly_cap));
    }

    // 6. Missing or malformed name
    if (device.name.empty() || device.name_malformed) {
        score -= policy_.malformed_name_penalty;
        assessment.reasons.push_back(fmt::format("Missing or malformed name (-{})",
                                                 policy_.malformed_name_penalty));
    }

    assessment.score = static_cast<uint32_t>(std::clamp(score, 0, 100));
    assessment.threat = Classify(assessment.score, assessment.unpaired);
    return assessment;
}

ThreatLevel ConfidenceScorer::Classify(uint32_t score, bool unpaired) const {
    if (score >= policy_.high_threshold && unpaired) return ThreatLevel::HIGH;
    if (score >= policy_.low_threshold) return ThreatLevel::LOW;
    return ThreatLevel::NONE;
}

std::optional<std::string> ConfidenceScorer::FindUnpairedFlag(const DiscoveredDevice& device) const {
    for (const auto& key : policy_.unpaired_flag_keys) {
        const std::string* value = FindMetadata(device, key);
        if (value != nullptr && IsTruthy(*value)) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ConfidenceScorer::FindVendorMatch(const DiscoveredDevice& device) const {
    for (const auto& key : policy_.vendor_metadata_keys) {
        const std::string* value = FindMetadata(device, key);
        if (value == nullptr) {
            continue;
        }
        std::string lowered = ToLower(*value);
        for (const auto& pattern : policy_.known_vendor_patterns) {
            if (!pattern.empty() && lowered.find(pattern) != std::string::npos) {
                return fmt::format("Vendor '{}' matches known smart-home vendor",
                                   TruncateUtf8(*value, kMaxReasonValueLength));
            }
        }
    }

    if (device.mac) {
        for (const auto& prefix : policy_.smart_home_oui_prefixes) {
            if (!prefix.empty() && device.mac->compare(0, prefix.size(), prefix) == 0) {
                return fmt::format("MAC OUI {} belongs to a smart-home vendor", prefix);
            }
        }
    }

    return std::nullopt;
}

bool ConfidenceScorer::IsTruthy(const std::string& value) {
    std::string lowered = ToLower(value);
    lowered.erase(std::remove(lowered.begin(), lowered.end(), ' '), lowered.end());

    if (lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }

    // HAP status flags: bit 0 set means not paired.
    if (lowered.empty() || lowered.size() > 9 ||
        !std::all_of(lowered.begin(), lowered.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    return (std::stoul(lowered) & 1u) != 0;
}

} // namespace homescout
