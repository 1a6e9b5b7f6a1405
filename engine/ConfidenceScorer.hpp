#pragma once

#include "core/Config.hpp"
#include "engine/DeviceTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace homescout {

// Pure rule-based scoring: the same device and anomalies always produce the
// same assessment. Weights and allow-lists come from ScoringPolicy.
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(ScoringPolicy policy = ScoringPolicy{});

    ConfidenceAssessment Score(const DiscoveredDevice& device,
                               const std::vector<Anomaly>& anomalies) const;

    ThreatLevel Classify(uint32_t score, bool unpaired) const;

    std::optional<std::string> FindUnpairedFlag(const DiscoveredDevice& device) const;
    std::optional<std::string> FindVendorMatch(const DiscoveredDevice& device) const;

    static bool IsTruthy(const std::string& value);

    const ScoringPolicy& GetPolicy() const { return policy_; }

private:
    ScoringPolicy policy_;
};

} // namespace homescout
