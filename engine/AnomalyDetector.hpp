#pragma once

#include "engine/DeviceTypes.hpp"
#include <cstdint>
#include <vector>

namespace homescout {

// Compares an admitted advertisement against the last known record for the
// same device key. Stateless; the registry holds the prior record.
class AnomalyDetector {
public:
    explicit AnomalyDetector(std::vector<uint16_t> expected_ports);

    std::vector<Anomaly> Detect(const DiscoveredDevice* prior, const DiscoveredDevice& current) const;

    bool IsExpectedPort(uint16_t port) const;

private:
    std::vector<uint16_t> expected_ports_;
};

// Appends anomalies not already present (by description), keeping at most
// max_anomalies. Returns the number actually appended.
size_t MergeAnomalies(std::vector<Anomaly>& sticky, const std::vector<Anomaly>& fresh, size_t max_anomalies);

} // namespace homescout
