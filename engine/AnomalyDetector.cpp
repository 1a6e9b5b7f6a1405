#include "engine/AnomalyDetector.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace homescout {

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool IsIPv6(const std::string& ip) {
    return ip.find(':') != std::string::npos;
}

} // namespace

AnomalyDetector::AnomalyDetector(std::vector<uint16_t> expected_ports)
    : expected_ports_(std::move(expected_ports)) {
    std::sort(expected_ports_.begin(), expected_ports_.end());
}

bool AnomalyDetector::IsExpectedPort(uint16_t port) const {
    return std::binary_search(expected_ports_.begin(), expected_ports_.end(), port);
}

std::vector<Anomaly> AnomalyDetector::Detect(const DiscoveredDevice* prior,
                                             const DiscoveredDevice& current) const {
    std::vector<Anomaly> anomalies;
    if (prior == nullptr) {
        return anomalies;
    }

    if (!prior->name.empty() && !current.name.empty() &&
        !EqualsIgnoreCase(prior->name, current.name)) {
        anomalies.push_back({AnomalyType::NAME_CHANGED,
            fmt::format("Name changed from '{}' to '{}'", prior->name, current.name)});
    }

    // Dual-stack hosts advertise both an A and an AAAA record, so only a
    // change within one address family counts as hopping.
    if (prior->mac && current.mac && *prior->mac == *current.mac &&
        prior->ip != current.ip && IsIPv6(prior->ip) == IsIPv6(current.ip)) {
        anomalies.push_back({AnomalyType::IP_HOPPING,
            fmt::format("IP changed from {} to {} with constant MAC {}",
                        prior->ip, current.ip, *current.mac)});
    }

    for (uint16_t port : current.ports) {
        bool seen = std::binary_search(prior->ports.begin(), prior->ports.end(), port);
        if (!seen && !IsExpectedPort(port)) {
            anomalies.push_back({AnomalyType::UNEXPECTED_PORT,
                fmt::format("Unexpected port {} advertised", port)});
        }
    }

    return anomalies;
}

size_t MergeAnomalies(std::vector<Anomaly>& sticky, const std::vector<Anomaly>& fresh, size_t max_anomalies) {
    size_t appended = 0;
    for (const auto& anomaly : fresh) {
        if (sticky.size() >= max_anomalies) {
            break;
        }
        bool duplicate = std::any_of(sticky.begin(), sticky.end(), [&anomaly](const Anomaly& existing) {
            return existing.description == anomaly.description;
        });
        if (!duplicate) {
            sticky.push_back(anomaly);
            ++appended;
        }
    }
    return appended;
}

} // namespace homescout
