#pragma once

#include "core/Config.hpp"
#include "engine/DeviceTypes.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace homescout {

enum class RejectionReason {
    NONE,
    INVALID_ADDRESS,
    OUT_OF_RANGE,
    INVALID_PORT
};

struct SanitizedName {
    std::string value;
    bool malformed = false;
};

struct ValidationOutcome {
    bool accepted = false;
    RejectionReason reason = RejectionReason::NONE;
    std::string detail;

    // Populated only when accepted: key, name, address, MAC, category,
    // the single advertised service type and port, metadata, timestamps.
    DiscoveredDevice device;

    // Field-level drops that did not reject the event.
    std::vector<std::string> dropped_fields;
};

class InputValidator {
public:
    explicit InputValidator(ValidatorLimits limits = ValidatorLimits{},
                            const std::vector<std::string>& smart_home_service_types =
                                ScoringPolicy{}.smart_home_service_types);

    // Restrict accepted IPv4 hosts to a CIDR block ("192.168.1.0/24").
    // An empty string clears the restriction. Returns false on a malformed
    // range, in which case no restriction is applied.
    bool SetNetworkRange(const std::string& cidr);
    bool HasNetworkRange() const { return range_prefix_ >= 0; }

    ValidationOutcome Validate(const RawAdvertisement& raw, uint64_t now_ms) const;

    SanitizedName SanitizeName(const std::string& name) const;
    std::optional<std::string> NormalizeAddress(const std::string& host) const;
    bool IsInNetworkRange(const std::string& normalized_ip) const;
    std::map<std::string, std::string> SanitizeMetadata(
        const std::map<std::string, std::string>& metadata,
        std::vector<std::string>& dropped) const;
    std::optional<std::string> ExtractMac(const std::map<std::string, std::string>& metadata) const;

    static std::optional<std::string> NormalizeMac(const std::string& mac);
    static bool IsValidPort(int port);
    static bool IsValidMetadataKey(const std::string& key, size_t max_length);
    static std::optional<std::string> NormalizeServiceType(const std::string& service_type);
    ServiceCategory ClassifyServiceType(const std::string& service_type) const;
    static bool ContainsUnsafeContent(const std::string& value);
    static std::string MakeDeviceKey(const std::string& sanitized_name,
                                     const std::string& ip,
                                     const std::optional<std::string>& mac);

    const ValidatorLimits& GetLimits() const { return limits_; }

private:
    void AddServiceTypes(const std::vector<std::string>& service_types, ServiceCategory category);

    ValidatorLimits limits_;
    std::unordered_map<std::string, ServiceCategory> service_categories_;
    std::string range_cidr_;
    uint32_t range_network_ = 0;
    uint32_t range_mask_ = 0;
    int range_prefix_ = -1;
};

std::string RejectionReasonToString(RejectionReason reason);

// Truncates to at most max_bytes without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& value, size_t max_bytes);

} // namespace homescout
