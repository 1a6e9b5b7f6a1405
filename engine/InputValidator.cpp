#include "engine/InputValidator.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>
#include <arpa/inet.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace homescout {

namespace {

// Pre-truncation factor applied before sanitizing a name so the work done on
// hostile input stays proportional to the configured bound.
constexpr size_t kNameScanFactor = 4;

constexpr size_t kMaxServiceNameLength = 15;

const std::array<const char*, 3> kScriptSchemes = {"javascript:", "vbscript:", "data:"};
const std::array<const char*, 3> kCommentSequences = {"--", "/*", "*/"};
const std::array<const char*, 8> kQueryKeywords = {
    "drop", "delete", "insert", "update", "select", "shutdown", "exec", "union"};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsControl(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

std::string StripControl(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (!IsControl(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// Removes "<...>" sequences and any unmatched angle bracket.
std::string StripTags(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        char c = value[i];
        if (c == '<') {
            size_t close = value.find('>', i + 1);
            i = (close == std::string::npos) ? i + 1 : close + 1;
            continue;
        }
        if (c != '>') {
            out.push_back(c);
        }
        ++i;
    }
    return out;
}

// Scheme match must start the string or follow a non-alphanumeric byte, so
// "metadata:" does not count as a "data:" scheme.
size_t FindScheme(const std::string& lowered, const std::string& scheme, size_t from = 0) {
    size_t pos = lowered.find(scheme, from);
    while (pos != std::string::npos) {
        if (pos == 0 || !std::isalnum(static_cast<unsigned char>(lowered[pos - 1]))) {
            return pos;
        }
        pos = lowered.find(scheme, pos + 1);
    }
    return std::string::npos;
}

bool EraseSchemes(std::string& value) {
    bool changed = false;
    bool found = true;
    while (found) {
        found = false;
        std::string lowered = ToLower(value);
        for (const char* scheme : kScriptSchemes) {
            size_t pos = FindScheme(lowered, scheme);
            if (pos != std::string::npos) {
                value.erase(pos, std::strlen(scheme));
                changed = found = true;
                break;
            }
        }
    }
    return changed;
}

bool EraseAll(std::string& value, const std::string& token) {
    bool changed = false;
    size_t pos = value.find(token);
    while (pos != std::string::npos) {
        value.erase(pos, token.size());
        changed = true;
        pos = value.find(token);
    }
    return changed;
}

std::string Trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

bool HasNameCharacter(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c >= 0x80;
    });
}

bool LooksLikeQueryInjection(const std::string& lowered) {
    for (const char* seq : kCommentSequences) {
        if (lowered.find(seq) != std::string::npos) {
            return true;
        }
    }

    bool has_quote = lowered.find_first_of("'\"`") != std::string::npos;
    if (has_quote && (lowered.find(';') != std::string::npos ||
                      lowered.find('=') != std::string::npos ||
                      lowered.find(" or ") != std::string::npos)) {
        return true;
    }

    size_t semi = lowered.find(';');
    while (semi != std::string::npos) {
        size_t word = lowered.find_first_not_of(' ', semi + 1);
        if (word != std::string::npos) {
            for (const char* keyword : kQueryKeywords) {
                if (lowered.compare(word, std::strlen(keyword), keyword) == 0) {
                    return true;
                }
            }
        }
        semi = lowered.find(';', semi + 1);
    }

    return lowered.find("union select") != std::string::npos;
}

bool ParseIPv4(const std::string& text, uint32_t& out) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    out = ntohl(addr.s_addr);
    return true;
}

} // namespace

std::string TruncateUtf8(const std::string& value, size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

std::string RejectionReasonToString(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NONE:            return "NONE";
        case RejectionReason::INVALID_ADDRESS: return "INVALID_ADDRESS";
        case RejectionReason::OUT_OF_RANGE:    return "OUT_OF_RANGE";
        case RejectionReason::INVALID_PORT:    return "INVALID_PORT";
        default:                               return "UNKNOWN";
    }
}

InputValidator::InputValidator(ValidatorLimits limits, const std::vector<std::string>& smart_home_service_types)
    : limits_(std::move(limits)) {
    AddServiceTypes(smart_home_service_types, ServiceCategory::HOME_AUTOMATION);
    AddServiceTypes(limits_.media_service_types, ServiceCategory::MEDIA_STREAMING);
}

void InputValidator::AddServiceTypes(const std::vector<std::string>& service_types, ServiceCategory category) {
    for (const auto& type : service_types) {
        auto normalized = NormalizeServiceType(type);
        if (!normalized) {
            LOG_WARN("InputValidator: ignoring malformed service type '{}' in category table", type);
            continue;
        }
        // First listing wins.
        service_categories_.emplace(*normalized, category);
    }
}

bool InputValidator::SetNetworkRange(const std::string& cidr) {
    range_cidr_.clear();
    range_prefix_ = -1;
    if (cidr.empty()) {
        return true;
    }

    size_t slash = cidr.find('/');
    std::string address = cidr.substr(0, slash);
    int prefix = 32;
    if (slash != std::string::npos) {
        std::string bits = cidr.substr(slash + 1);
        if (bits.empty() || bits.size() > 2 ||
            !std::all_of(bits.begin(), bits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            LOG_WARN("InputValidator: invalid prefix in network range '{}'", cidr);
            return false;
        }
        prefix = std::stoi(bits);
        if (prefix > 32) {
            LOG_WARN("InputValidator: prefix out of range in network range '{}'", cidr);
            return false;
        }
    }

    uint32_t network = 0;
    if (!ParseIPv4(address, network)) {
        LOG_WARN("InputValidator: network range '{}' is not an IPv4 CIDR block", cidr);
        return false;
    }

    range_mask_ = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    range_network_ = network & range_mask_;
    range_prefix_ = prefix;
    range_cidr_ = cidr;
    return true;
}

ValidationOutcome InputValidator::Validate(const RawAdvertisement& raw, uint64_t now_ms) const {
    ValidationOutcome outcome;

    auto ip = NormalizeAddress(raw.host);
    if (!ip) {
        outcome.reason = RejectionReason::INVALID_ADDRESS;
        outcome.detail = "host is not an IPv4 or IPv6 address";
        return outcome;
    }
    if (!IsInNetworkRange(*ip)) {
        outcome.reason = RejectionReason::OUT_OF_RANGE;
        outcome.detail = fmt::format("{} outside {}", *ip, range_cidr_);
        return outcome;
    }
    // Goodbye packets only need an identity; their port is not meaningful.
    if (!raw.removed && !IsValidPort(raw.port)) {
        outcome.reason = RejectionReason::INVALID_PORT;
        outcome.detail = fmt::format("port {} outside [1, 65535]", raw.port);
        return outcome;
    }

    DiscoveredDevice& device = outcome.device;
    SanitizedName name = SanitizeName(raw.instance_name);
    device.name = std::move(name.value);
    device.name_malformed = name.malformed;
    device.ip = *ip;
    device.mac = ExtractMac(raw.metadata);

    auto service_type = NormalizeServiceType(raw.service_type);
    if (service_type) {
        device.category = ClassifyServiceType(*service_type);
        device.service_types.push_back(*service_type);
    } else {
        device.category = ServiceCategory::UNKNOWN;
        if (!raw.service_type.empty()) {
            outcome.dropped_fields.emplace_back("service type malformed");
        }
    }

    device.metadata = SanitizeMetadata(raw.metadata, outcome.dropped_fields);

    if (IsValidPort(raw.port)) {
        device.ports.push_back(static_cast<uint16_t>(raw.port));
    }

    uint64_t timestamp = raw.received_at_ms != 0 ? raw.received_at_ms : now_ms;
    device.first_seen = timestamp;
    device.last_seen = timestamp;
    device.online = !raw.removed;
    device.key = MakeDeviceKey(device.name, device.ip, device.mac);

    outcome.accepted = true;
    return outcome;
}

SanitizedName InputValidator::SanitizeName(const std::string& name) const {
    SanitizedName result;
    std::string value = TruncateUtf8(name, limits_.max_name_length * kNameScanFactor);

    bool removed = false;
    std::string stripped = StripControl(value);
    removed |= stripped.size() != value.size();

    value = stripped;

    // Removing one sequence can join its neighbours into another, so repeat
    // until a pass removes nothing. Every productive pass shrinks the value.
    bool changed = true;
    while (changed) {
        size_t before = value.size();
        value = StripTags(value);

        EraseSchemes(value);
        for (const char* seq : kCommentSequences) {
            EraseAll(value, seq);
        }

        value.erase(std::remove_if(value.begin(), value.end(), [](char c) {
            return c == '\'' || c == '"' || c == ';' || c == '`';
        }), value.end());

        changed = value.size() != before;
        removed |= changed;
    }

    value = TruncateUtf8(Trim(value), limits_.max_name_length);

    result.malformed = removed || !HasNameCharacter(value);
    result.value = std::move(value);
    return result;
}

std::optional<std::string> InputValidator::NormalizeAddress(const std::string& host) const {
    if (host.empty() || host.size() > INET6_ADDRSTRLEN + 16) {
        return std::nullopt;
    }

    char buffer[INET6_ADDRSTRLEN] = {0};

    in_addr v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        if (inet_ntop(AF_INET, &v4, buffer, sizeof(buffer)) == nullptr) {
            return std::nullopt;
        }
        return std::string(buffer);
    }

    // Link-local IPv6 hosts arrive with a zone suffix ("fe80::1%en0").
    std::string address = host.substr(0, host.find('%'));
    in6_addr v6{};
    if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
        if (inet_ntop(AF_INET6, &v6, buffer, sizeof(buffer)) == nullptr) {
            return std::nullopt;
        }
        return std::string(buffer);
    }

    return std::nullopt;
}

bool InputValidator::IsInNetworkRange(const std::string& normalized_ip) const {
    if (range_prefix_ < 0) {
        return true;
    }
    uint32_t address = 0;
    if (!ParseIPv4(normalized_ip, address)) {
        return true;
    }
    return (address & range_mask_) == range_network_;
}

std::map<std::string, std::string> InputValidator::SanitizeMetadata(
    const std::map<std::string, std::string>& metadata,
    std::vector<std::string>& dropped) const {

    std::map<std::string, std::string> sanitized;
    for (const auto& [key, value] : metadata) {
        if (!IsValidMetadataKey(key, limits_.max_metadata_key_length)) {
            dropped.emplace_back("metadata key rejected");
            continue;
        }

        std::string clean = StripControl(TruncateUtf8(value, limits_.max_metadata_value_length));
        if (ContainsUnsafeContent(clean)) {
            dropped.push_back(fmt::format("metadata value rejected: {}", key));
            continue;
        }

        if (sanitized.size() >= limits_.max_metadata_pairs) {
            dropped.push_back(fmt::format("metadata overflow: {}", key));
            continue;
        }

        sanitized.emplace(key, std::move(clean));
    }
    return sanitized;
}

std::optional<std::string> InputValidator::ExtractMac(
    const std::map<std::string, std::string>& metadata) const {

    for (const auto& wanted : limits_.mac_metadata_keys) {
        std::string wanted_lower = ToLower(wanted);
        for (const auto& [key, value] : metadata) {
            if (ToLower(key) != wanted_lower) {
                continue;
            }
            auto mac = NormalizeMac(value);
            if (mac) {
                return mac;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> InputValidator::NormalizeMac(const std::string& mac) {
    if (mac.size() != 17) {
        return std::nullopt;
    }

    char separator = mac[2];
    if (separator != ':' && separator != '-') {
        return std::nullopt;
    }

    std::string normalized;
    normalized.reserve(17);
    for (size_t i = 0; i < mac.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(mac[i]);
        if (i % 3 == 2) {
            if (c != static_cast<unsigned char>(separator)) {
                return std::nullopt;
            }
            normalized.push_back(':');
        } else {
            if (!std::isxdigit(c)) {
                return std::nullopt;
            }
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return normalized;
}

bool InputValidator::IsValidPort(int port) {
    return port >= 1 && port <= 65535;
}

bool InputValidator::IsValidMetadataKey(const std::string& key, size_t max_length) {
    if (key.empty() || key.size() > max_length) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

std::optional<std::string> InputValidator::NormalizeServiceType(const std::string& service_type) {
    std::string value = ToLower(service_type);
    if (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    const std::string local_suffix = ".local";
    if (value.size() > local_suffix.size() &&
        value.compare(value.size() - local_suffix.size(), local_suffix.size(), local_suffix) == 0) {
        value.erase(value.size() - local_suffix.size());
    }

    size_t dot = value.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    std::string service = value.substr(0, dot);
    std::string protocol = value.substr(dot + 1);

    if (protocol != "_tcp" && protocol != "_udp") {
        return std::nullopt;
    }
    if (service.size() < 2 || service.size() > kMaxServiceNameLength + 1 || service[0] != '_') {
        return std::nullopt;
    }
    if (service[1] == '-' || service.back() == '-') {
        return std::nullopt;
    }
    bool valid_chars = std::all_of(service.begin() + 1, service.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '-';
    });
    if (!valid_chars) {
        return std::nullopt;
    }
    return value;
}

ServiceCategory InputValidator::ClassifyServiceType(const std::string& service_type) const {
    auto normalized = NormalizeServiceType(service_type);
    if (!normalized) {
        return ServiceCategory::UNKNOWN;
    }
    auto it = service_categories_.find(*normalized);
    if (it != service_categories_.end()) {
        return it->second;
    }
    return ServiceCategory::GENERIC_NETWORK;
}

bool InputValidator::ContainsUnsafeContent(const std::string& value) {
    std::string lowered = ToLower(value);

    size_t open = lowered.find('<');
    if (open != std::string::npos && lowered.find('>', open + 1) != std::string::npos) {
        return true;
    }

    for (const char* scheme : kScriptSchemes) {
        if (FindScheme(lowered, scheme) != std::string::npos) {
            return true;
        }
    }

    return LooksLikeQueryInjection(lowered);
}

std::string InputValidator::MakeDeviceKey(const std::string& sanitized_name,
                                          const std::string& ip,
                                          const std::optional<std::string>& mac) {
    if (mac) {
        return "mac:" + *mac;
    }
    return "host:" + ip + "/" + ToLower(sanitized_name);
}

} // namespace homescout
