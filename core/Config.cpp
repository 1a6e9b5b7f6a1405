#include "core/Config.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>

namespace homescout {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template<typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void ReadStringList(const YAML::Node& node, const char* key, std::vector<std::string>& out) {
    if (!node[key]) return;
    out.clear();
    for (const auto& item : node[key]) {
        out.push_back(item.as<std::string>());
    }
}

void ReadPortList(const YAML::Node& node, const char* key, std::vector<uint16_t>& out) {
    if (!node[key]) return;
    out.clear();
    for (const auto& item : node[key]) {
        int port = item.as<int>();
        if (port < 1 || port > 65535) {
            LOG_WARN("Config: ignoring out-of-range port {} in '{}'", port, key);
            continue;
        }
        out.push_back(static_cast<uint16_t>(port));
    }
}

void ApplyValidator(const YAML::Node& node, ValidatorLimits& limits) {
    ReadScalar(node, "max_name_length", limits.max_name_length);
    ReadScalar(node, "max_metadata_pairs", limits.max_metadata_pairs);
    ReadScalar(node, "max_metadata_key_length", limits.max_metadata_key_length);
    ReadScalar(node, "max_metadata_value_length", limits.max_metadata_value_length);
    ReadScalar(node, "max_ports", limits.max_ports);
    ReadScalar(node, "max_service_types", limits.max_service_types);
    ReadScalar(node, "max_anomalies", limits.max_anomalies);
    ReadStringList(node, "mac_metadata_keys", limits.mac_metadata_keys);
    ReadStringList(node, "media_service_types", limits.media_service_types);
}

void ApplyScoring(const YAML::Node& node, ScoringPolicy& policy) {
    ReadStringList(node, "smart_home_service_types", policy.smart_home_service_types);
    ReadStringList(node, "unpaired_flag_keys", policy.unpaired_flag_keys);
    ReadStringList(node, "vendor_metadata_keys", policy.vendor_metadata_keys);
    ReadStringList(node, "known_vendor_patterns", policy.known_vendor_patterns);
    ReadStringList(node, "smart_home_oui_prefixes", policy.smart_home_oui_prefixes);
    ReadPortList(node, "accessory_ports", policy.accessory_ports);
    ReadPortList(node, "expected_ports", policy.expected_ports);

    if (node["weights"]) {
        auto weights = node["weights"];
        ReadScalar(weights, "service_type", policy.service_type_weight);
        ReadScalar(weights, "unpaired", policy.unpaired_weight);
        ReadScalar(weights, "vendor", policy.vendor_weight);
        ReadScalar(weights, "accessory_port", policy.accessory_port_weight);
        ReadScalar(weights, "anomaly", policy.anomaly_weight);
        ReadScalar(weights, "anomaly_cap", policy.anomaly_cap);
        ReadScalar(weights, "malformed_name_penalty", policy.malformed_name_penalty);
    }

    if (node["thresholds"]) {
        ReadScalar(node["thresholds"], "high", policy.high_threshold);
        ReadScalar(node["thresholds"], "low", policy.low_threshold);
    }
}

void ApplyScan(const YAML::Node& node, ScanConfig& scan) {
    ReadScalar(node, "network_range", scan.network_range);

    if (node["mode"]) {
        std::string mode = node["mode"].as<std::string>();
        if (!ParseScanMode(mode, scan.mode)) {
            LOG_WARN("Config: unknown scan mode '{}', keeping {}", mode, ScanModeToString(scan.mode));
        }
    }
    ReadScalar(node, "custom_duration_ms", scan.custom_duration_ms);

    if (node["pause_policy"]) {
        std::string policy = node["pause_policy"].as<std::string>();
        if (!ParsePausePolicy(policy, scan.pause_policy)) {
            LOG_WARN("Config: unknown pause policy '{}', keeping {}",
                     policy, PausePolicyToString(scan.pause_policy));
        }
    }
    ReadScalar(node, "pause_buffer_size", scan.pause_buffer_size);
    ReadScalar(node, "stall_warning_ms", scan.stall_warning_ms);
    ReadScalar(node, "stall_timeout_ms", scan.stall_timeout_ms);
    ReadScalar(node, "history_threads", scan.history_threads);
    ReadScalar(node, "history_queue_limit", scan.history_queue_limit);
}

void ApplyDocument(const YAML::Node& root, AppConfig& config) {
    if (root["logging"]) {
        ReadScalar(root["logging"], "file", config.log_file);
        ReadScalar(root["logging"], "level", config.log_level);
    }

    if (root["history"]) {
        auto history = root["history"];
        ReadScalar(history, "enabled", config.history_enabled);
        ReadScalar(history, "database_path", config.history_db_path);
        ReadScalar(history, "retention_days", config.history_retention_days);
    }

    if (root["scan"]) {
        ApplyScan(root["scan"], config.scan);
    }

    if (root["validator"]) {
        ApplyValidator(root["validator"], config.scan.validator);
    }

    if (root["rate_limit"]) {
        auto rate = root["rate_limit"];
        ReadScalar(rate, "window_ms", config.scan.rate_limit.window_ms);
        ReadScalar(rate, "threshold", config.scan.rate_limit.threshold);
        ReadScalar(rate, "max_tracked_keys", config.scan.rate_limit.max_tracked_keys);
    }

    if (root["registry"]) {
        ReadScalar(root["registry"], "max_devices", config.scan.registry.max_devices);
    }

    if (root["scoring"]) {
        ApplyScoring(root["scoring"], config.scan.scoring);
    }
}

} // namespace

uint64_t ScanConfig::GetDurationMs() const {
    switch (mode) {
        case ScanMode::QUICK:    return 5000;
        case ScanMode::STANDARD: return 15000;
        case ScanMode::FULL:     return 30000;
        case ScanMode::CUSTOM:   return custom_duration_ms;
    }
    return custom_duration_ms;
}

std::string ScanModeToString(ScanMode mode) {
    switch (mode) {
        case ScanMode::QUICK:    return "quick";
        case ScanMode::STANDARD: return "standard";
        case ScanMode::FULL:     return "full";
        case ScanMode::CUSTOM:   return "custom";
        default:                 return "unknown";
    }
}

bool ParseScanMode(const std::string& name, ScanMode& out) {
    std::string lower = ToLower(name);
    if (lower == "quick")         out = ScanMode::QUICK;
    else if (lower == "standard") out = ScanMode::STANDARD;
    else if (lower == "full" || lower == "deep") out = ScanMode::FULL;
    else if (lower == "custom")   out = ScanMode::CUSTOM;
    else return false;
    return true;
}

std::string PausePolicyToString(PausePolicy policy) {
    return policy == PausePolicy::BUFFER ? "buffer" : "drop";
}

bool ParsePausePolicy(const std::string& name, PausePolicy& out) {
    std::string lower = ToLower(name);
    if (lower == "drop")        out = PausePolicy::DROP;
    else if (lower == "buffer") out = PausePolicy::BUFFER;
    else return false;
    return true;
}

bool LoadConfigFile(const std::string& path, AppConfig& config) {
    try {
        YAML::Node root = YAML::LoadFile(path);
        ApplyDocument(root, config);
        LOG_INFO("Configuration loaded from {}", path);
        return true;
    } catch (const YAML::BadFile& ex) {
        LOG_WARN("Config file {} not readable, using defaults: {}", path, ex.what());
        return false;
    } catch (const YAML::Exception& ex) {
        LOG_ERROR("Failed to parse config file {}: {}", path, ex.what());
        return false;
    }
}

bool LoadConfigString(const std::string& yaml_text, AppConfig& config) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        ApplyDocument(root, config);
        return true;
    } catch (const YAML::Exception& ex) {
        LOG_ERROR("Failed to parse configuration: {}", ex.what());
        return false;
    }
}

} // namespace homescout
