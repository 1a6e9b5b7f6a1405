#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace homescout {

struct ValidatorLimits {
    size_t max_name_length{255};
    size_t max_metadata_pairs{50};
    size_t max_metadata_key_length{64};
    size_t max_metadata_value_length{1024};
    size_t max_ports{32};
    size_t max_service_types{16};
    size_t max_anomalies{8};

    // TXT keys that may carry a MAC-formatted hardware id (HAP uses "id").
    std::vector<std::string> mac_metadata_keys{"id", "mac", "deviceid"};

    // Service types classified MEDIA_STREAMING. Home-automation types come
    // from ScoringPolicy::smart_home_service_types.
    std::vector<std::string> media_service_types{
        "_airplay._tcp", "_raop._tcp", "_googlecast._tcp", "_spotify-connect._tcp",
        "_sonos._tcp", "_daap._tcp", "_dacp._tcp"};
};

struct RateLimitConfig {
    uint64_t window_ms{60000};
    size_t threshold{100};
    size_t max_tracked_keys{4096};
};

struct RegistryConfig {
    size_t max_devices{500};
};

struct ScoringPolicy {
    // Also the HOME_AUTOMATION category table used by InputValidator.
    std::vector<std::string> smart_home_service_types{
        "_hap._tcp", "_hap._udp", "_homekit._tcp", "_matter._tcp", "_matterc._udp", "_matterd._udp",
        "_hue._tcp", "_nanoleafapi._tcp", "_shelly._tcp", "_esphomelib._tcp", "_miio._udp"};
    std::vector<std::string> unpaired_flag_keys{"sf", "setup_required", "unpaired"};
    std::vector<std::string> vendor_metadata_keys{"md", "manufacturer", "vendor", "mf"};
    std::vector<std::string> known_vendor_patterns{
        "philips", "hue", "ecobee", "eve", "nanoleaf", "aqara", "lutron",
        "meross", "wemo", "kasa", "tradfri", "lifx", "yeelight", "govee"};
    std::vector<std::string> smart_home_oui_prefixes{
        "00:17:88", "EC:B5:FA", "44:61:32", "D0:73:D5", "28:6D:97", "00:0B:57"};
    std::vector<uint16_t> accessory_ports{49152, 51826, 5540, 8080};
    std::vector<uint16_t> expected_ports{
        80, 443, 3689, 5000, 5353, 5540, 7000, 8080, 49152, 51826, 62078};

    int service_type_weight{40};
    int unpaired_weight{30};
    int vendor_weight{15};
    int accessory_port_weight{10};
    int anomaly_weight{5};
    int anomaly_cap{15};
    int malformed_name_penalty{10};

    uint32_t high_threshold{70};
    uint32_t low_threshold{40};
};

enum class ScanMode {
    QUICK,
    STANDARD,
    FULL,
    CUSTOM
};

enum class PausePolicy {
    DROP,
    BUFFER
};

struct ScanConfig {
    std::string network_range;        // CIDR, empty = no range restriction
    ScanMode mode{ScanMode::STANDARD};
    uint64_t custom_duration_ms{60000};
    PausePolicy pause_policy{PausePolicy::DROP};
    size_t pause_buffer_size{256};
    uint64_t stall_warning_ms{30000};
    uint64_t stall_timeout_ms{60000};
    size_t history_threads{1};
    size_t history_queue_limit{4096};

    ValidatorLimits validator;
    RateLimitConfig rate_limit;
    RegistryConfig registry;
    ScoringPolicy scoring;

    uint64_t GetDurationMs() const;
};

struct AppConfig {
    std::string log_file{"logs/homescout.log"};
    std::string log_level{"info"};
    bool history_enabled{true};
    std::string history_db_path{"data/homescout.db"};
    uint64_t history_retention_days{14};
    ScanConfig scan;
};

std::string ScanModeToString(ScanMode mode);
bool ParseScanMode(const std::string& name, ScanMode& out);
std::string PausePolicyToString(PausePolicy policy);
bool ParsePausePolicy(const std::string& name, PausePolicy& out);

// Both loaders leave fields that are absent from the document at their
// current values. They return false (and log) on I/O or parse errors.
bool LoadConfigFile(const std::string& path, AppConfig& config);
bool LoadConfigString(const std::string& yaml_text, AppConfig& config);

} // namespace homescout
