#include "export/ScanExporter.hpp"
#include "persistence/DeviceSerializer.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

namespace homescout {

namespace {

const char* const kCsvHeader =
    "IP Address,MAC Address,Hostname,Manufacturer,Device Type,Open Ports,Online,"
    "First Seen,Last Seen,Confidence,Threat,Reasons\n";

const char* const kManufacturerKeys[] = {"manufacturer", "vendor", "mf", "md"};

std::string Manufacturer(const DiscoveredDevice& device) {
    for (const char* key : kManufacturerKeys) {
        auto it = device.metadata.find(key);
        if (it != device.metadata.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return "N/A";
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // namespace

nlohmann::json ScanExporter::BuildJson(const std::vector<DeviceRecord>& records,
                                       const ExportSummary& summary) {
    nlohmann::json j;
    j["export_type"] = "scan";
    j["session_id"] = summary.session_id;
    j["scan_mode"] = summary.scan_mode;
    j["started_at"] = TimestampToISO8601(summary.started_at);
    j["generated_at"] = TimestampToISO8601(summary.generated_at);
    j["device_count"] = records.size();
    j["counters"] = summary.counters;

    size_t threats = 0;
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json dj = DeviceToJson(record.device);
        dj["first_seen_iso"] = TimestampToISO8601(record.device.first_seen);
        dj["last_seen_iso"] = TimestampToISO8601(record.device.last_seen);
        dj["assessment"] = AssessmentToJson(record.assessment);
        devices.push_back(dj);

        if (record.assessment.threat == ThreatLevel::HIGH) {
            ++threats;
        }
    }
    j["threat_count"] = threats;
    j["devices"] = devices;
    return j;
}

std::string ScanExporter::BuildCsv(const std::vector<DeviceRecord>& records) {
    std::string csv = kCsvHeader;

    for (const auto& record : records) {
        const DiscoveredDevice& device = record.device;

        std::vector<std::string> ports;
        ports.reserve(device.ports.size());
        for (uint16_t port : device.ports) {
            ports.push_back(std::to_string(port));
        }

        std::vector<std::string> row = {
            device.ip,
            device.mac ? *device.mac : "N/A",
            device.name.empty() ? "N/A" : device.name,
            Manufacturer(device),
            ServiceCategoryToString(device.category),
            Join(ports, ";"),
            device.online ? "Yes" : "No",
            TimestampToISO8601(device.first_seen),
            TimestampToISO8601(device.last_seen),
            std::to_string(record.assessment.score),
            ThreatLevelToString(record.assessment.threat),
            Join(record.assessment.reasons, "; "),
        };

        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) csv += ',';
            csv += EscapeCsvField(row[i]);
        }
        csv += '\n';
    }
    return csv;
}

bool ScanExporter::ExportJson(const std::vector<DeviceRecord>& records, const ExportSummary& summary,
                              const std::string& output_path) {
    std::string content;
    try {
        content = BuildJson(records, summary).dump(2);
    } catch (const nlohmann::json::exception& ex) {
        LOG_ERROR("ScanExporter: Failed to serialize scan: {}", ex.what());
        return false;
    }

    if (!WriteFile(output_path, content)) {
        return false;
    }
    LOG_INFO("ScanExporter: JSON exported ({} devices) to {}", records.size(), output_path);
    return true;
}

bool ScanExporter::ExportCsv(const std::vector<DeviceRecord>& records, const std::string& output_path) {
    if (!WriteFile(output_path, BuildCsv(records))) {
        return false;
    }
    LOG_INFO("ScanExporter: CSV exported ({} devices) to {}", records.size(), output_path);
    return true;
}

std::string ScanExporter::EscapeCsvField(const std::string& field) {
    std::string value = field;
    if (!value.empty() && (value[0] == '=' || value[0] == '+' || value[0] == '-' || value[0] == '@')) {
        value.insert(value.begin(), '\'');
    }

    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool ScanExporter::WriteFile(const std::string& output_path, const std::string& content) {
    try {
        std::filesystem::path p(output_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("ScanExporter: Failed to create directory: {}", ex.what());
        return false;
    }

    std::ofstream out(output_path);
    if (!out.is_open()) {
        LOG_ERROR("ScanExporter: Failed to open output file: {}", output_path);
        return false;
    }

    out << content;
    out.close();
    if (out.fail()) {
        LOG_ERROR("ScanExporter: Failed to write {}", output_path);
        return false;
    }
    return true;
}

} // namespace homescout
