#pragma once

#include "engine/DeviceRegistry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace homescout {

struct ExportSummary {
    std::string session_id;
    std::string scan_mode;
    uint64_t started_at = 0;
    uint64_t generated_at = 0;
    std::map<std::string, uint64_t> counters;
};

// Renders a registry snapshot. Only the data the engine produces is written;
// presentation is left to the consumer of the files.
class ScanExporter {
public:
    static nlohmann::json BuildJson(const std::vector<DeviceRecord>& records, const ExportSummary& summary);
    static std::string BuildCsv(const std::vector<DeviceRecord>& records);

    static bool ExportJson(const std::vector<DeviceRecord>& records, const ExportSummary& summary,
                           const std::string& output_path);
    static bool ExportCsv(const std::vector<DeviceRecord>& records, const std::string& output_path);

    // Quotes fields containing separators and neutralizes leading formula
    // characters (= + - @) so spreadsheet tools treat them as text.
    static std::string EscapeCsvField(const std::string& field);

private:
    static bool WriteFile(const std::string& output_path, const std::string& content);
};

} // namespace homescout
