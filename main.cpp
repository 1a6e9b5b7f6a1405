#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "discovery/DiscoveryCoordinator.hpp"
#include "discovery/DiscoverySource.hpp"
#include "export/ScanExporter.hpp"
#include "persistence/HistoryStore.hpp"

#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace homescout {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

struct CliOptions {
    std::string config_path{"config/homescout.yaml"};
    std::string replay_path;
    std::string mode;
    std::string network_range;
    std::string export_json;
    std::string export_csv;
    std::string history_db;
    std::string log_level;
    uint32_t pacing_ms{0};
    bool no_history{false};
    bool show_help{false};
};

void PrintUsage(const char* program) {
    fmt::print(
        "Usage: {} --replay <capture.ndjson> [options]\n"
        "\n"
        "Options:\n"
        "  --config <file>        YAML configuration (default config/homescout.yaml)\n"
        "  --replay <file>        advertisement capture, one JSON object per line\n"
        "  --mode <mode>          quick | standard | full | custom\n"
        "  --range <cidr>         only accept IPv4 hosts inside this block\n"
        "  --pacing-ms <n>        delay between replayed advertisements\n"
        "  --export-json <file>   write the scan result as JSON\n"
        "  --export-csv <file>    write the scan result as CSV\n"
        "  --history <db>         history database path\n"
        "  --no-history           do not record device history\n"
        "  --log-level <level>    trace | debug | info | warn | error | critical | off\n"
        "  --help                 show this message\n",
        program);
}

bool ParseArguments(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Missing value for {}\n", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--config") {
            if (!next(options.config_path)) return false;
        } else if (arg == "--replay") {
            if (!next(options.replay_path)) return false;
        } else if (arg == "--mode") {
            if (!next(options.mode)) return false;
        } else if (arg == "--range") {
            if (!next(options.network_range)) return false;
        } else if (arg == "--export-json") {
            if (!next(options.export_json)) return false;
        } else if (arg == "--export-csv") {
            if (!next(options.export_csv)) return false;
        } else if (arg == "--history") {
            if (!next(options.history_db)) return false;
        } else if (arg == "--log-level") {
            if (!next(options.log_level)) return false;
        } else if (arg == "--pacing-ms") {
            std::string value;
            if (!next(value)) return false;
            char* end = nullptr;
            unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || parsed > 60000) {
                fmt::print(stderr, "Invalid --pacing-ms value: {}\n", value);
                return false;
            }
            options.pacing_ms = static_cast<uint32_t>(parsed);
        } else if (arg == "--no-history") {
            options.no_history = true;
        } else {
            fmt::print(stderr, "Unknown argument: {}\n", arg);
            return false;
        }
    }
    return true;
}

class HomeScout {
public:
    bool Initialize(const CliOptions& options) {
        options_ = options;

        LoadConfigFile(options.config_path, config_);

        if (!options.mode.empty() && !ParseScanMode(options.mode, config_.scan.mode)) {
            LOG_ERROR("Unknown scan mode '{}'", options.mode);
            return false;
        }
        if (!options.network_range.empty()) {
            config_.scan.network_range = options.network_range;
        }
        if (!options.history_db.empty()) {
            config_.history_db_path = options.history_db;
        }
        if (options.no_history) {
            config_.history_enabled = false;
        }

        if (config_.history_enabled) {
            history_ = std::make_unique<SqliteHistoryStore>();
            if (!history_->Initialize(config_.history_db_path)) {
                LOG_WARN("History disabled: database {} unavailable", config_.history_db_path);
                history_.reset();
            } else if (config_.history_retention_days > 0) {
                uint64_t retention_ms = config_.history_retention_days * 24ull * 60 * 60 * 1000;
                history_->Prune(retention_ms, DiscoveryCoordinator::SystemClock());
            }
        }

        source_ = std::make_unique<ReplayDiscoverySource>(options.replay_path, options.pacing_ms);
        coordinator_ = std::make_unique<DiscoveryCoordinator>(bus_, history_.get(), source_.get());

        bus_.Subscribe(EventType::THREAT_DETECTED, [](const Event& event) {
            auto name = event.metadata.find("name");
            auto score = event.metadata.find("score");
            fmt::print("[THREAT] {} ({}) score={}\n",
                       name != event.metadata.end() ? name->second : "",
                       event.device_key,
                       score != event.metadata.end() ? score->second : "?");
        });
        bus_.Subscribe(EventType::SCAN_DEGRADED, [](const Event& event) {
            auto reason = event.metadata.find("reason");
            fmt::print("[DEGRADED] {}\n", reason != event.metadata.end() ? reason->second : "");
        });
        bus_.Subscribe(EventType::REGISTRY_FAULT, [](const Event& event) {
            auto message = event.metadata.find("message");
            LOG_CRITICAL("Registry fault in scan {}: {}", event.session_id,
                         message != event.metadata.end() ? message->second : "");
        });

        return true;
    }

    bool Run() {
        if (!coordinator_->Start(config_.scan)) {
            LOG_CRITICAL("Failed to start scan");
            return false;
        }

        LOG_INFO("Scan {} running ({}). Press Ctrl+C to cancel.",
                 coordinator_->GetSessionId(), ScanModeToString(config_.scan.mode));

        while (g_running && IsActive()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            coordinator_->Tick();

            if (source_->IsFinished() && IsActive()) {
                LOG_INFO("Capture fully replayed");
                coordinator_->Complete();
            }
        }

        if (!g_running && IsActive()) {
            LOG_INFO("Received shutdown signal");
            coordinator_->Cancel();
        }
        return true;
    }

    void Stop() {
        coordinator_->FlushHistory();

        auto records = coordinator_->Snapshot();
        ExportSummary summary;
        summary.session_id = coordinator_->GetSessionId();
        summary.scan_mode = ScanModeToString(config_.scan.mode);
        summary.started_at = coordinator_->GetStartedAt();
        summary.generated_at = DiscoveryCoordinator::SystemClock();

        ScanCounters counters = coordinator_->GetCounters();
        summary.counters = {
            {"received", counters.received},
            {"accepted", counters.accepted},
            {"rejected", counters.rejected},
            {"suppressed", counters.suppressed},
            {"ignored", counters.ignored},
            {"fields_dropped", counters.fields_dropped},
            {"anomalies", counters.anomalies},
            {"added", counters.added},
            {"updated", counters.updated},
            {"evicted", counters.evicted},
        };

        if (!options_.export_json.empty()) {
            ScanExporter::ExportJson(records, summary, options_.export_json);
        }
        if (!options_.export_csv.empty()) {
            ScanExporter::ExportCsv(records, options_.export_csv);
        }

        PrintSummary(records, counters);

        coordinator_.reset();
        source_.reset();
        if (history_) {
            history_->Shutdown();
        }
    }

private:
    bool IsActive() const {
        ScanState state = coordinator_->GetState();
        return state == ScanState::SCANNING || state == ScanState::PAUSED;
    }

    void PrintSummary(const std::vector<DeviceRecord>& records, const ScanCounters& counters) const {
        ScanProgress progress = coordinator_->GetProgress();
        fmt::print("\nScan {} {} after {} ms\n", progress.session_id,
                   ScanStateToString(progress.state), progress.elapsed_ms);
        fmt::print("  advertisements: {} received, {} accepted, {} rejected, {} suppressed\n",
                   counters.received, counters.accepted, counters.rejected, counters.suppressed);
        fmt::print("  devices: {} ({} high threat)\n\n", progress.devices_found, progress.threats_found);

        for (const auto& record : records) {
            fmt::print("  {:>3}  {:<5} {:<40} {:<39} {}\n",
                       record.assessment.score,
                       ThreatLevelToString(record.assessment.threat),
                       record.device.name.empty() ? "(unnamed)" : record.device.name,
                       record.device.ip,
                       ServiceCategoryToString(record.device.category));
        }
    }

    CliOptions options_;
    AppConfig config_;
    EventBus bus_;
    std::unique_ptr<SqliteHistoryStore> history_;
    std::unique_ptr<ReplayDiscoverySource> source_;
    std::unique_ptr<DiscoveryCoordinator> coordinator_;
};

} // namespace homescout

int main(int argc, char** argv) {
    homescout::CliOptions options;
    if (!homescout::ParseArguments(argc, argv, options)) {
        homescout::PrintUsage(argv[0]);
        return 2;
    }
    if (options.show_help || options.replay_path.empty()) {
        homescout::PrintUsage(argv[0]);
        return options.show_help ? 0 : 2;
    }

    // Logging settings come from the config file, so peek at it first.
    homescout::AppConfig logging_config;
    homescout::Logger::InitializeConsoleOnly(homescout::LogLevel::WARN);
    homescout::LoadConfigFile(options.config_path, logging_config);

    homescout::Logger::Initialize(logging_config.log_file);
    homescout::LogLevel level = homescout::LogLevel::INFO;
    std::string level_name = options.log_level.empty() ? logging_config.log_level : options.log_level;
    if (!homescout::Logger::ParseLevel(level_name, level)) {
        LOG_WARN("Unknown log level '{}', using info", level_name);
    }
    homescout::Logger::SetLevel(level);

    LOG_INFO("==========================================================");
    LOG_INFO("  HomeScout - smart-home discovery and trust scoring");
    LOG_INFO("==========================================================");

    std::signal(SIGINT, homescout::SignalHandler);
    std::signal(SIGTERM, homescout::SignalHandler);

    try {
        homescout::HomeScout app;

        if (!app.Initialize(options)) {
            LOG_CRITICAL("Failed to initialize HomeScout");
            homescout::Logger::Shutdown();
            return 1;
        }

        bool ok = app.Run();
        app.Stop();

        LOG_INFO("HomeScout shutdown complete");
        homescout::Logger::Shutdown();
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        homescout::Logger::Shutdown();
        return 1;
    }
}
