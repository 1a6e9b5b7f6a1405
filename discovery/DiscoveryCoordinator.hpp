#pragma once

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "discovery/DiscoverySource.hpp"
#include "engine/AnomalyDetector.hpp"
#include "engine/ConfidenceScorer.hpp"
#include "engine/DeviceRegistry.hpp"
#include "engine/InputValidator.hpp"
#include "engine/RateLimiter.hpp"
#include "persistence/HistoryStore.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace homescout {

class ThreadPool;

enum class ScanState {
    IDLE,
    SCANNING,
    PAUSED,
    COMPLETED,
    CANCELLED
};

struct ScanCounters {
    uint64_t received = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t suppressed = 0;
    uint64_t ignored = 0;        // arrived while not scanning
    uint64_t buffered = 0;       // held while paused
    uint64_t fields_dropped = 0;
    uint64_t anomalies = 0;
    uint64_t added = 0;
    uint64_t updated = 0;
    uint64_t evicted = 0;
};

struct ScanProgress {
    ScanState state = ScanState::IDLE;
    std::string session_id;
    size_t devices_found = 0;
    size_t threats_found = 0;    // devices classified HIGH
    uint64_t elapsed_ms = 0;
    std::string current_host;
    double progress_fraction = 0.0;
};

using Clock = std::function<uint64_t()>;

// Drives one scan session at a time: subscribes to the discovery source,
// runs each advertisement through validation, rate limiting, anomaly
// detection and scoring, and admits the result into the session registry.
//
// Event processing holds state_mutex_ shared; transitions hold it exclusive.
// Observers are called synchronously on the processing thread and must not
// call the control surface from inside a callback.
class DiscoveryCoordinator {
public:
    DiscoveryCoordinator(EventBus& bus,
                         HistorySink* history = nullptr,
                         DiscoverySource* source = nullptr,
                         Clock clock = SystemClock);
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    // Control surface. Each returns false (and logs) when the call is not
    // valid in the current state.
    bool Start(const ScanConfig& config);
    bool Pause();
    bool Resume();
    bool Cancel();
    bool Complete();

    // Source-facing entry points.
    void OnAdvertisement(const RawAdvertisement& raw);
    void OnSourceFailure(const std::string& reason);

    // Applies the scan duration and the stall watchdog; publishes progress.
    void Tick();

    ScanState GetState() const { return state_.load(); }
    ScanProgress GetProgress() const;
    ScanCounters GetCounters() const;
    std::vector<DeviceRecord> Snapshot() const;
    std::optional<DeviceRecord> GetDevice(const std::string& key) const;
    std::string GetSessionId() const;
    uint64_t GetStartedAt() const;

    // Waits for queued history writes to finish.
    void FlushHistory();

    static uint64_t SystemClock();
    static std::optional<std::string> GenerateSessionId();

private:
    struct Session {
        Session(std::string session_id, const ScanConfig& scan_config,
                EventBus& bus, uint64_t now);

        std::string id;
        ScanConfig config;
        uint64_t started_at;

        InputValidator validator;
        RateLimiter limiter;
        AnomalyDetector detector;
        ConfidenceScorer scorer;
        DeviceRegistry registry;

        std::atomic<uint64_t> last_event_at;
        std::atomic<bool> stall_warned{false};

        // Elapsed-time accounting excludes paused intervals and stops at
        // the terminal transition.
        std::atomic<uint64_t> paused_total_ms{0};
        std::atomic<uint64_t> paused_since{0};
        std::atomic<uint64_t> finished_at{0};

        std::mutex buffer_mutex;
        std::deque<RawAdvertisement> pause_buffer;

        mutable std::mutex host_mutex;
        std::string current_host;
    };

    struct AtomicCounters {
        std::atomic<uint64_t> received{0};
        std::atomic<uint64_t> accepted{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> suppressed{0};
        std::atomic<uint64_t> ignored{0};
        std::atomic<uint64_t> buffered{0};
        std::atomic<uint64_t> fields_dropped{0};
        std::atomic<uint64_t> anomalies{0};
        std::atomic<uint64_t> added{0};
        std::atomic<uint64_t> updated{0};
        std::atomic<uint64_t> evicted{0};

        void Reset();
    };

    static constexpr size_t KEY_LOCK_STRIPES = 64;

    void Dispatch(const RawAdvertisement& raw);
    void ProcessAdvertisement(Session& session, const RawAdvertisement& raw);
    void ProcessGoodbye(Session& session, const DiscoveredDevice& incoming);
    DiscoveredDevice MergeDevice(const DiscoveredDevice& prior, const DiscoveredDevice& incoming,
                                 const ValidatorLimits& limits) const;

    bool Finish(ScanState terminal, const std::string& reason, const std::string& degraded_reason);
    void SetState(ScanState next, const std::string& reason);
    void PublishProgress(const Session& session, bool final_update);
    void PublishDelta(const Session& session, EventType type, const DeviceRecord& record);
    void PublishThreat(const Session& session, const DeviceRecord& record);
    void RecordHistory(const DeviceRecord& record, uint64_t timestamp);
    void SubscribeSource(const std::string& session_id);
    void UnsubscribeSource(const std::string& session_id);
    bool IsSessionActive(const std::string& session_id) const;

    std::shared_ptr<Session> CurrentSession() const;
    ScanProgress BuildProgress(const Session& session, ScanState state, uint64_t now) const;
    uint64_t ElapsedMs(const Session& session, ScanState state, uint64_t now) const;
    std::mutex& KeyLock(const std::string& key);
    bool IsReentrant(const char* operation) const;

    EventBus& bus_;
    HistorySink* history_;
    DiscoverySource* source_;
    Clock clock_;

    mutable std::shared_mutex state_mutex_;
    std::atomic<ScanState> state_{ScanState::IDLE};

    mutable std::mutex session_mutex_;
    std::shared_ptr<Session> session_;

    std::mutex source_mutex_;
    std::string subscribed_session_;

    std::array<std::mutex, KEY_LOCK_STRIPES> key_locks_;
    AtomicCounters counters_;

    std::unique_ptr<ThreadPool> history_pool_;
};

std::string ScanStateToString(ScanState state);

} // namespace homescout
