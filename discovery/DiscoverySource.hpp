#pragma once

#include "engine/DeviceTypes.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace homescout {

using RecordCallback = std::function<void(const RawAdvertisement&)>;
using FailureCallback = std::function<void(const std::string& reason)>;

// Push-style producer of raw advertisements. Callbacks may run on any thread.
class DiscoverySource {
public:
    virtual ~DiscoverySource() = default;

    virtual bool Subscribe(RecordCallback on_record, FailureCallback on_failure) = 0;

    // Stops delivery. Safe to call from inside a delivered callback.
    virtual void Unsubscribe() = 0;
};

// Replays a capture of advertisements stored as one JSON object per line:
//   {"instance_name": "...", "host": "192.168.1.20", "port": 51826,
//    "service_type": "_hap._tcp", "metadata": {"sf": "1"},
//    "received_at_ms": 0, "removed": false}
class ReplayDiscoverySource : public DiscoverySource {
public:
    explicit ReplayDiscoverySource(std::string capture_path, uint32_t pacing_ms = 0);
    ~ReplayDiscoverySource() override;

    ReplayDiscoverySource(const ReplayDiscoverySource&) = delete;
    ReplayDiscoverySource& operator=(const ReplayDiscoverySource&) = delete;

    bool Subscribe(RecordCallback on_record, FailureCallback on_failure) override;
    void Unsubscribe() override;

    // Blocks until the capture has been fully delivered or delivery stopped.
    void WaitUntilFinished();
    bool IsFinished() const { return finished_.load(); }

    uint64_t GetDeliveredCount() const { return delivered_.load(); }
    uint64_t GetSkippedLineCount() const { return skipped_.load(); }

    static std::optional<RawAdvertisement> ParseLine(const std::string& line);
    static std::optional<RawAdvertisement> FromJson(const nlohmann::json& j);

private:
    void Run();
    void MarkFinished();

    std::string capture_path_;
    uint32_t pacing_ms_;

    RecordCallback on_record_;
    FailureCallback on_failure_;

    // Guards worker_. Never held while joining.
    std::mutex thread_mutex_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> skipped_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace homescout
