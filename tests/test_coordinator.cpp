#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include "discovery/DiscoveryCoordinator.hpp"
#include <fmt/format.h>
#include <atomic>
#include <mutex>
#include <vector>

using namespace homescout;

namespace {

class FakeSource : public DiscoverySource {
public:
    bool Subscribe(RecordCallback on_record, FailureCallback on_failure) override {
        on_record_ = std::move(on_record);
        on_failure_ = std::move(on_failure);
        subscribed = true;
        ++subscribe_calls;
        return true;
    }

    void Unsubscribe() override {
        subscribed = false;
        ++unsubscribe_calls;
    }

    void Emit(const RawAdvertisement& raw) {
        if (subscribed && on_record_) {
            on_record_(raw);
        }
    }

    void Fail(const std::string& reason) {
        if (subscribed && on_failure_) {
            on_failure_(reason);
        }
    }

    bool subscribed = false;
    int subscribe_calls = 0;
    int unsubscribe_calls = 0;

private:
    RecordCallback on_record_;
    FailureCallback on_failure_;
};

class FakeHistory : public HistorySink {
public:
    bool Put(const HistoryRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records.push_back(record);
        return true;
    }

    std::vector<HistoryRecord> Get(const std::string& device_key, size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<HistoryRecord> out;
        for (auto it = records.rbegin(); it != records.rend() && out.size() < limit; ++it) {
            if (it->device.key == device_key) out.push_back(*it);
        }
        return out;
    }

    size_t Prune(uint64_t, uint64_t) override { return 0; }

    size_t Count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records.size();
    }

    std::vector<HistoryRecord> records;

private:
    std::mutex mutex_;
};

} // namespace

class DiscoveryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::InitializeConsoleOnly(LogLevel::OFF);

        bus.SubscribeAll([this](const Event& e) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(e);
        });

        coordinator = std::make_unique<DiscoveryCoordinator>(
            bus, &history, &source, [this]() { return now.load(); });
    }

    void TearDown() override {
        coordinator.reset();
        bus.Clear();
    }

    static RawAdvertisement MakeRaw(int index, const std::string& service_type = "_ipp._tcp", int port = 631) {
        RawAdvertisement raw;
        raw.instance_name = fmt::format("device-{}", index);
        raw.host = HostFor(index);
        raw.port = port;
        raw.service_type = service_type;
        return raw;
    }

    static std::string HostFor(int index) {
        return fmt::format("10.0.{}.{}", index / 200, index % 200 + 1);
    }

    static std::string KeyFor(int index) {
        return fmt::format("host:{}/device-{}", HostFor(index), index);
    }

    static RawAdvertisement MakeAccessory(const std::string& host) {
        RawAdvertisement raw;
        raw.instance_name = "Eve Energy";
        raw.host = host;
        raw.port = 51826;
        raw.service_type = "_hap._tcp";
        raw.metadata = {{"id", "D0:73:D5:11:22:33"}, {"md", "Eve Energy"}, {"sf", "1"}};
        return raw;
    }

    size_t CountEvents(EventType type) {
        std::lock_guard<std::mutex> lock(events_mutex);
        size_t count = 0;
        for (const auto& e : events) {
            if (e.type == type) ++count;
        }
        return count;
    }

    std::vector<Event> EventsOf(EventType type) {
        std::lock_guard<std::mutex> lock(events_mutex);
        std::vector<Event> out;
        for (const auto& e : events) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    EventBus bus;
    FakeSource source;
    FakeHistory history;
    std::atomic<uint64_t> now{1000};
    std::unique_ptr<DiscoveryCoordinator> coordinator;

    std::mutex events_mutex;
    std::vector<Event> events;
};

TEST_F(DiscoveryCoordinatorTest, StartSubscribesAndPublishesState) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    EXPECT_EQ(coordinator->GetState(), ScanState::SCANNING);
    EXPECT_TRUE(source.subscribed);
    EXPECT_EQ(coordinator->GetSessionId().size(), 36u);
    EXPECT_EQ(coordinator->GetStartedAt(), 1000u);

    auto changes = EventsOf(EventType::SCAN_STATE_CHANGE);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].metadata["from_state"], "IDLE");
    EXPECT_EQ(changes[0].metadata["to_state"], "SCANNING");
}

TEST_F(DiscoveryCoordinatorTest, StartTwiceIsRejected) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));
    EXPECT_FALSE(coordinator->Start(config));
    EXPECT_EQ(source.subscribe_calls, 1);
}

TEST_F(DiscoveryCoordinatorTest, InvalidRangeRejectsStart) {
    ScanConfig config;
    config.network_range = "192.168.1.0/99";

    EXPECT_FALSE(coordinator->Start(config));
    EXPECT_EQ(coordinator->GetState(), ScanState::IDLE);
    EXPECT_FALSE(source.subscribed);
}

TEST_F(DiscoveryCoordinatorTest, AdmitsValidAndCountsRejected) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(1));
    RawAdvertisement bad = MakeRaw(2);
    bad.host = "999.1.1.1";
    source.Emit(bad);

    auto counters = coordinator->GetCounters();
    EXPECT_EQ(counters.received, 2u);
    EXPECT_EQ(counters.accepted, 1u);
    EXPECT_EQ(counters.rejected, 1u);
    EXPECT_EQ(counters.added, 1u);

    auto device = coordinator->GetDevice(KeyFor(1));
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->device.category, ServiceCategory::GENERIC_NETWORK);
    EXPECT_EQ(CountEvents(EventType::DEVICE_ADDED), 1u);
}

TEST_F(DiscoveryCoordinatorTest, EvictsOldestAtCapacity) {
    ScanConfig config;
    config.registry.max_devices = 500;
    ASSERT_TRUE(coordinator->Start(config));

    for (int i = 1; i <= 501; ++i) {
        now += 1;
        source.Emit(MakeRaw(i));
    }

    EXPECT_EQ(coordinator->Snapshot().size(), 500u);
    EXPECT_FALSE(coordinator->GetDevice(KeyFor(1)).has_value());
    EXPECT_TRUE(coordinator->GetDevice(KeyFor(2)).has_value());
    EXPECT_TRUE(coordinator->GetDevice(KeyFor(501)).has_value());

    EXPECT_EQ(coordinator->GetCounters().evicted, 1u);
    auto evicted = EventsOf(EventType::DEVICE_EVICTED);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].device_key, KeyFor(1));
}

TEST_F(DiscoveryCoordinatorTest, RateLimitSuppressesFloodingHost) {
    ScanConfig config;
    config.rate_limit.threshold = 2;
    ASSERT_TRUE(coordinator->Start(config));

    for (int i = 0; i < 5; ++i) {
        source.Emit(MakeRaw(1));
    }

    auto counters = coordinator->GetCounters();
    EXPECT_EQ(counters.accepted, 2u);
    EXPECT_EQ(counters.suppressed, 3u);
}

TEST_F(DiscoveryCoordinatorTest, PauseDropsAndResumeAdmitsRedelivery) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(1));
    ASSERT_TRUE(coordinator->Pause());
    EXPECT_EQ(coordinator->GetState(), ScanState::PAUSED);
    EXPECT_TRUE(source.subscribed);

    source.Emit(MakeRaw(2));
    EXPECT_FALSE(coordinator->GetDevice(KeyFor(2)).has_value());
    EXPECT_EQ(coordinator->GetCounters().ignored, 1u);

    ASSERT_TRUE(coordinator->Resume());
    source.Emit(MakeRaw(2));
    EXPECT_TRUE(coordinator->GetDevice(KeyFor(2)).has_value());
}

TEST_F(DiscoveryCoordinatorTest, BufferPolicyReplaysOnResume) {
    ScanConfig config;
    config.pause_policy = PausePolicy::BUFFER;
    config.pause_buffer_size = 2;
    ASSERT_TRUE(coordinator->Start(config));

    ASSERT_TRUE(coordinator->Pause());
    source.Emit(MakeRaw(1));
    source.Emit(MakeRaw(2));
    source.Emit(MakeRaw(3));

    auto counters = coordinator->GetCounters();
    EXPECT_EQ(counters.buffered, 3u);
    EXPECT_EQ(counters.ignored, 1u);
    EXPECT_EQ(coordinator->Snapshot().size(), 0u);

    ASSERT_TRUE(coordinator->Resume());

    EXPECT_FALSE(coordinator->GetDevice(KeyFor(1)).has_value());
    EXPECT_TRUE(coordinator->GetDevice(KeyFor(2)).has_value());
    EXPECT_TRUE(coordinator->GetDevice(KeyFor(3)).has_value());
    EXPECT_EQ(coordinator->GetCounters().received, 3u);
}

TEST_F(DiscoveryCoordinatorTest, CancelAfterPauseLeavesRegistryUnchanged) {
    ScanConfig config;
    config.pause_policy = PausePolicy::BUFFER;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(1));
    ASSERT_TRUE(coordinator->Pause());
    source.Emit(MakeRaw(2));

    ASSERT_TRUE(coordinator->Cancel());
    EXPECT_EQ(coordinator->GetState(), ScanState::CANCELLED);
    EXPECT_FALSE(source.subscribed);

    auto snapshot = coordinator->Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].device.key, KeyFor(1));

    source.Emit(MakeRaw(3));
    EXPECT_EQ(coordinator->Snapshot().size(), 1u);
}

TEST_F(DiscoveryCoordinatorTest, InvalidTransitionsAreRejected) {
    EXPECT_FALSE(coordinator->Pause());
    EXPECT_FALSE(coordinator->Resume());
    EXPECT_FALSE(coordinator->Cancel());
    EXPECT_FALSE(coordinator->Complete());

    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));
    EXPECT_FALSE(coordinator->Resume());
    ASSERT_TRUE(coordinator->Complete());
    EXPECT_FALSE(coordinator->Pause());
    EXPECT_FALSE(coordinator->Cancel());
}

TEST_F(DiscoveryCoordinatorTest, SourceFailureCompletesDegraded) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));
    source.Emit(MakeRaw(1));

    source.Fail("socket closed");

    EXPECT_EQ(coordinator->GetState(), ScanState::COMPLETED);
    auto degraded = EventsOf(EventType::SCAN_DEGRADED);
    ASSERT_EQ(degraded.size(), 1u);
    EXPECT_EQ(degraded[0].metadata["reason"], "socket closed");
    EXPECT_FALSE(source.subscribed);
    EXPECT_EQ(coordinator->Snapshot().size(), 1u);
}

TEST_F(DiscoveryCoordinatorTest, DurationCompletesScan) {
    ScanConfig config;
    config.mode = ScanMode::QUICK;
    ASSERT_TRUE(coordinator->Start(config));

    now = 4000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::SCANNING);

    now = 6000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::COMPLETED);

    auto progress = coordinator->GetProgress();
    EXPECT_DOUBLE_EQ(progress.progress_fraction, 1.0);
    EXPECT_EQ(progress.elapsed_ms, 5000u);

    now = 20000;
    EXPECT_EQ(coordinator->GetProgress().elapsed_ms, 5000u);
}

TEST_F(DiscoveryCoordinatorTest, PausedTimeDoesNotCount) {
    ScanConfig config;
    config.mode = ScanMode::QUICK;
    ASSERT_TRUE(coordinator->Start(config));

    now = 2000;
    ASSERT_TRUE(coordinator->Pause());
    now = 10000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::PAUSED);
    EXPECT_EQ(coordinator->GetProgress().elapsed_ms, 1000u);

    ASSERT_TRUE(coordinator->Resume());
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::SCANNING);

    now = 14000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::COMPLETED);
}

TEST_F(DiscoveryCoordinatorTest, StallWarnsThenCompletes) {
    ScanConfig config;
    config.mode = ScanMode::CUSTOM;
    config.custom_duration_ms = 0;
    config.stall_warning_ms = 30000;
    config.stall_timeout_ms = 60000;
    ASSERT_TRUE(coordinator->Start(config));

    now = 31000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::SCANNING);
    EXPECT_EQ(CountEvents(EventType::SCAN_DEGRADED), 1u);

    now = 32000;
    coordinator->Tick();
    EXPECT_EQ(CountEvents(EventType::SCAN_DEGRADED), 1u);

    now = 61000;
    coordinator->Tick();
    EXPECT_EQ(coordinator->GetState(), ScanState::COMPLETED);
    EXPECT_EQ(CountEvents(EventType::SCAN_DEGRADED), 1u);
}

TEST_F(DiscoveryCoordinatorTest, UnpairedAccessoryRaisesThreatOnce) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeAccessory("192.168.1.40"));
    now += 10;
    source.Emit(MakeAccessory("192.168.1.40"));

    auto threats = EventsOf(EventType::THREAT_DETECTED);
    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].device_key, "mac:D0:73:D5:11:22:33");
    EXPECT_EQ(coordinator->GetProgress().threats_found, 1u);

    auto record = coordinator->GetDevice("mac:D0:73:D5:11:22:33");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->assessment.threat, ThreatLevel::HIGH);
    EXPECT_EQ(coordinator->GetCounters().updated, 1u);
}

TEST_F(DiscoveryCoordinatorTest, IpHoppingIsRecordedAndSticky) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeAccessory("192.168.1.40"));
    now += 10;
    source.Emit(MakeAccessory("192.168.1.41"));
    now += 10;
    source.Emit(MakeAccessory("192.168.1.41"));

    auto record = coordinator->GetDevice("mac:D0:73:D5:11:22:33");
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->device.anomalies.size(), 1u);
    EXPECT_EQ(record->device.anomalies[0].type, AnomalyType::IP_HOPPING);
    EXPECT_EQ(record->device.ip, "192.168.1.41");
    EXPECT_EQ(coordinator->GetCounters().anomalies, 1u);
}

TEST_F(DiscoveryCoordinatorTest, MergeKeepsPortsAndServiceTypes) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    RawAdvertisement hap = MakeAccessory("192.168.1.40");
    RawAdvertisement matter = MakeAccessory("192.168.1.40");
    matter.service_type = "_matter._tcp";
    matter.port = 5540;
    matter.metadata = {{"id", "D0:73:D5:11:22:33"}};

    source.Emit(hap);
    now += 10;
    source.Emit(matter);

    auto record = coordinator->GetDevice("mac:D0:73:D5:11:22:33");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->device.ports, (std::vector<uint16_t>{5540, 51826}));
    EXPECT_EQ(record->device.service_types.size(), 2u);
    EXPECT_EQ(record->device.metadata.count("sf"), 0u);
    EXPECT_EQ(record->device.first_seen, 1000u);
    EXPECT_EQ(record->device.last_seen, 1010u);
}

TEST_F(DiscoveryCoordinatorTest, ThreatClearsWhenSetupFlagDisappears) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeAccessory("192.168.1.40"));
    auto record = coordinator->GetDevice("mac:D0:73:D5:11:22:33");
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->assessment.threat, ThreatLevel::HIGH);

    RawAdvertisement paired = MakeAccessory("192.168.1.40");
    paired.metadata = {{"id", "D0:73:D5:11:22:33"}, {"md", "Eve Energy"}};
    now += 10;
    source.Emit(paired);

    record = coordinator->GetDevice("mac:D0:73:D5:11:22:33");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->device.metadata.count("sf"), 0u);
    EXPECT_FALSE(record->assessment.unpaired);
    EXPECT_NE(record->assessment.threat, ThreatLevel::HIGH);
    EXPECT_EQ(coordinator->GetProgress().threats_found, 0u);
}

TEST_F(DiscoveryCoordinatorTest, GoodbyeMarksDeviceOffline) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(1));
    RawAdvertisement goodbye = MakeRaw(1);
    goodbye.removed = true;
    goodbye.port = 0;
    now += 10;
    source.Emit(goodbye);

    auto record = coordinator->GetDevice(KeyFor(1));
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->device.online);
    EXPECT_EQ(CountEvents(EventType::DEVICE_UPDATED), 1u);
}

TEST_F(DiscoveryCoordinatorTest, ControlCallsFromObserversAreRejected) {
    std::atomic<int> rejected{0};
    bus.Subscribe(EventType::DEVICE_ADDED, [this, &rejected](const Event&) {
        if (!coordinator->Cancel()) rejected++;
        if (!coordinator->Pause()) rejected++;
    });

    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));
    source.Emit(MakeRaw(1));

    EXPECT_EQ(rejected, 2);
    EXPECT_EQ(coordinator->GetState(), ScanState::SCANNING);
}

TEST_F(DiscoveryCoordinatorTest, RestartBeginsFreshSession) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));
    source.Emit(MakeRaw(1));
    std::string first_session = coordinator->GetSessionId();
    ASSERT_TRUE(coordinator->Complete());

    ASSERT_TRUE(coordinator->Start(config));
    EXPECT_NE(coordinator->GetSessionId(), first_session);
    EXPECT_EQ(coordinator->Snapshot().size(), 0u);
    EXPECT_EQ(coordinator->GetCounters().received, 0u);
    EXPECT_TRUE(source.subscribed);

    auto changes = EventsOf(EventType::SCAN_STATE_CHANGE);
    ASSERT_GE(changes.size(), 2u);
    EXPECT_EQ(changes[changes.size() - 2].metadata["to_state"], "IDLE");
    EXPECT_EQ(changes.back().metadata["to_state"], "SCANNING");
}

TEST_F(DiscoveryCoordinatorTest, RecordsHistoryInBackground) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(1));
    source.Emit(MakeRaw(2));
    coordinator->FlushHistory();

    EXPECT_EQ(history.Count(), 2u);
    auto entries = history.Get(KeyFor(2), 10);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].timestamp, 1000u);
}

TEST_F(DiscoveryCoordinatorTest, ProgressReportsCurrentHost) {
    ScanConfig config;
    ASSERT_TRUE(coordinator->Start(config));

    source.Emit(MakeRaw(7));

    auto progress = coordinator->GetProgress();
    EXPECT_EQ(progress.state, ScanState::SCANNING);
    EXPECT_EQ(progress.devices_found, 1u);
    EXPECT_EQ(progress.current_host, HostFor(7));
    EXPECT_GE(CountEvents(EventType::SCAN_PROGRESS), 1u);
}
