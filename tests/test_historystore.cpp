#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include "persistence/DeviceSerializer.hpp"
#include "persistence/HistoryStore.hpp"

using namespace homescout;

class HistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::InitializeConsoleOnly(LogLevel::OFF);
        ASSERT_TRUE(store.Initialize(":memory:"));
    }

    void TearDown() override {
        store.Shutdown();
    }

    static HistoryRecord MakeRecord(const std::string& key, uint64_t timestamp, uint32_t score = 0) {
        HistoryRecord record;
        record.device.key = key;
        record.device.name = "Eve Energy";
        record.device.ip = "192.168.1.40";
        record.device.mac = "D0:73:D5:11:22:33";
        record.device.category = ServiceCategory::HOME_AUTOMATION;
        record.device.service_types = {"_hap._tcp"};
        record.device.metadata = {{"sf", "1"}};
        record.device.ports = {51826};
        record.device.anomalies = {{AnomalyType::IP_HOPPING, "IP changed"}};
        record.device.first_seen = timestamp;
        record.device.last_seen = timestamp;
        record.assessment.score = score;
        record.assessment.threat = score >= 70 ? ThreatLevel::HIGH : ThreatLevel::NONE;
        record.assessment.reasons = {"Advertises smart-home service _hap._tcp (+40)"};
        record.timestamp = timestamp;
        return record;
    }

    SqliteHistoryStore store;
};

TEST_F(HistoryStoreTest, PutAndGetNewestFirst) {
    ASSERT_TRUE(store.Put(MakeRecord("mac:a", 1000, 40)));
    ASSERT_TRUE(store.Put(MakeRecord("mac:a", 3000, 95)));
    ASSERT_TRUE(store.Put(MakeRecord("mac:a", 2000, 70)));
    ASSERT_TRUE(store.Put(MakeRecord("mac:b", 2500, 10)));

    EXPECT_EQ(store.GetRecordCount(), 4u);

    auto history = store.Get("mac:a", 10);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].timestamp, 3000u);
    EXPECT_EQ(history[1].timestamp, 2000u);
    EXPECT_EQ(history[2].timestamp, 1000u);

    EXPECT_EQ(history[0].assessment.score, 95u);
    EXPECT_EQ(history[0].assessment.threat, ThreatLevel::HIGH);
    EXPECT_EQ(history[0].device.category, ServiceCategory::HOME_AUTOMATION);
    ASSERT_TRUE(history[0].device.mac.has_value());
    EXPECT_EQ(*history[0].device.mac, "D0:73:D5:11:22:33");
    ASSERT_EQ(history[0].device.anomalies.size(), 1u);
    EXPECT_EQ(history[0].device.anomalies[0].type, AnomalyType::IP_HOPPING);
}

TEST_F(HistoryStoreTest, GetRespectsLimit) {
    for (uint64_t t = 1; t <= 5; ++t) {
        store.Put(MakeRecord("mac:a", t * 1000));
    }

    auto history = store.Get("mac:a", 2);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].timestamp, 5000u);
    EXPECT_TRUE(store.Get("mac:a", 0).empty());
    EXPECT_TRUE(store.Get("mac:unknown", 10).empty());
}

TEST_F(HistoryStoreTest, PruneRemovesOldRecords) {
    store.Put(MakeRecord("mac:a", 1000));
    store.Put(MakeRecord("mac:a", 5000));
    store.Put(MakeRecord("mac:b", 9000));

    // Cutoff is 10000 - 5000 = 5000; only strictly older records go.
    EXPECT_EQ(store.Prune(5000, 10000), 1u);
    EXPECT_EQ(store.GetRecordCount(), 2u);

    EXPECT_EQ(store.Prune(0, 100000), 2u);
    EXPECT_EQ(store.GetRecordCount(), 0u);
}

TEST_F(HistoryStoreTest, ClosedStoreRefusesWrites) {
    store.Shutdown();
    EXPECT_FALSE(store.IsOpen());
    EXPECT_FALSE(store.Put(MakeRecord("mac:a", 1000)));
    EXPECT_TRUE(store.Get("mac:a", 10).empty());
    EXPECT_EQ(store.Prune(0, 1000), 0u);
}

TEST_F(HistoryStoreTest, InvalidUtf8IsRejectedNotThrown) {
    auto record = MakeRecord("mac:a", 1000);
    record.device.name = "bad \xFF name";
    EXPECT_FALSE(store.Put(record));
    EXPECT_EQ(store.GetRecordCount(), 0u);
}

TEST(DeviceSerializerTest, TimestampFormatting) {
    EXPECT_EQ(TimestampToISO8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(TimestampToISO8601(1700000000123ull), "2023-11-14T22:13:20.123Z");
}

TEST(DeviceSerializerTest, MissingKeyIsRejected) {
    Logger::InitializeConsoleOnly(LogLevel::OFF);
    nlohmann::json j = {{"name", "Plug"}};
    EXPECT_FALSE(DeviceFromJson(j).has_value());
}
