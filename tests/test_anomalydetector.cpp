#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "engine/AnomalyDetector.hpp"

using namespace homescout;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    AnomalyDetectorTest() : detector(ScoringPolicy{}.expected_ports) {}

    static DiscoveredDevice MakeDevice(const std::string& name, const std::string& ip,
                                       std::vector<uint16_t> ports = {51826}) {
        DiscoveredDevice device;
        device.name = name;
        device.ip = ip;
        device.mac = "D0:73:D5:11:22:33";
        device.key = "mac:D0:73:D5:11:22:33";
        device.ports = std::move(ports);
        return device;
    }

    AnomalyDetector detector;
};

TEST_F(AnomalyDetectorTest, FirstSightingHasNoAnomalies) {
    auto current = MakeDevice("Eve Energy", "192.168.1.40", {49999});
    EXPECT_TRUE(detector.Detect(nullptr, current).empty());
}

TEST_F(AnomalyDetectorTest, IdenticalRecordHasNoAnomalies) {
    auto device = MakeDevice("Eve Energy", "192.168.1.40");
    EXPECT_TRUE(detector.Detect(&device, device).empty());
}

TEST_F(AnomalyDetectorTest, NameChange) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40");
    auto current = MakeDevice("Totally Legit Plug", "192.168.1.40");

    auto anomalies = detector.Detect(&prior, current);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].type, AnomalyType::NAME_CHANGED);
    EXPECT_EQ(anomalies[0].description, "Name changed from 'Eve Energy' to 'Totally Legit Plug'");
}

TEST_F(AnomalyDetectorTest, NameCaseChangeIsIgnored) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40");
    auto current = MakeDevice("EVE ENERGY", "192.168.1.40");
    EXPECT_TRUE(detector.Detect(&prior, current).empty());
}

TEST_F(AnomalyDetectorTest, IpHoppingWithConstantMac) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40");
    auto current = MakeDevice("Eve Energy", "192.168.1.41");

    auto anomalies = detector.Detect(&prior, current);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].type, AnomalyType::IP_HOPPING);
    EXPECT_EQ(anomalies[0].description,
              "IP changed from 192.168.1.40 to 192.168.1.41 with constant MAC D0:73:D5:11:22:33");
}

TEST_F(AnomalyDetectorTest, DualStackIsNotHopping) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40");
    auto current = MakeDevice("Eve Energy", "fe80::1");
    EXPECT_TRUE(detector.Detect(&prior, current).empty());
}

TEST_F(AnomalyDetectorTest, UnexpectedPort) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40", {51826});
    auto current = MakeDevice("Eve Energy", "192.168.1.40", {4444, 8080});

    auto anomalies = detector.Detect(&prior, current);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].type, AnomalyType::UNEXPECTED_PORT);
    EXPECT_EQ(anomalies[0].description, "Unexpected port 4444 advertised");
}

TEST_F(AnomalyDetectorTest, PreviouslySeenPortIsNotAnomalous) {
    auto prior = MakeDevice("Eve Energy", "192.168.1.40", {4444});
    auto current = MakeDevice("Eve Energy", "192.168.1.40", {4444});
    EXPECT_TRUE(detector.Detect(&prior, current).empty());
}

TEST_F(AnomalyDetectorTest, MergeDeduplicatesAndBounds) {
    std::vector<Anomaly> sticky = {{AnomalyType::UNEXPECTED_PORT, "Unexpected port 4444 advertised"}};
    std::vector<Anomaly> fresh = {
        {AnomalyType::UNEXPECTED_PORT, "Unexpected port 4444 advertised"},
        {AnomalyType::UNEXPECTED_PORT, "Unexpected port 4445 advertised"},
        {AnomalyType::UNEXPECTED_PORT, "Unexpected port 4446 advertised"},
    };

    size_t appended = MergeAnomalies(sticky, fresh, 2);

    EXPECT_EQ(appended, 1u);
    ASSERT_EQ(sticky.size(), 2u);
    EXPECT_EQ(sticky[1].description, "Unexpected port 4445 advertised");
}
