#include <gtest/gtest.h>

#include "connector/discovery/DiscoveryService.hpp"
#include "support/Fakes.hpp"

using namespace std::chrono_literals;
using connector::discovery::DiscoveryResults;
using connector::discovery::DiscoveryService;
using core::models::Device;
using test_support::ScriptedSource;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    static Device advertised(const std::string &address) {
        return Device("X1C-Lab", address, 8883, "X1C");
    }

    static Device probed(const std::string &address, uint16_t port) {
        return Device("Bambu-" + address.substr(address.rfind('.') + 1), address, port);
    }

    static std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }
};

TEST_F(DiscoveryServiceTest, Results_KeepFirstDevicePerAddress) {
    DiscoveryResults results;

    EXPECT_TRUE(results.add(advertised("192.168.1.50")));
    EXPECT_FALSE(results.add(probed("192.168.1.50", 80)));
    EXPECT_TRUE(results.add(probed("192.168.1.51", 80)));

    auto devices = results.snapshot();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].model(), "X1C");
    EXPECT_EQ(devices[0].port(), 8883);
}

TEST_F(DiscoveryServiceTest, SameAddressFromBothPaths_AppearsOnce) {
    auto passive = std::make_shared<ScriptedSource>("passive", std::vector<ScriptedSource::Step>{
        {50ms, advertised("192.168.1.50")}
    });
    auto active = std::make_shared<ScriptedSource>("active", std::vector<ScriptedSource::Step>{
        {100ms, probed("192.168.1.50", 8883)},
        {10ms, probed("192.168.1.50", 80)},
        {10ms, probed("192.168.1.50", 443)}
    });
    DiscoveryService service(passive, active, 300ms);

    auto devices = service.discover(5);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name(), "X1C-Lab");
    EXPECT_EQ(devices[0].model(), "X1C");
}

TEST_F(DiscoveryServiceTest, ProbeFindsFirst_ScannerEntryIsKept) {
    auto passive = std::make_shared<ScriptedSource>("passive", std::vector<ScriptedSource::Step>{
        {150ms, advertised("192.168.1.50")}
    });
    auto active = std::make_shared<ScriptedSource>("active", std::vector<ScriptedSource::Step>{
        {20ms, probed("192.168.1.50", 80)}
    });
    DiscoveryService service(passive, active, 400ms);

    auto devices = service.discover(5);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name(), "Bambu-50");
    EXPECT_EQ(devices[0].model(), core::models::UNKNOWN_MODEL);
}

TEST_F(DiscoveryServiceTest, OneAdvertisedDevice_ReturnsWellBeforeTimeout) {
    auto passive = std::make_shared<ScriptedSource>("passive", std::vector<ScriptedSource::Step>{
        {200ms, advertised("192.168.1.50")}
    });
    auto active = std::make_shared<ScriptedSource>("active");
    DiscoveryService service(passive, active);

    auto start = std::chrono::steady_clock::now();
    auto devices = service.discover(5);
    auto elapsed = elapsedSince(start);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_LE(elapsed, 6000ms);
    // one settle window after the find, not the full timeout
    EXPECT_GE(elapsed, 1150ms);
    EXPECT_LT(elapsed, 3000ms);
}

TEST_F(DiscoveryServiceTest, LateFinds_ExtendSettleWindow) {
    auto passive = std::make_shared<ScriptedSource>("passive", std::vector<ScriptedSource::Step>{
        {50ms, advertised("192.168.1.50")},
        {200ms, advertised("192.168.1.51")}
    });
    auto active = std::make_shared<ScriptedSource>("active");
    DiscoveryService service(passive, active, 300ms);

    auto devices = service.discover(5);

    EXPECT_EQ(devices.size(), 2u);
}

TEST_F(DiscoveryServiceTest, NothingFound_ReturnsEmptyAtTimeout) {
    auto passive = std::make_shared<ScriptedSource>("passive");
    auto active = std::make_shared<ScriptedSource>("active");
    DiscoveryService service(passive, active);

    auto start = std::chrono::steady_clock::now();
    auto devices = service.discover(std::chrono::milliseconds(400));
    auto elapsed = elapsedSince(start);

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(elapsed, 390ms);
    EXPECT_LT(elapsed, 2000ms);
}

TEST_F(DiscoveryServiceTest, Sources_StoppedOnEveryExit) {
    auto passive = std::make_shared<ScriptedSource>("passive", std::vector<ScriptedSource::Step>{
        {20ms, advertised("192.168.1.50")}
    });
    auto active = std::make_shared<ScriptedSource>("active");
    DiscoveryService service(passive, active, 100ms);

    service.discover(5);
    EXPECT_EQ(passive->stopCalls.load(), 1);
    EXPECT_EQ(active->stopCalls.load(), 1);
    EXPECT_FALSE(passive->isDiscovering());
    EXPECT_FALSE(active->isDiscovering());

    service.discover(std::chrono::milliseconds(100));
    EXPECT_EQ(passive->startCalls.load(), 2);
    EXPECT_EQ(passive->stopCalls.load(), 2);
    EXPECT_EQ(active->stopCalls.load(), 2);
}

TEST_F(DiscoveryServiceTest, FailingListener_IsReleasedAndScanStillRuns) {
    auto passive = std::make_shared<ScriptedSource>("passive");
    passive->failOnStart = true;
    auto active = std::make_shared<ScriptedSource>("active", std::vector<ScriptedSource::Step>{
        {20ms, probed("192.168.1.60", 8883)}
    });
    DiscoveryService service(passive, active, 100ms);

    auto devices = service.discover(5);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].address(), "192.168.1.60");
    EXPECT_EQ(passive->stopCalls.load(), 1);
    EXPECT_EQ(active->stopCalls.load(), 1);
}
