#include <gtest/gtest.h>

#include "core/link/DeviceLink.hpp"
#include "core/telemetry/TelemetryCache.hpp"
#include "support/Fakes.hpp"

using core::link::DeviceLink;
using core::link::LinkState;
using test_support::FakeMqttClient;

class DeviceLinkTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeMqttClient> client_ = std::make_shared<FakeMqttClient>();
    std::shared_ptr<core::telemetry::TelemetryChannel> channel_ = std::make_shared<core::telemetry::TelemetryChannel>();
    std::shared_ptr<core::telemetry::TelemetryCache> cache_ = std::make_shared<core::telemetry::TelemetryCache>();

    void SetUp() override {
        channel_->subscribe(cache_);
    }

    std::unique_ptr<DeviceLink> makeLink(core::config::LinkConfig config = test_support::completeLinkConfig()) {
        return std::make_unique<DeviceLink>(config, client_, channel_);
    }
};

TEST_F(DeviceLinkTest, MissingConfiguration_FailsBeforeNetwork) {
    auto config = test_support::completeLinkConfig();
    config.accessCode = "${BAMBU_ACCESS_CODE:}";
    auto link = makeLink(config);

    EXPECT_THROW(link->connect(), core::types::ConfigurationException);
    EXPECT_TRUE(client_->connectCalls.empty());
    EXPECT_EQ(link->state(), LinkState::Disconnected);
}

TEST_F(DeviceLinkTest, Connect_AuthenticatesAndSubscribesToReports) {
    auto link = makeLink();

    link->connect();

    ASSERT_EQ(client_->connectCalls.size(), 1u);
    const auto &options = client_->connectCalls[0];
    EXPECT_EQ(options.host, "192.168.1.50");
    EXPECT_EQ(options.port, 8883);
    EXPECT_EQ(options.username, "bblp");
    EXPECT_EQ(options.password, "12345678");
    EXPECT_TRUE(options.insecureSkipVerify);
    EXPECT_EQ(client_->subscriptions, std::vector<std::string>{"device/01S00A000000001/report"});
    EXPECT_EQ(link->state(), LinkState::Connected);
    EXPECT_TRUE(link->isConnected());

    link->connect();
    EXPECT_EQ(client_->connectCalls.size(), 1u);
}

TEST_F(DeviceLinkTest, ConnectFailure_RaisesConnectivityError) {
    client_->failConnectWith = "Connection refused";
    auto link = makeLink();

    EXPECT_THROW(link->connect(), core::types::ConnectivityException);
    EXPECT_EQ(link->state(), LinkState::Disconnected);
    EXPECT_FALSE(link->isConnected());
}

TEST_F(DeviceLinkTest, Report_ReplacesCachedSnapshot) {
    auto link = makeLink();
    link->connect();

    client_->deliver("device/01S00A000000001/report",
                     R"({"print":{"gcode_state":"RUNNING","mc_percent":42,"subtask_name":"Vase"}})");

    auto snapshot = cache_->latest();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->status, core::models::PrintStatus::Printing);
    EXPECT_EQ(snapshot->progress, 42);
    ASSERT_TRUE(snapshot->currentJob.has_value());
    EXPECT_EQ(snapshot->currentJob->name, "Vase");
}

TEST_F(DeviceLinkTest, MalformedReport_IsDroppedWithoutTouchingCache) {
    auto link = makeLink();
    link->connect();
    client_->deliver("device/01S00A000000001/report", R"({"print":{"gcode_state":"PAUSE"}})");
    auto before = cache_->latest();

    client_->deliver("device/01S00A000000001/report", "{truncated");
    client_->deliver("device/01S00A000000001/report", R"({"info":{"module":[]}})");

    EXPECT_EQ(cache_->latest(), before);
    EXPECT_EQ(cache_->updateCount(), 1u);
    EXPECT_EQ(link->droppedMessages(), 2u);
    EXPECT_TRUE(link->isConnected());
}

TEST_F(DeviceLinkTest, OtherTopics_AreIgnored) {
    auto link = makeLink();
    link->connect();

    client_->deliver("device/OTHER/report", R"({"print":{"gcode_state":"RUNNING"}})");

    EXPECT_FALSE(cache_->hasTelemetry());
}

TEST_F(DeviceLinkTest, Publish_SerializesCommandToRequestTopic) {
    auto link = makeLink();
    link->connect();

    link->publish(core::models::DeviceCommand::projectFile("Vase.3mf", "job-1", "BambuAgent"));

    ASSERT_EQ(client_->published.size(), 1u);
    EXPECT_EQ(client_->published[0].first, "device/01S00A000000001/request");
    auto body = nlohmann::json::parse(client_->published[0].second);
    EXPECT_EQ(body["print"]["command"], "project_file");
    EXPECT_EQ(body["print"]["param"], "Vase.3mf");
    EXPECT_EQ(body["print"]["sequence_id"], "job-1");
    EXPECT_EQ(body["print"]["user_id"], "BambuAgent");
}

TEST_F(DeviceLinkTest, Publish_IncompleteCommandIsRejected) {
    auto link = makeLink();
    link->connect();

    EXPECT_THROW(link->publish(core::models::DeviceCommand("project_file", "Vase.3mf", "", "BambuAgent")),
                 core::types::ProtocolException);
    EXPECT_TRUE(client_->published.empty());
}

TEST_F(DeviceLinkTest, CommandFromJson_ToleratesMissingOptionalFields) {
    core::models::DeviceCommand command(nlohmann::json::parse(R"({"print":{"command":"pause","sequence_id":"7"}})"));

    EXPECT_EQ(command.command, "pause");
    EXPECT_EQ(command.sequenceId, "7");
    EXPECT_TRUE(command.param.empty());
    EXPECT_TRUE(command.userId.empty());
    EXPECT_TRUE(command.isValid());
    EXPECT_THROW(core::models::DeviceCommand(nlohmann::json::parse(R"({"print":{}})")), nlohmann::json::exception);
}

TEST_F(DeviceLinkTest, Publish_WhileDisconnectedThrows) {
    auto link = makeLink();

    EXPECT_THROW(link->publish(core::models::DeviceCommand::projectFile("Vase.3mf", "job-1", "BambuAgent")),
                 core::types::ConnectivityException);
    EXPECT_TRUE(client_->published.empty());
}

TEST_F(DeviceLinkTest, NetworkDrop_MovesToDisconnected) {
    auto link = makeLink();
    link->connect();

    client_->dropConnection("keep-alive timeout");

    EXPECT_EQ(link->state(), LinkState::Disconnected);
    EXPECT_FALSE(link->isConnected());

    link->connect();
    EXPECT_EQ(client_->connectCalls.size(), 2u);
    EXPECT_EQ(link->state(), LinkState::Connected);
}

TEST_F(DeviceLinkTest, Disconnect_IsIdempotent) {
    auto link = makeLink();
    link->connect();

    link->disconnect();
    link->disconnect();

    EXPECT_EQ(link->state(), LinkState::Disconnected);
    EXPECT_FALSE(client_->isConnected());
}
