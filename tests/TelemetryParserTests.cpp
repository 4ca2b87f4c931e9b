#include <gtest/gtest.h>

#include "core/telemetry/TelemetryParser.hpp"
#include "core/types/Error.hpp"
#include <limits>
#include <string>

using core::models::PrintStatus;
using core::telemetry::mapPrintStatus;
using core::telemetry::parseReport;

class TelemetryParserTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point receivedAt_ = std::chrono::system_clock::now();
};

TEST_F(TelemetryParserTest, StatusMapping_KnownAndUnknownCodes) {
    EXPECT_EQ(mapPrintStatus("RUNNING"), PrintStatus::Printing);
    EXPECT_EQ(mapPrintStatus("PAUSE"), PrintStatus::Paused);
    EXPECT_EQ(mapPrintStatus("FINISH"), PrintStatus::Finished);
    EXPECT_EQ(mapPrintStatus("FAILED"), PrintStatus::Failed);
    EXPECT_EQ(mapPrintStatus(""), PrintStatus::Idle);
    EXPECT_EQ(mapPrintStatus("PREPARE"), PrintStatus::Idle);
    EXPECT_EQ(mapPrintStatus("running"), PrintStatus::Idle);
}

TEST_F(TelemetryParserTest, RunningReport_PopulatesJob) {
    auto snapshot = parseReport(
        std::string(R"({"print":{"gcode_state":"RUNNING","mc_percent":42,"subtask_name":"Vase",
            "layer_num":12,"total_layer_num":180,"bed_temper":60.1,"nozzle_temper":219.5,
            "bed_target_temper":60,"nozzle_target_temper":220}})"),
        receivedAt_);

    EXPECT_EQ(snapshot.status, PrintStatus::Printing);
    EXPECT_EQ(snapshot.rawState, "RUNNING");
    EXPECT_EQ(snapshot.progress, 42);
    EXPECT_DOUBLE_EQ(snapshot.bedTemperature, 60.1);
    EXPECT_DOUBLE_EQ(snapshot.nozzleTemperature, 219.5);
    EXPECT_DOUBLE_EQ(snapshot.nozzleTargetTemperature, 220.0);
    ASSERT_TRUE(snapshot.currentJob.has_value());
    EXPECT_EQ(snapshot.currentJob->name, "Vase");
    EXPECT_EQ(snapshot.currentJob->layer, 12);
    EXPECT_EQ(snapshot.currentJob->totalLayers, 180);
    EXPECT_EQ(snapshot.updatedAt, receivedAt_);
}

TEST_F(TelemetryParserTest, EmptyJobName_LeavesJobAbsent) {
    auto snapshot = parseReport(std::string(R"({"print":{"gcode_state":"RUNNING","mc_percent":42,"subtask_name":""}})"),
                                receivedAt_);

    EXPECT_EQ(snapshot.status, PrintStatus::Printing);
    EXPECT_FALSE(snapshot.currentJob.has_value());
    EXPECT_TRUE(snapshot.toJson()["current_job"].is_null());
}

TEST_F(TelemetryParserTest, MissingFields_DefaultToIdleAndZero) {
    auto snapshot = parseReport(std::string(R"({"print":{}})"), receivedAt_);

    EXPECT_EQ(snapshot.status, PrintStatus::Idle);
    EXPECT_EQ(snapshot.progress, 0);
    EXPECT_DOUBLE_EQ(snapshot.bedTemperature, 0.0);
    EXPECT_FALSE(snapshot.currentJob.has_value());
}

TEST_F(TelemetryParserTest, NumericStrings_AreAccepted) {
    auto snapshot = parseReport(std::string(R"({"print":{"mc_percent":"17","bed_temper":"55.5"}})"), receivedAt_);

    EXPECT_EQ(snapshot.progress, 17);
    EXPECT_DOUBLE_EQ(snapshot.bedTemperature, 55.5);
}

TEST_F(TelemetryParserTest, Progress_IsClampedToPercentRange) {
    EXPECT_EQ(parseReport(std::string(R"({"print":{"mc_percent":140}})"), receivedAt_).progress, 100);
    EXPECT_EQ(parseReport(std::string(R"({"print":{"mc_percent":-3}})"), receivedAt_).progress, 0);
}

TEST_F(TelemetryParserTest, MalformedPayloads_ThrowProtocolException) {
    EXPECT_THROW(parseReport(std::string("not json {"), receivedAt_), core::types::ProtocolException);
    EXPECT_THROW(parseReport(std::string("[1,2,3]"), receivedAt_), core::types::ProtocolException);
    EXPECT_THROW(parseReport(std::string(R"({"info":{}})"), receivedAt_), core::types::ProtocolException);
    EXPECT_THROW(parseReport(std::string(R"({"print":"RUNNING"})"), receivedAt_), core::types::ProtocolException);
}

TEST_F(TelemetryParserTest, HugeLayerCounts_SaturateInsteadOfOverflowing) {
    auto snapshot = parseReport(
        std::string(R"({"print":{"subtask_name":"Vase","layer_num":1e12,"total_layer_num":"1e300"}})"), receivedAt_);

    ASSERT_TRUE(snapshot.currentJob.has_value());
    EXPECT_EQ(snapshot.currentJob->layer, std::numeric_limits<int>::max());
    EXPECT_EQ(snapshot.currentJob->totalLayers, std::numeric_limits<int>::max());
}

TEST_F(TelemetryParserTest, NonFiniteNumbers_FallBackToDefaults) {
    auto snapshot = parseReport(
        std::string(R"({"print":{"subtask_name":"Vase","mc_percent":"nan","layer_num":"inf",
            "total_layer_num":"-inf","bed_temper":"nan","nozzle_temper":"1e999"}})"),
        receivedAt_);

    EXPECT_EQ(snapshot.progress, 0);
    EXPECT_DOUBLE_EQ(snapshot.bedTemperature, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.nozzleTemperature, 0.0);
    ASSERT_TRUE(snapshot.currentJob.has_value());
    EXPECT_EQ(snapshot.currentJob->layer, 0);
    EXPECT_EQ(snapshot.currentJob->totalLayers, 0);
}

TEST_F(TelemetryParserTest, NegativeLayerCounts_ClampToZero) {
    auto snapshot = parseReport(std::string(R"({"print":{"subtask_name":"Vase","layer_num":-4}})"), receivedAt_);

    ASSERT_TRUE(snapshot.currentJob.has_value());
    EXPECT_EQ(snapshot.currentJob->layer, 0);
}
