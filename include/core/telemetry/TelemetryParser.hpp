#pragma once

#include "core/models/TelemetrySnapshot.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace core::telemetry {

    /**
     * @brief Maps the device's gcode_state onto the canonical status.
     *
     * RUNNING -> printing, PAUSE -> paused, FINISH -> finished, FAILED -> failed,
     * anything else (empty included) -> idle.
     */
    models::PrintStatus mapPrintStatus(const std::string &rawState);

    /**
     * @brief Decodes a report payload into a complete snapshot stamped with receivedAt.
     * @throws core::types::ProtocolException when the text is not JSON or has no "print" object
     */
    models::TelemetrySnapshot parseReport(const std::string &payload,
                                          std::chrono::system_clock::time_point receivedAt);

    models::TelemetrySnapshot parseReport(const nlohmann::json &report,
                                          std::chrono::system_clock::time_point receivedAt);

} // namespace core::telemetry
