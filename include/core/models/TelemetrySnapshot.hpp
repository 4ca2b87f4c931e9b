#pragma once

#include "core/utils/Time.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace core::models {

    enum class PrintStatus {
        Idle,
        Printing,
        Paused,
        Finished,
        Failed
    };

    inline std::string toString(PrintStatus status) {
        switch (status) {
            case PrintStatus::Idle: return "idle";
            case PrintStatus::Printing: return "printing";
            case PrintStatus::Paused: return "paused";
            case PrintStatus::Finished: return "finished";
            case PrintStatus::Failed: return "failed";
        }
        return "idle";
    }

    struct CurrentJob {
        std::string name;
        int layer = 0;
        int totalLayers = 0;

        nlohmann::json toJson() const {
            return nlohmann::json{
                {"name", name},
                {"layer", layer},
                {"total_layers", totalLayers}
            };
        }
    };

    /**
     * @brief Device state decoded from one report message.
     *
     * Built completely before it is published and never modified afterwards;
     * the cache swaps whole snapshots.
     */
    struct TelemetrySnapshot {
        PrintStatus status = PrintStatus::Idle;
        std::string rawState;
        int progress = 0;
        double bedTemperature = 0.0;
        double nozzleTemperature = 0.0;
        double bedTargetTemperature = 0.0;
        double nozzleTargetTemperature = 0.0;
        std::optional<CurrentJob> currentJob;
        std::chrono::system_clock::time_point updatedAt;

        nlohmann::json toJson() const {
            nlohmann::json json{
                {"status", toString(status)},
                {"gcode_state", rawState},
                {"progress", progress},
                {"bed_temp", bedTemperature},
                {"nozzle_temp", nozzleTemperature},
                {"bed_target_temp", bedTargetTemperature},
                {"nozzle_target_temp", nozzleTargetTemperature},
                {"last_updated", utils::toIsoString(updatedAt)}
            };
            json["current_job"] = currentJob ? currentJob->toJson() : nlohmann::json(nullptr);
            return json;
        }
    };

} // namespace core::models
