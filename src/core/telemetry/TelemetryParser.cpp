#include "core/telemetry/TelemetryParser.hpp"
#include "core/types/Error.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace core::telemetry {
    namespace {
        // Firmware versions disagree on whether numbers are sent as numbers or strings.
        // Non-finite values ("nan", "inf") count as absent.
        double numberField(const nlohmann::json &section, const char *key, double fallback = 0.0) {
            auto it = section.find(key);
            if (it == section.end() || it->is_null()) return fallback;

            double value = fallback;
            if (it->is_number()) {
                value = it->get<double>();
            } else if (it->is_string()) {
                try {
                    value = std::stod(it->get<std::string>());
                } catch (const std::exception &) {
                    return fallback;
                }
            }
            return std::isfinite(value) ? value : fallback;
        }

        int countField(const nlohmann::json &section, const char *key) {
            double value = numberField(section, key);
            return static_cast<int>(std::clamp(value, 0.0, static_cast<double>(std::numeric_limits<int>::max())));
        }

        std::string stringField(const nlohmann::json &section, const char *key) {
            auto it = section.find(key);
            if (it == section.end() || !it->is_string()) return "";
            return it->get<std::string>();
        }
    }

    models::PrintStatus mapPrintStatus(const std::string &rawState) {
        if (rawState == "RUNNING") return models::PrintStatus::Printing;
        if (rawState == "PAUSE") return models::PrintStatus::Paused;
        if (rawState == "FINISH") return models::PrintStatus::Finished;
        if (rawState == "FAILED") return models::PrintStatus::Failed;
        return models::PrintStatus::Idle;
    }

    models::TelemetrySnapshot parseReport(const std::string &payload,
                                          std::chrono::system_clock::time_point receivedAt) {
        nlohmann::json report;
        try {
            report = nlohmann::json::parse(payload);
        } catch (const nlohmann::json::parse_error &e) {
            throw types::ProtocolException("Report is not valid JSON: " + std::string(e.what()));
        }
        return parseReport(report, receivedAt);
    }

    models::TelemetrySnapshot parseReport(const nlohmann::json &report,
                                          std::chrono::system_clock::time_point receivedAt) {
        if (!report.is_object()) {
            throw types::ProtocolException("Report is not a JSON object");
        }
        auto printIt = report.find("print");
        if (printIt == report.end() || !printIt->is_object()) {
            throw types::ProtocolException("Report has no print section");
        }
        const auto &print = *printIt;

        models::TelemetrySnapshot snapshot;
        snapshot.rawState = stringField(print, "gcode_state");
        snapshot.status = mapPrintStatus(snapshot.rawState);

        double percent = numberField(print, "mc_percent");
        snapshot.progress = static_cast<int>(std::lround(std::clamp(percent, 0.0, 100.0)));

        snapshot.bedTemperature = numberField(print, "bed_temper");
        snapshot.nozzleTemperature = numberField(print, "nozzle_temper");
        snapshot.bedTargetTemperature = numberField(print, "bed_target_temper");
        snapshot.nozzleTargetTemperature = numberField(print, "nozzle_target_temper");

        std::string jobName = stringField(print, "subtask_name");
        if (!jobName.empty()) {
            models::CurrentJob job;
            job.name = jobName;
            job.layer = countField(print, "layer_num");
            job.totalLayers = countField(print, "total_layer_num");
            snapshot.currentJob = job;
        }

        snapshot.updatedAt = receivedAt;
        return snapshot;
    }

} // namespace core::telemetry
