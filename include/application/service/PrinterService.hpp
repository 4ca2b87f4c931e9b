#pragma once

#include "connector/discovery/DiscoveryService.hpp"
#include "core/job/JobSubmitter.hpp"
#include "core/link/DeviceLink.hpp"
#include "core/telemetry/TelemetryCache.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace application {

    /**
     * @brief Latest telemetry together with the link state. hasTelemetry is false until the
     * first report arrived, which is not the same as an idle printer.
     */
    struct StatusReport {
        bool hasTelemetry = false;
        core::link::LinkState linkState = core::link::LinkState::Disconnected;
        core::telemetry::SnapshotPtr snapshot;

        nlohmann::json toJson() const;
    };

    struct ConnectionInfo {
        std::string printerIp;
        bool accessCodeConfigured = false;
        std::string deviceSerial;
        bool connected = false;

        nlohmann::json toJson() const;
    };

    /**
     * @brief Entry point for callers: discovery, link, status and job submission.
     */
    class PrinterService {
    public:
        PrinterService(std::shared_ptr<connector::discovery::DiscoveryService> discovery,
                       std::shared_ptr<core::link::DeviceLink> link,
                       std::shared_ptr<core::telemetry::TelemetryCache> cache,
                       std::shared_ptr<core::job::JobSubmitter> submitter);

        std::vector<core::models::Device> discover(int timeoutSeconds);

        /**
         * @return false when the printer could not be reached
         * @throws core::types::ConfigurationException when the link is not configured
         */
        bool connect();

        void disconnect();

        StatusReport getStatus() const;

        /**
         * @brief Like getStatus(), but first waits up to timeout for the first report.
         */
        StatusReport waitForStatus(std::chrono::milliseconds timeout) const;

        std::string submit(const std::string &filePath, const std::string &printName);

        ConnectionInfo connectionInfo() const;

    private:
        std::shared_ptr<connector::discovery::DiscoveryService> discovery_;
        std::shared_ptr<core::link::DeviceLink> link_;
        std::shared_ptr<core::telemetry::TelemetryCache> cache_;
        std::shared_ptr<core::job::JobSubmitter> submitter_;
    };

} // namespace application
