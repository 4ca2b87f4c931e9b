#include "application/service/PrinterService.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace application {

    nlohmann::json StatusReport::toJson() const {
        nlohmann::json json;
        json["has_telemetry"] = hasTelemetry;
        json["link"] = core::link::toString(linkState);
        json["telemetry"] = snapshot ? snapshot->toJson() : nlohmann::json(nullptr);
        return json;
    }

    nlohmann::json ConnectionInfo::toJson() const {
        return nlohmann::json{
            {"printer_ip", printerIp},
            {"access_code_configured", accessCodeConfigured},
            {"device_serial", deviceSerial},
            {"connected", connected}
        };
    }

    PrinterService::PrinterService(std::shared_ptr<connector::discovery::DiscoveryService> discovery,
                                   std::shared_ptr<core::link::DeviceLink> link,
                                   std::shared_ptr<core::telemetry::TelemetryCache> cache,
                                   std::shared_ptr<core::job::JobSubmitter> submitter)
        : discovery_(std::move(discovery)), link_(std::move(link)), cache_(std::move(cache)),
          submitter_(std::move(submitter)) {
    }

    std::vector<core::models::Device> PrinterService::discover(int timeoutSeconds) {
        return discovery_->discover(timeoutSeconds);
    }

    bool PrinterService::connect() {
        try {
            link_->connect();
            return true;
        } catch (const core::types::ConnectivityException &e) {
            Logger::logWarning("[PrinterService] Printer unreachable: " + std::string(e.what()));
            return false;
        }
    }

    void PrinterService::disconnect() {
        link_->disconnect();
    }

    StatusReport PrinterService::getStatus() const {
        StatusReport report;
        report.linkState = link_->state();
        report.snapshot = cache_->latest();
        report.hasTelemetry = report.snapshot != nullptr;
        return report;
    }

    StatusReport PrinterService::waitForStatus(std::chrono::milliseconds timeout) const {
        cache_->waitForFirst(timeout);
        return getStatus();
    }

    std::string PrinterService::submit(const std::string &filePath, const std::string &printName) {
        return submitter_->submit(filePath, printName);
    }

    ConnectionInfo PrinterService::connectionInfo() const {
        const auto &config = link_->config();
        ConnectionInfo info;
        info.printerIp = config.printerIp;
        info.accessCodeConfigured = !config.accessCode.empty() && config.accessCode.find("${") == std::string::npos;
        info.deviceSerial = config.deviceSerial;
        info.connected = link_->isConnected();
        return info;
    }

} // namespace application
