#include "application/controllers/ApplicationController.hpp"
#include "connector/client/MqttClient.hpp"
#include "connector/discovery/MdnsBrowser.hpp"
#include "connector/discovery/NetworkScanner.hpp"
#include "core/job/FtpFileTransfer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <iostream>
#include <mutex>

namespace {
    /**
     * @brief Writes each snapshot to stdout as a single JSON line.
     */
    class TelemetryPrinter : public core::telemetry::ITelemetryObserver {
    public:
        void onTelemetry(const core::telemetry::SnapshotPtr &snapshot) override {
            std::lock_guard<std::mutex> lock(outputMutex_);
            std::cout << snapshot->toJson().dump() << std::endl;
        }

    private:
        std::mutex outputMutex_;
    };
}

ApplicationController::ApplicationController() = default;

ApplicationController::~ApplicationController() {
    shutdown();
}

void ApplicationController::initialize(const std::string &configPath, const std::string &envFilePath) {
    linkConfig_.resolveFromEnvironment(envFilePath);

    configManager_.loadFromFile(configPath);
    configManager_.loadFromEnv();

    auto logging = configManager_.getLoggingConfig();
    Logger::setDebugEnabled(logging.debug);
    if (logging.toFile) {
        Logger::init(logging.folder);
    }

    auto validation = configManager_.validate();
    if (!validation.isValid) {
        std::string errors;
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Invalid setting: " + error);
            errors += (errors.empty() ? "" : "; ") + error;
        }
        throw core::types::ConfigurationException("Invalid configuration: " + errors);
    }

    linkConfig_.printConfig();
    buildComponents();
    initialized_ = true;
}

void ApplicationController::buildComponents() {
    auto discoveryConfig = configManager_.getDiscoveryConfig();
    auto scannerConfig = configManager_.getScannerConfig();

    connector::discovery::MdnsOptions mdnsOptions;
    mdnsOptions.serviceTypes = discoveryConfig.serviceTypes;

    connector::discovery::ScanOptions scanOptions;
    scanOptions.ports = scannerConfig.ports;
    scanOptions.windowRadius = scannerConfig.windowRadius;
    scanOptions.maxConcurrent = static_cast<size_t>(scannerConfig.maxConcurrent);
    scanOptions.connectTimeout = std::chrono::milliseconds(scannerConfig.connectTimeoutMs);

    auto discovery = std::make_shared<connector::discovery::DiscoveryService>(
        std::make_shared<connector::discovery::MdnsBrowser>(mdnsOptions),
        std::make_shared<connector::discovery::NetworkScanSource>(scanOptions),
        std::chrono::milliseconds(discoveryConfig.settleMs));

    channel_ = std::make_shared<core::telemetry::TelemetryChannel>();
    cache_ = std::make_shared<core::telemetry::TelemetryCache>();
    channel_->subscribe(cache_);

    auto link = std::make_shared<core::link::DeviceLink>(linkConfig_, connector::client::createMqttClient(), channel_);
    auto submitter = std::make_shared<core::job::JobSubmitter>(
        link, std::make_shared<core::job::FtpFileTransfer>(linkConfig_));

    service_ = std::make_shared<application::PrinterService>(discovery, link, cache_, submitter);
    Logger::logInfo("[ApplicationController] Components ready");
}

void ApplicationController::discover(int timeoutSeconds) {
    auto devices = service_->discover(timeoutSeconds);

    nlohmann::json result = nlohmann::json::array();
    for (const auto &device: devices) {
        result.push_back(device.toJson());
    }
    emit(result);
}

void ApplicationController::status(int waitSeconds) {
    requireConnected();
    emit(service_->waitForStatus(std::chrono::seconds(waitSeconds)).toJson());
}

void ApplicationController::watch(const std::function<void()> &waitForShutdown) {
    auto printer = std::make_shared<TelemetryPrinter>();
    channel_->subscribe(printer);
    requireConnected();

    Logger::logInfo("[ApplicationController] Watching telemetry, press Ctrl+C to stop");
    waitForShutdown();
}

void ApplicationController::print(const std::string &filePath, const std::string &printName) {
    std::string jobId = service_->submit(filePath, printName);
    emit(nlohmann::json{
        {"job_id", jobId},
        {"print_name", printName},
        {"remote_file", core::job::JobSubmitter::remoteFileName(printName)}
    });
}

void ApplicationController::info() {
    emit(service_->connectionInfo().toJson());
}

void ApplicationController::shutdown() {
    if (initialized_) {
        initialized_ = false;
        if (service_) {
            service_->disconnect();
        }
        Logger::logInfo("[ApplicationController] Shutdown complete");
    }
    // init() may have started the retention thread before a validation failure
    Logger::shutdown();
}

void ApplicationController::requireConnected() {
    if (!service_->connect()) {
        throw core::types::ConnectivityException("Cannot reach printer at " + linkConfig_.printerIp);
    }
}

void ApplicationController::emit(const nlohmann::json &result) {
    std::cout << result.dump(2) << std::endl;
}
