#pragma once

#include <functional>
#include <memory>
#include <string>

#include "application/config/ConfigManager.hpp"
#include "application/config/LinkConfig.hpp"
#include "application/service/PrinterService.hpp"
#include "core/telemetry/TelemetryChannel.hpp"

/**
 * @class ApplicationController
 * @brief Wires the printer link components and runs one CLI command.
 *
 * Command results are written to stdout as JSON; diagnostics go through Logger.
 * Errors propagate as core::types::PrinterLinkException so main() can pick the exit code.
 */
class ApplicationController {
public:
    ApplicationController();

    ~ApplicationController();

    /**
     * @brief Resolves LinkConfig, loads config.json and the environment, builds the service.
     * @throws core::types::ConfigurationException when the tunables do not validate
     */
    void initialize(const std::string &configPath = "config.json", const std::string &envFilePath = ".env");

    void discover(int timeoutSeconds);

    /**
     * @brief discovery.timeout.s (DISCOVERY_TIMEOUT_S), used when discover is given no timeout
     */
    int discoveryTimeoutSeconds() const { return configManager_.getDiscoveryConfig().timeoutSeconds; }

    /**
     * @brief Connects and prints the status once, waiting up to waitSeconds for a first report.
     */
    void status(int waitSeconds);

    /**
     * @brief Prints every report as one JSON line until waitForShutdown returns.
     */
    void watch(const std::function<void()> &waitForShutdown);

    void print(const std::string &filePath, const std::string &printName);

    void info();

    void shutdown();

private:
    core::config::LinkConfig linkConfig_;
    core::config::ConfigManager configManager_;

    std::shared_ptr<core::telemetry::TelemetryChannel> channel_;
    std::shared_ptr<core::telemetry::TelemetryCache> cache_;
    std::shared_ptr<application::PrinterService> service_;

    bool initialized_ = false;

    void buildComponents();

    /**
     * @throws core::types::ConnectivityException when the printer is unreachable
     */
    void requireConnected();

    static void emit(const nlohmann::json &result);
};
