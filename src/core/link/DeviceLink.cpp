#include "core/link/DeviceLink.hpp"
#include "core/telemetry/TelemetryParser.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::link {
    using core::types::ConfigurationException;
    using core::types::ConnectivityException;

    DeviceLink::DeviceLink(config::LinkConfig config,
                           std::shared_ptr<connector::client::MqttClient> client,
                           std::shared_ptr<telemetry::TelemetryChannel> channel)
        : config_(std::move(config)), client_(std::move(client)), channel_(std::move(channel)) {
        client_->setOnMessage([this](const std::string &topic, const std::string &payload) {
            handleMessage(topic, payload);
        });
        client_->setOnClose([this](const std::string &reason) {
            handleClose(reason);
        });
    }

    DeviceLink::~DeviceLink() {
        disconnect();
        client_->setOnMessage(nullptr);
        client_->setOnClose(nullptr);
    }

    void DeviceLink::connect() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (state_ == LinkState::Connected && client_->isConnected()) {
            return;
        }

        if (!config_.isComplete()) {
            std::string missing;
            for (const auto &field: config_.missingFields()) {
                missing += (missing.empty() ? "" : ", ") + field;
            }
            throw ConfigurationException("Printer link not configured, missing: " + missing);
        }

        state_ = LinkState::Connecting;

        connector::client::MqttConnectOptions options;
        options.host = config_.printerIp;
        options.port = config_.mqttPort;
        options.clientId = config_.clientId;
        options.username = config_.username;
        options.password = config_.accessCode;
        options.keepAliveSeconds = config_.keepAliveSeconds;
        options.insecureSkipVerify = config_.insecureSkipVerify;

        try {
            client_->connect(options);
            client_->subscribe(config_.reportTopic());
        } catch (const ConnectivityException &e) {
            state_ = LinkState::Disconnected;
            client_->disconnect();
            Logger::logError("[DeviceLink] Connect failed: " + std::string(e.what()));
            throw;
        }

        state_ = LinkState::Connected;
        Logger::logInfo("[DeviceLink] Linked to printer " + config_.deviceSerial + " at " + config_.printerIp);
    }

    void DeviceLink::disconnect() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        client_->disconnect();
        if (state_.exchange(LinkState::Disconnected) != LinkState::Disconnected) {
            Logger::logInfo("[DeviceLink] Link closed");
        }
    }

    void DeviceLink::publish(const models::DeviceCommand &command) {
        if (!isConnected()) {
            throw ConnectivityException("Cannot publish " + command.command + ": link is " + toString(state_));
        }
        client_->publish(config_.requestTopic(), command.serialize());
        Logger::logInfo("[DeviceLink] Sent " + command.command + " (sequence " + command.sequenceId + ")");
    }

    bool DeviceLink::isConnected() const {
        return state_ == LinkState::Connected && client_->isConnected();
    }

    void DeviceLink::handleMessage(const std::string &topic, const std::string &payload) {
        if (topic != config_.reportTopic()) {
            Logger::logDebug("[DeviceLink] Ignoring message on " + topic);
            return;
        }

        telemetry::SnapshotPtr snapshot;
        try {
            snapshot = std::make_shared<const models::TelemetrySnapshot>(
                telemetry::parseReport(payload, std::chrono::system_clock::now()));
        } catch (const core::types::ProtocolException &e) {
            dropped_++;
            Logger::logWarning("[DeviceLink] Dropped malformed report: " + std::string(e.what()));
            return;
        }

        Logger::logDebug("[DeviceLink] Report: " + models::toString(snapshot->status) + " " +
                         std::to_string(snapshot->progress) + "%");
        channel_->publish(snapshot);
    }

    void DeviceLink::handleClose(const std::string &reason) {
        state_ = LinkState::Disconnected;
        Logger::logWarning("[DeviceLink] Link dropped: " + reason);
    }

} // namespace core::link
