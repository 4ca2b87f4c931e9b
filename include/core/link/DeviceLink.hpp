#pragma once

#include "application/config/LinkConfig.hpp"
#include "connector/client/MqttClient.hpp"
#include "core/models/DeviceCommand.hpp"
#include "core/telemetry/TelemetryChannel.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace core::link {

    enum class LinkState {
        Disconnected,
        Connecting,
        Connected
    };

    inline std::string toString(LinkState state) {
        switch (state) {
            case LinkState::Disconnected: return "disconnected";
            case LinkState::Connecting: return "connecting";
            case LinkState::Connected: return "connected";
        }
        return "unknown";
    }

    /**
     * @brief Authenticated control channel to one printer.
     *
     * Reports arriving on device/{serial}/report are decoded and published on the telemetry
     * channel from the client's network thread. Reconnection is left to the caller.
     */
    class DeviceLink {
    public:
        DeviceLink(config::LinkConfig config,
                   std::shared_ptr<connector::client::MqttClient> client,
                   std::shared_ptr<telemetry::TelemetryChannel> channel);

        ~DeviceLink();

        DeviceLink(const DeviceLink &) = delete;

        DeviceLink &operator=(const DeviceLink &) = delete;

        /**
         * @brief Connects and subscribes to the report topic. No-op when already connected.
         * @throws core::types::ConfigurationException before any network call if address,
         *         access code or serial is missing
         * @throws core::types::ConnectivityException when the broker cannot be reached
         */
        void connect();

        /**
         * @brief Idempotent; releases the client's socket and thread.
         */
        void disconnect();

        /**
         * @brief Hands the command to the transport for the request topic. No reply is awaited.
         * @throws core::types::ConnectivityException when the link is down
         */
        void publish(const models::DeviceCommand &command);

        bool isConnected() const;

        LinkState state() const { return state_; }

        const config::LinkConfig &config() const { return config_; }

        size_t droppedMessages() const { return dropped_; }

    private:
        config::LinkConfig config_;
        std::shared_ptr<connector::client::MqttClient> client_;
        std::shared_ptr<telemetry::TelemetryChannel> channel_;

        std::mutex lifecycleMutex_;
        std::atomic<LinkState> state_{LinkState::Disconnected};
        std::atomic<size_t> dropped_{0};

        void handleMessage(const std::string &topic, const std::string &payload);

        void handleClose(const std::string &reason);
    };

} // namespace core::link
