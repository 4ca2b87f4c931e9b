#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace connector::client {

    struct MqttConnectOptions {
        std::string host;
        uint16_t port = 8883;
        std::string clientId;
        std::string username;
        std::string password;
        uint16_t keepAliveSeconds = 60;
        // Printers present a self-signed certificate. Only this flag turns verification off.
        bool insecureSkipVerify = false;
    };

    /**
     * @brief MQTT session over TLS. Callbacks run on the client's own network thread.
     */
    class MqttClient {
    public:
        using MessageHandler = std::function<void(const std::string &topic, const std::string &payload)>;
        using CloseHandler = std::function<void(const std::string &reason)>;

        /**
         * @brief Connects, completes the TLS handshake and waits for CONNACK.
         * @throws core::types::ConnectivityException on any failure, including a refused CONNACK
         */
        virtual void connect(const MqttConnectOptions &options) = 0;

        /**
         * @brief Sends DISCONNECT when possible and releases socket and thread. Idempotent.
         * Must not be called from a MessageHandler or CloseHandler.
         */
        virtual void disconnect() = 0;

        /**
         * @throws core::types::ConnectivityException when not connected
         */
        virtual void subscribe(const std::string &topic) = 0;

        /**
         * @brief Queues a QoS 0 publish and returns; no acknowledgement is awaited.
         * @throws core::types::ConnectivityException when not connected
         */
        virtual void publish(const std::string &topic, const std::string &payload) = 0;

        virtual bool isConnected() const = 0;

        void setOnMessage(MessageHandler cb) { onMessage_ = std::move(cb); }

        void setOnClose(CloseHandler cb) { onClose_ = std::move(cb); }

        virtual ~MqttClient() = default;

    protected:
        MessageHandler onMessage_;
        CloseHandler onClose_;
    };

    std::shared_ptr<MqttClient> createMqttClient();
}
