#include "connector/client/MqttClient.hpp"
#include "connector/client/PahoOptions.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <mqtt/async_client.h>
#include <mutex>

namespace connector::client {
    using core::types::ConnectivityException;

    std::string pahoServerUri(const MqttConnectOptions &options) {
        return "ssl://" + options.host + ":" + std::to_string(options.port);
    }

    mqtt::ssl_options pahoSslOptions(const MqttConnectOptions &options) {
        // verify() adds the host name check on top of the chain check
        return mqtt::ssl_options_builder()
                .enable_server_cert_auth(!options.insecureSkipVerify)
                .verify(!options.insecureSkipVerify)
                .error_handler([](const std::string &message) {
                    Logger::logError("[MQTT] TLS error: " + message);
                })
                .finalize();
    }

    mqtt::connect_options pahoConnectOptions(const MqttConnectOptions &options) {
        if (options.insecureSkipVerify) {
            Logger::logWarning("[MQTT] TLS certificate verification disabled (self-signed device certificate)");
        }

        return mqtt::connect_options_builder()
                .user_name(options.username)
                .password(options.password)
                .keep_alive_interval(std::chrono::seconds(options.keepAliveSeconds))
                .clean_session(true)
                .ssl(pahoSslOptions(options))
                .finalize();
    }

    class MqttClientPaho : public MqttClient {
    public:
        MqttClientPaho() = default;

        ~MqttClientPaho() override { disconnect(); }

        void connect(const MqttConnectOptions &options) override {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (client_ && client_->is_connected()) return;

            // a session dropped by the network leaves its client behind
            client_.reset();

            endpoint_ = pahoServerUri(options);
            Logger::logInfo("[MQTT] Connecting to " + endpoint_);

            try {
                client_ = std::make_unique<mqtt::async_client>(endpoint_, options.clientId);
                client_->set_message_callback([this](mqtt::const_message_ptr message) {
                    handleMessage(message);
                });
                client_->set_connection_lost_handler([this](const std::string &cause) {
                    handleConnectionLost(cause);
                });

                client_->connect(pahoConnectOptions(options))->wait();
            } catch (const mqtt::exception &e) {
                client_.reset();
                throw ConnectivityException("Connection to " + endpoint_ + " failed: " + e.what());
            }

            Logger::logInfo("[MQTT] Connected to " + endpoint_);
        }

        void disconnect() override {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (!client_) return;

            try {
                if (client_->is_connected()) {
                    client_->disconnect()->wait();
                }
            } catch (const mqtt::exception &e) {
                Logger::logWarning("[MQTT] Disconnect from " + endpoint_ + " was not clean: " + e.what());
            }
            client_.reset();
            Logger::logInfo("[MQTT] Disconnected");
        }

        void subscribe(const std::string &topic) override {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            requireConnected("subscribe");
            try {
                client_->subscribe(topic, 0)->wait();
            } catch (const mqtt::exception &e) {
                throw ConnectivityException("Subscription to " + topic + " failed: " + e.what());
            }
            Logger::logInfo("[MQTT] Subscribed to " + topic);
        }

        void publish(const std::string &topic, const std::string &payload) override {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            requireConnected("publish");
            try {
                client_->publish(topic, payload.data(), payload.size(), 0, false);
            } catch (const mqtt::exception &e) {
                throw ConnectivityException("Publish to " + topic + " failed: " + e.what());
            }
            Logger::logDebug("[MQTT] Published " + std::to_string(payload.size()) + " bytes to " + topic);
        }

        bool isConnected() const override {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            return client_ && client_->is_connected();
        }

    private:
        std::unique_ptr<mqtt::async_client> client_;
        std::string endpoint_;
        mutable std::mutex lifecycleMutex_;

        void requireConnected(const std::string &operation) const {
            if (!client_ || !client_->is_connected()) {
                throw ConnectivityException("Cannot " + operation + ": MQTT client not connected");
            }
        }

        void handleMessage(const mqtt::const_message_ptr &message) {
            if (!message || !onMessage_) return;
            try {
                onMessage_(message->get_topic(), message->to_string());
            } catch (const std::exception &e) {
                Logger::logError("[MQTT] Message handler failed on " + message->get_topic() + ": " + e.what());
            }
        }

        void handleConnectionLost(const std::string &cause) {
            std::string reason = cause.empty() ? "connection lost" : cause;
            Logger::logWarning("[MQTT] Connection to " + endpoint_ + " lost: " + reason);
            if (!onClose_) return;
            try {
                onClose_(reason);
            } catch (const std::exception &e) {
                Logger::logError("[MQTT] Close handler failed: " + std::string(e.what()));
            }
        }
    };

    std::shared_ptr<MqttClient> createMqttClient() {
        return std::make_shared<MqttClientPaho>();
    }

} // namespace connector::client
