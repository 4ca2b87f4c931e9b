#pragma once

#include "application/config/LinkConfig.hpp"
#include "connector/client/MqttClient.hpp"
#include "connector/discovery/DiscoverySource.hpp"
#include "core/job/FileTransfer.hpp"
#include "core/types/Error.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace test_support {

    class FakeMqttClient : public connector::client::MqttClient {
    public:
        std::optional<std::string> failConnectWith;
        std::vector<connector::client::MqttConnectOptions> connectCalls;
        std::vector<std::string> subscriptions;
        std::vector<std::pair<std::string, std::string>> published;
        int disconnectCalls = 0;

        void connect(const connector::client::MqttConnectOptions &options) override {
            connectCalls.push_back(options);
            if (failConnectWith) {
                throw core::types::ConnectivityException(*failConnectWith);
            }
            connected_ = true;
        }

        void disconnect() override {
            disconnectCalls++;
            connected_ = false;
        }

        void subscribe(const std::string &topic) override {
            if (!connected_) throw core::types::ConnectivityException("not connected");
            subscriptions.push_back(topic);
        }

        void publish(const std::string &topic, const std::string &payload) override {
            if (!connected_) throw core::types::ConnectivityException("not connected");
            published.emplace_back(topic, payload);
        }

        bool isConnected() const override { return connected_; }

        void deliver(const std::string &topic, const std::string &payload) {
            if (onMessage_) onMessage_(topic, payload);
        }

        void dropConnection(const std::string &reason) {
            connected_ = false;
            if (onClose_) onClose_(reason);
        }

    private:
        std::atomic<bool> connected_{false};
    };

    class FakeFileTransfer : public core::job::FileTransfer {
    public:
        std::optional<std::string> failWith;
        std::vector<std::pair<std::string, std::string>> uploads;

        void upload(const std::string &localPath, const std::string &remoteName) override {
            uploads.emplace_back(localPath, remoteName);
            if (failWith) {
                throw core::types::TransferException(*failWith);
            }
        }
    };

    /**
     * @brief Emits a scripted list of devices from its own thread, each after its delay.
     */
    class ScriptedSource : public connector::discovery::DiscoverySource {
    public:
        struct Step {
            std::chrono::milliseconds delay;
            core::models::Device device;
        };

        explicit ScriptedSource(std::string name, std::vector<Step> steps = {})
            : name_(std::move(name)), steps_(std::move(steps)) {
        }

        ~ScriptedSource() override { stopDiscovery(); }

        bool failOnStart = false;
        std::atomic<int> startCalls{0};
        std::atomic<int> stopCalls{0};

        void startDiscovery(connector::discovery::DeviceSink sink) override {
            startCalls++;
            if (failOnStart) {
                throw core::types::ConnectivityException(name_ + " cannot start");
            }
            cancelled_ = false;
            running_ = true;
            worker_ = std::thread([this, sink = std::move(sink)]() {
                for (const auto &step: steps_) {
                    if (!sleepUnlessCancelled(step.delay)) break;
                    sink(step.device);
                }
            });
        }

        void stopDiscovery() override {
            stopCalls++;
            cancelled_ = true;
            if (worker_.joinable()) worker_.join();
            running_ = false;
        }

        bool isDiscovering() const override { return running_; }

        std::string getSourceName() const override { return name_; }

    private:
        std::string name_;
        std::vector<Step> steps_;
        std::thread worker_;
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> running_{false};

        bool sleepUnlessCancelled(std::chrono::milliseconds delay) {
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (cancelled_) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return !cancelled_;
        }
    };

    inline core::config::LinkConfig completeLinkConfig() {
        core::config::LinkConfig config;
        config.printerIp = "192.168.1.50";
        config.accessCode = "12345678";
        config.deviceSerial = "01S00A000000001";
        config.username = "bblp";
        config.clientId = "printer_link_test";
        config.userTag = "BambuAgent";
        return config;
    }

} // namespace test_support
