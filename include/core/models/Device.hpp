#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace core::models {

    inline const std::string UNKNOWN_MODEL = "unknown";

    /**
     * @brief A printer candidate found on the local network.
     *
     * Immutable after construction. Two devices are the same printer when their
     * addresses match, whatever port or discovery path produced them.
     */
    class Device {
    public:
        Device(std::string name, std::string address, uint16_t port, std::string model = UNKNOWN_MODEL)
            : name_(std::move(name)), address_(std::move(address)), port_(port),
              model_(model.empty() ? UNKNOWN_MODEL : std::move(model)),
              id_(address_ + ":" + std::to_string(port_)) {
        }

        const std::string &id() const { return id_; }

        const std::string &name() const { return name_; }

        const std::string &address() const { return address_; }

        uint16_t port() const { return port_; }

        const std::string &model() const { return model_; }

        bool sameAddress(const Device &other) const { return address_ == other.address_; }

        nlohmann::json toJson() const {
            return nlohmann::json{
                {"id", id_},
                {"name", name_},
                {"ip", address_},
                {"port", port_},
                {"model", model_}
            };
        }

    private:
        std::string name_;
        std::string address_;
        uint16_t port_;
        std::string model_;
        std::string id_;
    };

} // namespace core::models
