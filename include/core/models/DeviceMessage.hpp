#pragma once

#include "core/types/Error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace core::models {

    /**
     * @brief JSON document exchanged with the printer over its control channel.
     */
    class DeviceMessage {
    public:
        virtual ~DeviceMessage() = default;

        virtual nlohmann::json toJson() const = 0;

        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;

        virtual std::string getTypeName() const = 0;

        /**
         * @brief Wire text of the message.
         * @throws core::types::ProtocolException when required fields are empty
         */
        std::string serialize() const {
            if (!isValid()) {
                throw types::ProtocolException(getTypeName() + " is missing required fields");
            }
            return toJson().dump();
        }
    };

} // namespace core::models
