#pragma once

#include "MqttClient.hpp"
#include <mqtt/connect_options.h>
#include <mqtt/ssl_options.h>
#include <string>

namespace connector::client {

    /**
     * @brief ssl://host:port
     */
    std::string pahoServerUri(const MqttConnectOptions &options);

    /**
     * @brief Chain and host name verification both follow insecureSkipVerify.
     */
    mqtt::ssl_options pahoSslOptions(const MqttConnectOptions &options);

    mqtt::connect_options pahoConnectOptions(const MqttConnectOptions &options);

} // namespace connector::client
