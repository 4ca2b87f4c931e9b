#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace core::config {

    /**
     * @brief Connection settings for one printer.
     *
     * String members start as ${ENV_VAR:default} placeholders; resolveFromEnvironment()
     * replaces them with the environment (after loading .env) or the default.
     */
    struct LinkConfig {
        std::string printerIp = "${BAMBU_PRINTER_IP:}";
        std::string accessCode = "${BAMBU_ACCESS_CODE:}";
        std::string deviceSerial = "${BAMBU_DEVICE_SERIAL:}";
        std::string username = "${BAMBU_USERNAME:bblp}";
        std::string clientId = "${BAMBU_CLIENT_ID:printer_link}";
        std::string userTag = "${BAMBU_USER_TAG:BambuAgent}";

        uint16_t mqttPort = 8883;
        uint16_t ftpPort = 990;
        uint16_t keepAliveSeconds = 60;
        bool ftpImplicitTls = false;

        /**
         * The printer's control channel uses a self-signed certificate, so verification
         * is off unless BAMBU_TLS_INSECURE=false. Kept as an explicit setting so the
         * relaxation is visible in configuration and logs.
         */
        bool insecureSkipVerify = true;

        void resolveFromEnvironment(const std::string &envFilePath = ".env");

        /**
         * @brief True when address, access code and serial are all set
         */
        bool isComplete() const;

        std::vector<std::string> missingFields() const;

        std::string reportTopic() const { return "device/" + deviceSerial + "/report"; }

        std::string requestTopic() const { return "device/" + deviceSerial + "/request"; }

        /**
         * @brief Logs the configuration with the access code masked
         */
        void printConfig() const;

        /**
         * @brief Resolve every ${VAR:default} in value
         */
        static std::string resolvePlaceholder(const std::string &value);

        /**
         * @brief Export KEY=VALUE lines into the environment without overriding existing variables
         */
        static void loadEnvFile(const std::string &envFilePath = ".env");

    private:
        static bool isSet(const std::string &value);
    };

}
