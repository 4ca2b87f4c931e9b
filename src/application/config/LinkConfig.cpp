#include "application/config/LinkConfig.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace core::config {
    namespace {
        uint16_t resolvePort(const std::string &placeholder, uint16_t fallback) {
            std::string value = LinkConfig::resolvePlaceholder(placeholder);
            try {
                int port = std::stoi(value);
                if (port > 0 && port <= 65535) return static_cast<uint16_t>(port);
            } catch (const std::exception &) {
            }
            Logger::logWarning("[LinkConfig] Invalid port '" + value + "', using " + std::to_string(fallback));
            return fallback;
        }

        bool resolveFlag(const std::string &placeholder) {
            std::string value = LinkConfig::resolvePlaceholder(placeholder);
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value == "true" || value == "1" || value == "yes";
        }
    }

    std::string LinkConfig::resolvePlaceholder(const std::string &value) {
        std::regex placeholder_regex(R"(\$\{([^}:]+):([^}]*)\})");
        std::string result = value;

        std::smatch matches;
        while (std::regex_search(result, matches, placeholder_regex)) {
            std::string varName = matches[1].str();
            std::string defaultValue = matches[2].str();
            std::string fullMatch = matches[0].str();

            const char *envValue = std::getenv(varName.c_str());
            std::string replacement = envValue ? envValue : defaultValue;

            if (envValue) {
                Logger::logDebug("[LinkConfig] Resolved " + varName + " from environment");
            } else {
                Logger::logDebug("[LinkConfig] Using default for " + varName);
            }

            size_t pos = result.find(fullMatch);
            if (pos != std::string::npos) {
                result.replace(pos, fullMatch.length(), replacement);
            }
        }

        return result;
    }

    void LinkConfig::loadEnvFile(const std::string &envFilePath) {
        std::ifstream envFile(envFilePath);
        if (!envFile.is_open()) {
            Logger::logInfo("[LinkConfig] No .env file found at: " + envFilePath + " (using system environment only)");
            return;
        }

        std::string line;
        int loadedVars = 0;

        while (std::getline(envFile, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            if (line.rfind("export ", 0) == 0) line = line.substr(7);

            size_t pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (key.empty()) continue;
            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                loadedVars++;
            } else {
                Logger::logDebug("[LinkConfig] Skipped (already set): " + key);
            }
        }

        Logger::logInfo("[LinkConfig] Loaded " + std::to_string(loadedVars) + " variables from " + envFilePath);
    }

    void LinkConfig::resolveFromEnvironment(const std::string &envFilePath) {
        loadEnvFile(envFilePath);

        printerIp = resolvePlaceholder(printerIp);
        accessCode = resolvePlaceholder(accessCode);
        deviceSerial = resolvePlaceholder(deviceSerial);
        username = resolvePlaceholder(username);
        clientId = resolvePlaceholder(clientId);
        userTag = resolvePlaceholder(userTag);

        mqttPort = resolvePort("${BAMBU_MQTT_PORT:" + std::to_string(mqttPort) + "}", mqttPort);
        ftpPort = resolvePort("${BAMBU_FTP_PORT:" + std::to_string(ftpPort) + "}", ftpPort);
        ftpImplicitTls = resolveFlag(std::string("${BAMBU_FTP_IMPLICIT_TLS:") + (ftpImplicitTls ? "true" : "false") + "}");
        insecureSkipVerify = resolveFlag(std::string("${BAMBU_TLS_INSECURE:") + (insecureSkipVerify ? "true" : "false") + "}");

        Logger::logInfo("[LinkConfig] All placeholders resolved");
    }

    bool LinkConfig::isSet(const std::string &value) {
        return !value.empty() && value.rfind("${", 0) != 0;
    }

    bool LinkConfig::isComplete() const {
        return missingFields().empty();
    }

    std::vector<std::string> LinkConfig::missingFields() const {
        std::vector<std::string> missing;
        if (!isSet(printerIp)) missing.emplace_back("BAMBU_PRINTER_IP");
        if (!isSet(accessCode)) missing.emplace_back("BAMBU_ACCESS_CODE");
        if (!isSet(deviceSerial)) missing.emplace_back("BAMBU_DEVICE_SERIAL");
        return missing;
    }

    void LinkConfig::printConfig() const {
        Logger::logInfo("[LinkConfig] Final configuration:");
        Logger::logInfo("  Printer IP: " + (isSet(printerIp) ? printerIp : std::string("<unset>")));
        Logger::logInfo("  Device Serial: " + (isSet(deviceSerial) ? deviceSerial : std::string("<unset>")));
        Logger::logInfo("  Username: " + username);
        Logger::logInfo("  Access Code: " + Logger::mask(isSet(accessCode) ? accessCode : ""));
        Logger::logInfo("  MQTT Port: " + std::to_string(mqttPort) + " (TLS, verification " +
                        (insecureSkipVerify ? "disabled" : "enabled") + ")");
        Logger::logInfo("  FTP Port: " + std::to_string(ftpPort) + (ftpImplicitTls ? " (implicit TLS)" : " (plain)"));
        Logger::logInfo("  Client ID: " + clientId);
    }

}
