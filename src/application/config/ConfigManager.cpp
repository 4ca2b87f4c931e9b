#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

namespace core::config {
    namespace {
        struct EnvMapping {
            const char *variable;
            const char *key;
        };

        const EnvMapping ENV_MAPPINGS[] = {
            {"DISCOVERY_TIMEOUT_S", "discovery.timeout.s"},
            {"DISCOVERY_SETTLE_MS", "discovery.settle.ms"},
            {"DISCOVERY_SERVICE_TYPES", "discovery.service.types"},
            {"SCANNER_PORTS", "scanner.ports"},
            {"SCANNER_WINDOW_RADIUS", "scanner.window.radius"},
            {"SCANNER_MAX_CONCURRENT", "scanner.max.concurrent"},
            {"SCANNER_CONNECT_TIMEOUT_MS", "scanner.connect.timeout.ms"},
            {"LOG_DEBUG", "logging.debug"},
            {"LOG_TO_FILE", "logging.to.file"},
            {"LOG_FOLDER", "logging.folder"}
        };

        std::string trim(const std::string &value) {
            auto first = value.find_first_not_of(" \t");
            if (first == std::string::npos) return "";
            auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;

        if (!std::filesystem::exists(configPath)) {
            Logger::logInfo("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            size_t loaded = 0;
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        config_[key] = it.value().get<std::string>();
                        loaded++;
                    } else {
                        config_[key] = it.value().dump();
                        loaded++;
                    }
                }
            };

            flatten(json, "");
            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config, keeping defaults: " + std::string(e.what()));
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const auto &mapping: ENV_MAPPINGS) {
            const char *value = std::getenv(mapping.variable);
            if (value) {
                config_[mapping.key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    std::vector<std::string> ConfigManager::getList(const std::string &key) const {
        std::string raw = get<std::string>(key, "");
        std::vector<std::string> items;
        if (raw.empty()) return items;

        if (raw.front() == '[') {
            try {
                for (const auto &item: nlohmann::json::parse(raw)) {
                    items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
                }
            } catch (const nlohmann::json::exception &e) {
                Logger::logWarning("[ConfigManager] Invalid list for " + key + ": " + e.what());
            }
            return items;
        }

        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }
        return items;
    }

    DiscoveryConfig ConfigManager::getDiscoveryConfig() const {
        DiscoveryConfig config;
        config.timeoutSeconds = get<int>("discovery.timeout.s", 5);
        config.settleMs = get<int>("discovery.settle.ms", 1000);
        auto types = getList("discovery.service.types");
        if (!types.empty()) config.serviceTypes = types;
        return config;
    }

    ScannerConfig ConfigManager::getScannerConfig() const {
        ScannerConfig config;
        config.windowRadius = get<int>("scanner.window.radius", 25);
        config.maxConcurrent = get<int>("scanner.max.concurrent", 20);
        config.connectTimeoutMs = get<int>("scanner.connect.timeout.ms", 1000);

        std::vector<uint16_t> ports;
        for (const auto &item: getList("scanner.ports")) {
            try {
                int port = std::stoi(item);
                if (port > 0 && port <= 65535) ports.push_back(static_cast<uint16_t>(port));
            } catch (const std::exception &) {
                Logger::logWarning("[ConfigManager] Ignoring invalid scanner port: " + item);
            }
        }
        config.ports = ports;
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.debug = get<bool>("logging.debug", false);
        config.toFile = get<bool>("logging.to.file", true);
        config.folder = get<std::string>("logging.folder", "logs");
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;
        auto discovery = getDiscoveryConfig();
        auto scanner = getScannerConfig();

        if (discovery.timeoutSeconds <= 0) {
            result.errors.push_back("discovery.timeout.s must be > 0");
        }
        if (discovery.settleMs < 0) {
            result.errors.push_back("discovery.settle.ms must be >= 0");
        }
        if (scanner.maxConcurrent < 1 || scanner.maxConcurrent > 20) {
            result.errors.push_back("scanner.max.concurrent must be between 1 and 20");
        }
        if (scanner.connectTimeoutMs <= 0) {
            result.errors.push_back("scanner.connect.timeout.ms must be > 0");
        }
        if (scanner.windowRadius < 0 || scanner.windowRadius > 127) {
            result.errors.push_back("scanner.window.radius must be between 0 and 127");
        }
        if (scanner.ports.empty()) {
            result.errors.push_back("scanner.ports must list at least one port");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        config_["discovery.timeout.s"] = "5";
        config_["discovery.settle.ms"] = "1000";
        config_["discovery.service.types"] =
                R"(["_bambu._tcp.local.","_printer._tcp.local.","_ipp._tcp.local.","_http._tcp.local."])";

        config_["scanner.ports"] = "[8883,1883,80,443]";
        config_["scanner.window.radius"] = "25";
        config_["scanner.max.concurrent"] = "20";
        config_["scanner.connect.timeout.ms"] = "1000";

        config_["logging.debug"] = "false";
        config_["logging.to.file"] = "true";
        config_["logging.folder"] = "logs";
    }
} // namespace core::config
