#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::config {
    struct DiscoveryConfig {
        int timeoutSeconds = 5;
        int settleMs = 1000; // quiet period after the last find
        std::vector<std::string> serviceTypes{
            "_bambu._tcp.local.", "_printer._tcp.local.", "_ipp._tcp.local.", "_http._tcp.local."
        };
    };

    struct ScannerConfig {
        std::vector<uint16_t> ports{8883, 1883, 80, 443};
        int windowRadius = 25;
        int maxConcurrent = 20;
        int connectTimeoutMs = 1000;
    };

    struct LoggingConfig {
        bool debug = false;
        bool toFile = true;
        std::string folder = "logs";
    };

    /**
     * @brief Tunables from an optional JSON file, overridden by environment variables.
     *
     * Nested JSON keys are flattened to dotted keys ("scanner.max.concurrent");
     * arrays keep their JSON text. Owned by the application, not a singleton.
     */
    class ConfigManager {
    public:
        ConfigManager();

        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        void set(const std::string &key, const std::string &value);

        DiscoveryConfig getDiscoveryConfig() const;

        ScannerConfig getScannerConfig() const;

        LoggingConfig getLoggingConfig() const;

        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();

        std::vector<std::string> getList(const std::string &key) const;
    };

    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }
} // namespace core::config
