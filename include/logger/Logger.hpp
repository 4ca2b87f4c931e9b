#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide log sink. Every line goes to stderr (stdout carries command output);
 * after init() lines are also appended to a size-rotated file under the logs folder.
 */
class Logger {
public:
    /**
     * @brief Opens logs/printer_link_<timestamp>.log and starts the retention thread.
     */
    static void init(const std::string &logsFolder = "logs");

    static void shutdown();

    static void setLevel(LogLevel level);

    static void setDebugEnabled(bool enabled) { setLevel(enabled ? LogLevel::Debug : LogLevel::Info); }

    static bool isDebugEnabled() { return minLevel_ == LogLevel::Debug; }

    static void logDebug(const std::string &message) { log(LogLevel::Debug, message); }

    static void logInfo(const std::string &message) { log(LogLevel::Info, message); }

    static void logWarning(const std::string &message) { log(LogLevel::Warning, message); }

    static void logError(const std::string &message) { log(LogLevel::Error, message); }

    /**
     * @brief Keeps the last two characters of a secret, the rest becomes '*'.
     */
    static std::string mask(const std::string &secret);

private:
    static std::ofstream file_;
    static std::mutex writeMutex_;
    static std::string folder_;
    static size_t fileBytes_;
    static std::atomic<LogLevel> minLevel_;
    static std::atomic<bool> fileEnabled_;
    static std::thread retentionThread_;
    static std::atomic<bool> stopping_;

    static void log(LogLevel level, const std::string &message);

    static void openNewFile();

    static void pruneOldFiles();

    static std::string timestamp(const char *format, bool withMillis);
};
