#include "logger/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::file_;
std::mutex Logger::writeMutex_;
std::string Logger::folder_ = "logs";
size_t Logger::fileBytes_ = 0;
std::atomic<LogLevel> Logger::minLevel_{LogLevel::Info};
std::atomic<bool> Logger::fileEnabled_{false};
std::thread Logger::retentionThread_;
std::atomic<bool> Logger::stopping_{false};

namespace {
    constexpr size_t MAX_FILE_BYTES = 50 * 1024 * 1024;
    constexpr size_t MAX_FILES = 10;
    constexpr std::chrono::hours RETENTION{24 * 7};
    constexpr std::chrono::hours PRUNE_INTERVAL{1};
    constexpr const char *FILE_PREFIX = "printer_link_";

    std::mutex retentionMutex;
    std::condition_variable retentionWake;

    const char *levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error: return "ERROR";
        }
        return "INFO";
    }

    bool isOwnLogFile(const fs::path &path) {
        return path.extension() == ".log" && path.filename().string().rfind(FILE_PREFIX, 0) == 0;
    }
}

void Logger::init(const std::string &logsFolder) {
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        folder_ = logsFolder;
        openNewFile();
        fileEnabled_ = file_.is_open();
    }

    stopping_ = false;
    if (!retentionThread_.joinable()) {
        retentionThread_ = std::thread([]() {
            std::unique_lock<std::mutex> lock(retentionMutex);
            do {
                lock.unlock();
                pruneOldFiles();
                lock.lock();
            } while (!retentionWake.wait_for(lock, PRUNE_INTERVAL, [] { return stopping_.load(); }));
        });
    }
    logDebug("[Logger] Writing to " + folder_ + " (rotation at " + std::to_string(MAX_FILE_BYTES / 1024 / 1024) + "MB)");
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(retentionMutex);
        stopping_ = true;
    }
    retentionWake.notify_all();
    if (retentionThread_.joinable()) {
        retentionThread_.join();
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    fileEnabled_ = false;
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::setLevel(LogLevel level) {
    minLevel_ = level;
}

std::string Logger::mask(const std::string &secret) {
    if (secret.empty()) return "<unset>";
    if (secret.size() <= 2) return std::string(secret.size(), '*');
    return std::string(secret.size() - 2, '*') + secret.substr(secret.size() - 2);
}

void Logger::log(LogLevel level, const std::string &message) {
    if (level < minLevel_) return;
    if (message.find_first_not_of(" \t\r\n") == std::string::npos) return;

    std::string line = "[" + std::string(levelName(level)) + "] [" +
                       timestamp("%Y-%m-%d %H:%M:%S", true) + "] " + message;

    std::lock_guard<std::mutex> lock(writeMutex_);
    std::cerr << line << '\n';

    if (!fileEnabled_) return;
    if (fileBytes_ > MAX_FILE_BYTES) {
        openNewFile();
    }
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
        fileBytes_ += line.size() + 1;
    }
}

void Logger::openNewFile() {
    if (file_.is_open()) {
        file_.close();
    }
    fileBytes_ = 0;

    std::error_code ec;
    fs::create_directories(folder_, ec);
    if (ec) {
        std::cerr << "[Logger] ERROR: Cannot create logs folder " << folder_ << ": " << ec.message() << std::endl;
        return;
    }

    std::string path = folder_ + "/" + FILE_PREFIX + timestamp("%Y%m%d_%H%M%S", false) + ".log";
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << path << std::endl;
    }
}

void Logger::pruneOldFiles() {
    std::string folder;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        folder = folder_;
    }

    try {
        if (!fs::exists(folder)) return;

        auto cutoff = fs::file_time_type::clock::now() - RETENTION;
        std::vector<fs::directory_entry> kept;

        for (const auto &entry: fs::directory_iterator(folder)) {
            if (!entry.is_regular_file() || !isOwnLogFile(entry.path())) continue;
            if (entry.last_write_time() < cutoff) {
                fs::remove(entry.path());
            } else {
                kept.push_back(entry);
            }
        }

        if (kept.size() <= MAX_FILES) return;

        std::sort(kept.begin(), kept.end(), [](const fs::directory_entry &a, const fs::directory_entry &b) {
            return a.last_write_time() < b.last_write_time();
        });
        for (size_t i = 0; i + MAX_FILES < kept.size(); ++i) {
            fs::remove(kept[i].path());
        }
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Retention error: " << e.what() << std::endl;
    }
}

std::string Logger::timestamp(const char *format, bool withMillis) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, format);
    if (withMillis) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        oss << '.' << std::setw(3) << std::setfill('0') << millis;
    }
    return oss.str();
}
