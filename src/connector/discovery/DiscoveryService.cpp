#include "connector/discovery/DiscoveryService.hpp"
#include "logger/Logger.hpp"
#include <algorithm>

namespace connector::discovery {
    namespace {
        // Stops every started source when discover() leaves, whatever the path
        class SourceGuard {
        public:
            void track(const std::shared_ptr<DiscoverySource> &source) { sources_.push_back(source); }

            ~SourceGuard() {
                for (const auto &source: sources_) {
                    try {
                        source->stopDiscovery();
                    } catch (const std::exception &e) {
                        Logger::logError("[DiscoveryService] Failed to stop " + source->getSourceName() + ": " +
                                         e.what());
                    }
                }
            }

        private:
            std::vector<std::shared_ptr<DiscoverySource>> sources_;
        };
    }

    bool DiscoveryResults::add(const core::models::Device &device) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool known = std::any_of(devices_.begin(), devices_.end(), [&](const core::models::Device &existing) {
                return existing.sameAddress(device);
            });
            if (known) return false;

            devices_.push_back(device);
            lastFind_ = std::chrono::steady_clock::now();
        }
        changed_.notify_all();
        return true;
    }

    std::vector<core::models::Device> DiscoveryResults::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_;
    }

    size_t DiscoveryResults::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.size();
    }

    bool DiscoveryResults::waitUntilSettled(std::chrono::steady_clock::time_point deadline,
                                            std::chrono::milliseconds settle) const {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            auto now = std::chrono::steady_clock::now();
            auto wakeAt = deadline;

            if (!devices_.empty()) {
                auto settledAt = lastFind_ + settle;
                if (now >= settledAt) return true;
                wakeAt = std::min(settledAt, deadline);
            }
            if (now >= deadline) return false;

            changed_.wait_until(lock, wakeAt);
        }
    }

    DiscoveryService::DiscoveryService(std::shared_ptr<DiscoverySource> passive,
                                       std::shared_ptr<DiscoverySource> active,
                                       std::chrono::milliseconds settleWindow)
        : passive_(std::move(passive)), active_(std::move(active)), settleWindow_(settleWindow) {
    }

    std::vector<core::models::Device> DiscoveryService::discover(std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(discoverMutex_);

        Logger::logInfo("[DiscoveryService] Starting discovery (timeout " + std::to_string(timeout.count()) + "ms)");
        auto started = std::chrono::steady_clock::now();
        auto deadline = started + timeout;

        auto results = std::make_shared<DiscoveryResults>();
        DeviceSink sink = [results](const core::models::Device &device) {
            if (results->add(device)) {
                Logger::logInfo("[DiscoveryService] Discovered " + device.name() + " at " + device.id());
            } else {
                Logger::logDebug("[DiscoveryService] Duplicate address ignored: " + device.id());
            }
        };

        std::vector<core::models::Device> devices;
        {
            SourceGuard guard;
            for (const auto &source: {passive_, active_}) {
                if (startSource(source, sink)) guard.track(source);
            }

            bool settled = results->waitUntilSettled(deadline, settleWindow_);
            if (!settled) {
                Logger::logInfo("[DiscoveryService] Discovery timeout after " + std::to_string(timeout.count()) + "ms");
            }
            devices = results->snapshot();
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        Logger::logInfo("[DiscoveryService] Discovery completed in " + std::to_string(elapsed.count()) + "ms. Found " +
                        std::to_string(devices.size()) + " printer(s).");
        return devices;
    }

    bool DiscoveryService::startSource(const std::shared_ptr<DiscoverySource> &source, const DeviceSink &sink) {
        if (!source) return false;
        try {
            source->startDiscovery(sink);
            return true;
        } catch (const std::exception &e) {
            Logger::logWarning("[DiscoveryService] " + source->getSourceName() + " unavailable: " + e.what());
            // a half-started source still holds resources
            try {
                source->stopDiscovery();
            } catch (const std::exception &stopError) {
                Logger::logError("[DiscoveryService] Cleanup of " + source->getSourceName() + " failed: " +
                                 stopError.what());
            }
            return false;
        }
    }

} // namespace connector::discovery
