#pragma once

#include "DiscoverySource.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace connector::discovery {

    /**
     * @brief Devices found during one discover() call, one per address, first seen wins.
     */
    class DiscoveryResults {
    public:
        /**
         * @return false when a device with the same address is already present
         */
        bool add(const core::models::Device &device);

        std::vector<core::models::Device> snapshot() const;

        size_t size() const;

        /**
         * @brief Waits until something was found and settle passed with no new find,
         * or until deadline. Returns true in the first case.
         */
        bool waitUntilSettled(std::chrono::steady_clock::time_point deadline,
                              std::chrono::milliseconds settle) const;

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable changed_;
        std::vector<core::models::Device> devices_;
        std::chrono::steady_clock::time_point lastFind_;
    };

    /**
     * @brief Runs passive listening and the active scan side by side and merges their finds.
     */
    class DiscoveryService {
    public:
        DiscoveryService(std::shared_ptr<DiscoverySource> passive,
                         std::shared_ptr<DiscoverySource> active,
                         std::chrono::milliseconds settleWindow = std::chrono::milliseconds(1000));

        /**
         * @brief Returns early once finds have settled, otherwise when timeout elapses.
         * Never throws for lack of results; both sources are stopped on every exit path.
         */
        std::vector<core::models::Device> discover(std::chrono::milliseconds timeout);

        std::vector<core::models::Device> discover(int timeoutSeconds) {
            return discover(std::chrono::milliseconds(timeoutSeconds * 1000LL));
        }

    private:
        std::shared_ptr<DiscoverySource> passive_;
        std::shared_ptr<DiscoverySource> active_;
        std::chrono::milliseconds settleWindow_;
        std::mutex discoverMutex_;

        static bool startSource(const std::shared_ptr<DiscoverySource> &source, const DeviceSink &sink);
    };

} // namespace connector::discovery
