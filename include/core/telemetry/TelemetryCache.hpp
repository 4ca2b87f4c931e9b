#pragma once

#include "TelemetryChannel.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core::telemetry {

    /**
     * @brief Latest snapshot reported by one device.
     *
     * Single writer (the link's delivery thread through the channel), any number of readers.
     * latest() returns nullptr until the first report arrives, which callers must keep
     * apart from an idle printer.
     */
    class TelemetryCache : public ITelemetryObserver {
    public:
        void onTelemetry(const SnapshotPtr &snapshot) override;

        SnapshotPtr latest() const;

        bool hasTelemetry() const { return latest() != nullptr; }

        /**
         * @brief Blocks until a snapshot is present or the timeout expires.
         */
        SnapshotPtr waitForFirst(std::chrono::milliseconds timeout) const;

        void clear();

        size_t updateCount() const { return updates_; }

    private:
        mutable std::mutex snapshotMutex_;
        mutable std::condition_variable firstSnapshot_;
        SnapshotPtr snapshot_;
        std::atomic<size_t> updates_{0};
    };

} // namespace core::telemetry
