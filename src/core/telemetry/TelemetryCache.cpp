#include "core/telemetry/TelemetryCache.hpp"

namespace core::telemetry {

    void TelemetryCache::onTelemetry(const SnapshotPtr &snapshot) {
        if (!snapshot) return;
        {
            std::lock_guard<std::mutex> lock(snapshotMutex_);
            snapshot_ = snapshot;
        }
        updates_++;
        firstSnapshot_.notify_all();
    }

    SnapshotPtr TelemetryCache::latest() const {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        return snapshot_;
    }

    SnapshotPtr TelemetryCache::waitForFirst(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(snapshotMutex_);
        firstSnapshot_.wait_for(lock, timeout, [this] { return snapshot_ != nullptr; });
        return snapshot_;
    }

    void TelemetryCache::clear() {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_.reset();
    }

} // namespace core::telemetry
