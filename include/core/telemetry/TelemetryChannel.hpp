#pragma once

#include "core/models/TelemetrySnapshot.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace core::telemetry {

    using SnapshotPtr = std::shared_ptr<const models::TelemetrySnapshot>;

    class ITelemetryObserver {
    public:
        virtual ~ITelemetryObserver() = default;

        virtual void onTelemetry(const SnapshotPtr &snapshot) = 0;
    };

    /**
     * @brief Fan-out of decoded snapshots from one Device Link.
     *
     * Observers are held weakly; expired ones are dropped on the next publish.
     */
    class TelemetryChannel {
    public:
        void subscribe(const std::shared_ptr<ITelemetryObserver> &observer) {
            std::lock_guard<std::mutex> lock(observersMutex_);
            observers_.push_back(observer);
        }

        void publish(const SnapshotPtr &snapshot) {
            std::vector<std::shared_ptr<ITelemetryObserver>> active;
            {
                std::lock_guard<std::mutex> lock(observersMutex_);
                auto it = observers_.begin();
                while (it != observers_.end()) {
                    if (auto observer = it->lock()) {
                        active.push_back(std::move(observer));
                        ++it;
                    } else {
                        it = observers_.erase(it);
                    }
                }
            }
            // Notify outside the lock so an observer may subscribe others
            for (const auto &observer: active) {
                observer->onTelemetry(snapshot);
            }
        }

        size_t observerCount() const {
            std::lock_guard<std::mutex> lock(observersMutex_);
            return observers_.size();
        }

    private:
        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<ITelemetryObserver>> observers_;
    };

} // namespace core::telemetry
