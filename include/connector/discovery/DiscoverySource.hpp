#pragma once

#include "core/models/Device.hpp"
#include <functional>
#include <string>

namespace connector::discovery {

    using DeviceSink = std::function<void(const core::models::Device &)>;

    /**
     * @brief One way of finding printers (passive listening or active probing)
     */
    class DiscoverySource {
    public:
        virtual ~DiscoverySource() = default;

        /**
         * @brief Starts searching in the background. Every find is handed to sink,
         * possibly from another thread and possibly more than once per address.
         */
        virtual void startDiscovery(DeviceSink sink) = 0;

        /**
         * @brief Stops searching and releases sockets and threads. Safe to call repeatedly.
         */
        virtual void stopDiscovery() = 0;

        virtual bool isDiscovering() const = 0;

        virtual std::string getSourceName() const = 0;
    };

} // namespace connector::discovery
