#pragma once

#include "DiscoverySource.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace connector::discovery {

    constexpr size_t MAX_CONCURRENT_PROBES = 20;

    struct ScanOptions {
        std::vector<uint16_t> ports{8883, 1883, 80, 443};
        int windowRadius = 25;
        size_t maxConcurrent = MAX_CONCURRENT_PROBES;
        std::chrono::milliseconds connectTimeout{1000};
    };

    struct ScanTarget {
        std::string address;
        uint16_t port;
    };

    /**
     * @brief Returns true when address:port accepted a TCP connection within timeout.
     */
    using TcpProbe = std::function<bool(const std::string &address, uint16_t port,
                                        std::chrono::milliseconds timeout)>;

    /**
     * @brief Active TCP connect sweep of the local /24 around this host.
     *
     * At most maxConcurrent probes (never more than 20) are in flight; each worker
     * takes the next target only after its previous probe finished. A refused or
     * timed out connection only means "nothing there".
     */
    class NetworkScanner {
    public:
        explicit NetworkScanner(ScanOptions options, TcpProbe probe = &NetworkScanner::tcpProbe);

        /**
         * @brief Hosts [octet - radius, octet + radius] clipped to 1..254, times every port.
         * Empty when localAddress is not a dotted IPv4 address.
         */
        static std::vector<ScanTarget> buildTargets(const std::string &localAddress,
                                                    const std::vector<uint16_t> &ports, int radius);

        /**
         * @brief Blocks until every target is probed or cancelled is set.
         * @return number of successful probes
         */
        size_t scan(const std::vector<ScanTarget> &targets, const DeviceSink &onFound,
                    const std::atomic<bool> &cancelled);

        size_t scanLocalNetwork(const DeviceSink &onFound, const std::atomic<bool> &cancelled);

        size_t peakInFlight() const { return peakInFlight_; }

        const ScanOptions &options() const { return options_; }

        /**
         * @brief Address of the interface that routes outward (no packet is sent).
         */
        static std::optional<std::string> detectLocalAddress();

        static bool tcpProbe(const std::string &address, uint16_t port, std::chrono::milliseconds timeout);

        static core::models::Device makeDevice(const std::string &address, uint16_t port);

    private:
        ScanOptions options_;
        TcpProbe probe_;
        std::atomic<size_t> inFlight_{0};
        std::atomic<size_t> peakInFlight_{0};

        void notePeak(size_t current);
    };

    /**
     * @brief Runs one local-network sweep on a background thread.
     */
    class NetworkScanSource : public DiscoverySource {
    public:
        explicit NetworkScanSource(ScanOptions options, TcpProbe probe = &NetworkScanner::tcpProbe);

        ~NetworkScanSource() override;

        void startDiscovery(DeviceSink sink) override;

        void stopDiscovery() override;

        bool isDiscovering() const override { return running_; }

        std::string getSourceName() const override { return "NetworkScanner"; }

    private:
        NetworkScanner scanner_;
        std::thread scanThread_;
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> running_{false};
    };

} // namespace connector::discovery
