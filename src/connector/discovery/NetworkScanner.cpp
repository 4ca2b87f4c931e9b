#include "connector/discovery/NetworkScanner.hpp"
#include "logger/Logger.hpp"
#include <boost/asio.hpp>
#include <algorithm>

namespace connector::discovery {
    namespace {
        std::optional<std::vector<int>> splitOctets(const std::string &address) {
            boost::system::error_code ec;
            auto parsed = boost::asio::ip::make_address_v4(address, ec);
            if (ec) return std::nullopt;

            auto bytes = parsed.to_bytes();
            return std::vector<int>(bytes.begin(), bytes.end());
        }
    }

    NetworkScanner::NetworkScanner(ScanOptions options, TcpProbe probe)
        : options_(std::move(options)), probe_(std::move(probe)) {
        options_.maxConcurrent = std::clamp<size_t>(options_.maxConcurrent, 1, MAX_CONCURRENT_PROBES);
    }

    std::vector<ScanTarget> NetworkScanner::buildTargets(const std::string &localAddress,
                                                         const std::vector<uint16_t> &ports, int radius) {
        std::vector<ScanTarget> targets;
        auto octets = splitOctets(localAddress);
        if (!octets) {
            Logger::logWarning("[NetworkScanner] Not an IPv4 address: " + localAddress);
            return targets;
        }

        const auto &o = *octets;
        std::string prefix = std::to_string(o[0]) + "." + std::to_string(o[1]) + "." + std::to_string(o[2]) + ".";
        int first = std::max(1, o[3] - radius);
        int last = std::min(254, o[3] + radius);

        for (int host = first; host <= last; ++host) {
            for (uint16_t port: ports) {
                targets.push_back({prefix + std::to_string(host), port});
            }
        }
        return targets;
    }

    size_t NetworkScanner::scan(const std::vector<ScanTarget> &targets, const DeviceSink &onFound,
                                const std::atomic<bool> &cancelled) {
        if (targets.empty()) return 0;

        std::atomic<size_t> nextTarget{0};
        std::atomic<size_t> found{0};
        size_t workerCount = std::min(options_.maxConcurrent, targets.size());

        Logger::logInfo("[NetworkScanner] Probing " + std::to_string(targets.size()) + " endpoints with " +
                        std::to_string(workerCount) + " workers");

        auto worker = [&]() {
            while (!cancelled) {
                size_t index = nextTarget++;
                if (index >= targets.size()) break;
                const auto &target = targets[index];

                notePeak(++inFlight_);
                bool open = false;
                try {
                    open = probe_(target.address, target.port, options_.connectTimeout);
                } catch (const std::exception &e) {
                    Logger::logDebug("[NetworkScanner] Probe " + target.address + ":" +
                                     std::to_string(target.port) + " failed: " + e.what());
                }
                --inFlight_;

                if (open && !cancelled) {
                    found++;
                    Logger::logInfo("[NetworkScanner] Open port at " + target.address + ":" +
                                    std::to_string(target.port));
                    if (onFound) onFound(makeDevice(target.address, target.port));
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
        for (auto &thread: workers) {
            thread.join();
        }

        Logger::logInfo("[NetworkScanner] Scan finished, " + std::to_string(found.load()) + " endpoint(s) answered" +
                        (cancelled ? " (cancelled)" : ""));
        return found;
    }

    size_t NetworkScanner::scanLocalNetwork(const DeviceSink &onFound, const std::atomic<bool> &cancelled) {
        auto localAddress = detectLocalAddress();
        if (!localAddress) {
            Logger::logWarning("[NetworkScanner] Could not determine local address, skipping scan");
            return 0;
        }
        Logger::logInfo("[NetworkScanner] Local address " + *localAddress);
        return scan(buildTargets(*localAddress, options_.ports, options_.windowRadius), onFound, cancelled);
    }

    std::optional<std::string> NetworkScanner::detectLocalAddress() {
        try {
            boost::asio::io_context io;
            boost::asio::ip::udp::socket socket(io);
            // connect() on UDP only selects a route, nothing goes on the wire
            socket.connect({boost::asio::ip::make_address("8.8.8.8"), 80});
            auto address = socket.local_endpoint().address();
            if (!address.is_v4() || address.is_unspecified()) return std::nullopt;
            return address.to_string();
        } catch (const boost::system::system_error &e) {
            Logger::logWarning("[NetworkScanner] Local address lookup failed: " + std::string(e.what()));
            return std::nullopt;
        }
    }

    bool NetworkScanner::tcpProbe(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) {
        boost::system::error_code ec;
        auto ip = boost::asio::ip::make_address(address, ec);
        if (ec) return false;

        boost::asio::io_context io;
        boost::asio::ip::tcp::socket socket(io);
        boost::system::error_code result = boost::asio::error::would_block;

        socket.async_connect({ip, port}, [&result](const boost::system::error_code &connectEc) {
            result = connectEc;
        });

        io.run_for(timeout);
        if (!io.stopped()) {
            // timed out: cancel the pending connect and let its handler run
            socket.close(ec);
            io.run();
            return false;
        }

        socket.close(ec);
        return !result;
    }

    core::models::Device NetworkScanner::makeDevice(const std::string &address, uint16_t port) {
        std::string lastOctet = address.substr(address.find_last_of('.') + 1);
        return core::models::Device("Bambu-" + lastOctet, address, port, core::models::UNKNOWN_MODEL);
    }

    void NetworkScanner::notePeak(size_t current) {
        size_t peak = peakInFlight_;
        while (current > peak && !peakInFlight_.compare_exchange_weak(peak, current)) {
        }
    }

    NetworkScanSource::NetworkScanSource(ScanOptions options, TcpProbe probe)
        : scanner_(std::move(options), std::move(probe)) {
    }

    NetworkScanSource::~NetworkScanSource() {
        stopDiscovery();
    }

    void NetworkScanSource::startDiscovery(DeviceSink sink) {
        if (scanThread_.joinable()) {
            Logger::logWarning("[NetworkScanSource] Already scanning");
            return;
        }

        cancelled_ = false;
        running_ = true;
        scanThread_ = std::thread([this, sink = std::move(sink)]() {
            try {
                scanner_.scanLocalNetwork(sink, cancelled_);
            } catch (const std::exception &e) {
                Logger::logError("[NetworkScanSource] Scan aborted: " + std::string(e.what()));
            }
            running_ = false;
        });
    }

    void NetworkScanSource::stopDiscovery() {
        cancelled_ = true;
        if (scanThread_.joinable()) {
            scanThread_.join();
        }
        running_ = false;
    }

} // namespace connector::discovery
