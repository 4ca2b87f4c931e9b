#pragma once

#include "DiscoverySource.hpp"
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/thread-watch.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace connector::discovery {

    inline const std::vector<std::string> DEFAULT_SERVICE_TYPES{
        "_bambu._tcp.local.",
        "_printer._tcp.local.",
        "_ipp._tcp.local.",
        "_http._tcp.local."
    };

    /**
     * @brief A service instance the mDNS daemon resolved to an IPv4 endpoint.
     */
    struct ResolvedService {
        std::string instanceName;
        std::string serviceType;
        std::string address;
        uint16_t port = 0;
        // keys lowercased
        std::map<std::string, std::string> txt;
    };

    /**
     * @brief Turns resolved services into devices, once per service instance.
     *
     * The daemon reports an instance again on every re-announcement and once per
     * interface; only the first report becomes a device.
     */
    class MdnsDeviceRegistry {
    public:
        std::optional<core::models::Device> accept(const ResolvedService &service);

        void reset();

        /**
         * @brief "_ipp._tcp.local." -> "_ipp._tcp", the form the browser expects
         */
        static std::string toBrowseType(const std::string &serviceType);

    private:
        std::set<std::string> emitted_;
    };

    struct MdnsOptions {
        std::vector<std::string> serviceTypes = DEFAULT_SERVICE_TYPES;
    };

    /**
     * @brief Passive listener backed by the Avahi daemon.
     *
     * One service browser per watched type runs on a private Avahi poll thread;
     * stopDiscovery() and the destructor release the browsers, the client and the thread.
     */
    class MdnsBrowser : public DiscoverySource {
    public:
        explicit MdnsBrowser(MdnsOptions options = {});

        ~MdnsBrowser() override;

        /**
         * @throws core::types::ConnectivityException when the daemon is unreachable or no type can be browsed
         */
        void startDiscovery(DeviceSink sink) override;

        void stopDiscovery() override;

        bool isDiscovering() const override { return running_; }

        std::string getSourceName() const override { return "MdnsBrowser"; }

    private:
        MdnsOptions options_;
        MdnsDeviceRegistry registry_;
        DeviceSink sink_;

        AvahiThreadedPoll *poll_ = nullptr;
        AvahiClient *client_ = nullptr;

        std::mutex lifecycleMutex_;
        std::atomic<bool> running_{false};

        void release();

        void handleResolved(const ResolvedService &service);

        static void onClientState(AvahiClient *client, AvahiClientState state, void *userdata);

        static void onBrowse(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                             AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
                             AvahiLookupResultFlags flags, void *userdata);

        static void onResolve(AvahiServiceResolver *resolver, AvahiIfIndex interface, AvahiProtocol protocol,
                              AvahiResolverEvent event, const char *name, const char *type, const char *domain,
                              const char *hostName, const AvahiAddress *address, uint16_t port,
                              AvahiStringList *txt, AvahiLookupResultFlags flags, void *userdata);
    };

} // namespace connector::discovery
