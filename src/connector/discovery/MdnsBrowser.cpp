#include "connector/discovery/MdnsBrowser.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <algorithm>
#include <cctype>

namespace connector::discovery {
    using core::types::ConnectivityException;

    namespace {
        std::string lowercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool endsWith(const std::string &value, const std::string &suffix) {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string clientError(AvahiClient *client) {
            return avahi_strerror(avahi_client_errno(client));
        }
    }

    std::optional<core::models::Device> MdnsDeviceRegistry::accept(const ResolvedService &service) {
        if (service.address.empty() || service.instanceName.empty()) return std::nullopt;

        std::string name = lowercase(service.instanceName);
        std::string key = toBrowseType(service.serviceType) + "/" + name;
        if (!emitted_.insert(key).second) return std::nullopt;

        std::string model = core::models::UNKNOWN_MODEL;
        auto modelIt = service.txt.find("model");
        if (modelIt == service.txt.end() || modelIt->second.empty()) modelIt = service.txt.find("ty");
        if (modelIt != service.txt.end() && !modelIt->second.empty()) model = modelIt->second;

        return core::models::Device(name, service.address, service.port, model);
    }

    void MdnsDeviceRegistry::reset() {
        emitted_.clear();
    }

    std::string MdnsDeviceRegistry::toBrowseType(const std::string &serviceType) {
        std::string type = lowercase(serviceType);
        if (!type.empty() && type.back() == '.') type.pop_back();
        if (endsWith(type, ".local")) type.erase(type.size() - 6);
        return type;
    }

    MdnsBrowser::MdnsBrowser(MdnsOptions options) : options_(std::move(options)) {
    }

    MdnsBrowser::~MdnsBrowser() {
        stopDiscovery();
    }

    void MdnsBrowser::startDiscovery(DeviceSink sink) {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (running_) {
            Logger::logWarning("[MdnsBrowser] Already browsing");
            return;
        }

        sink_ = std::move(sink);
        registry_.reset();

        poll_ = avahi_threaded_poll_new();
        if (!poll_) {
            throw ConnectivityException("Cannot create the Avahi poll loop");
        }

        int error = 0;
        client_ = avahi_client_new(avahi_threaded_poll_get(poll_), static_cast<AvahiClientFlags>(0),
                                   &MdnsBrowser::onClientState, this, &error);
        if (!client_) {
            release();
            throw ConnectivityException("Cannot reach the Avahi daemon: " + std::string(avahi_strerror(error)));
        }

        size_t browsing = 0;
        for (const auto &serviceType: options_.serviceTypes) {
            std::string type = MdnsDeviceRegistry::toBrowseType(serviceType);
            auto *browser = avahi_service_browser_new(client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, type.c_str(),
                                                      nullptr, static_cast<AvahiLookupFlags>(0),
                                                      &MdnsBrowser::onBrowse, this);
            if (!browser) {
                Logger::logWarning("[MdnsBrowser] Cannot browse " + type + ": " + clientError(client_));
                continue;
            }
            browsing++;
        }
        if (browsing == 0) {
            release();
            throw ConnectivityException("No mDNS service type could be browsed");
        }

        if (avahi_threaded_poll_start(poll_) < 0) {
            release();
            throw ConnectivityException("Cannot start the Avahi poll thread");
        }

        running_ = true;
        Logger::logInfo("[MdnsBrowser] Browsing " + std::to_string(browsing) + " service types");
    }

    void MdnsBrowser::stopDiscovery() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (!poll_) return;

        avahi_threaded_poll_stop(poll_);
        release();
        running_ = false;
        Logger::logInfo("[MdnsBrowser] Stopped");
    }

    void MdnsBrowser::release() {
        // freeing the client also frees its browsers and any resolver still pending
        if (client_) {
            avahi_client_free(client_);
            client_ = nullptr;
        }
        if (poll_) {
            avahi_threaded_poll_free(poll_);
            poll_ = nullptr;
        }
    }

    void MdnsBrowser::handleResolved(const ResolvedService &service) {
        auto device = registry_.accept(service);
        if (!device) return;

        Logger::logInfo("[MdnsBrowser] Resolved " + device->name() + " at " + device->id() +
                        " (model " + device->model() + ")");
        if (!sink_) return;
        try {
            sink_(*device);
        } catch (const std::exception &e) {
            Logger::logError("[MdnsBrowser] Sink rejected " + device->id() + ": " + e.what());
        }
    }

    void MdnsBrowser::onClientState(AvahiClient *client, AvahiClientState state, void *) {
        if (state == AVAHI_CLIENT_FAILURE) {
            Logger::logError("[MdnsBrowser] Avahi client failed: " + clientError(client));
        } else if (state == AVAHI_CLIENT_S_RUNNING) {
            Logger::logDebug("[MdnsBrowser] Avahi client running");
        }
    }

    void MdnsBrowser::onBrowse(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                               AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
                               AvahiLookupResultFlags, void *userdata) {
        AvahiClient *client = avahi_service_browser_get_client(browser);
        switch (event) {
            case AVAHI_BROWSER_NEW:
                if (!avahi_service_resolver_new(client, interface, protocol, name, type, domain, AVAHI_PROTO_INET,
                                                static_cast<AvahiLookupFlags>(0), &MdnsBrowser::onResolve, userdata)) {
                    Logger::logWarning("[MdnsBrowser] Cannot resolve " + std::string(name) + ": " + clientError(client));
                }
                break;
            case AVAHI_BROWSER_FAILURE:
                Logger::logError("[MdnsBrowser] Browser for " + std::string(type ? type : "?") + " failed: " +
                                 clientError(client));
                break;
            case AVAHI_BROWSER_REMOVE:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
            case AVAHI_BROWSER_ALL_FOR_NOW:
                break;
        }
    }

    void MdnsBrowser::onResolve(AvahiServiceResolver *resolver, AvahiIfIndex, AvahiProtocol,
                                AvahiResolverEvent event, const char *name, const char *type, const char *,
                                const char *, const AvahiAddress *address, uint16_t port,
                                AvahiStringList *txt, AvahiLookupResultFlags, void *userdata) {
        if (event != AVAHI_RESOLVER_FOUND || !address) {
            Logger::logDebug("[MdnsBrowser] Could not resolve " + std::string(name ? name : "?"));
            avahi_service_resolver_free(resolver);
            return;
        }

        ResolvedService service;
        service.instanceName = name ? name : "";
        service.serviceType = type ? type : "";
        service.port = port;

        char text[AVAHI_ADDRESS_STR_MAX];
        service.address = avahi_address_snprint(text, sizeof(text), address) ? text : "";

        for (AvahiStringList *item = txt; item; item = avahi_string_list_get_next(item)) {
            char *key = nullptr;
            char *value = nullptr;
            if (avahi_string_list_get_pair(item, &key, &value, nullptr) == 0) {
                service.txt[lowercase(key)] = value ? value : "";
                avahi_free(key);
                avahi_free(value);
            }
        }
        avahi_service_resolver_free(resolver);

        static_cast<MdnsBrowser *>(userdata)->handleResolved(service);
    }

} // namespace connector::discovery
