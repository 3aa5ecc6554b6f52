#pragma once

#include <string>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/thread-watch.h>
#include "../common/Service.hpp"
#include "AnnouncementListener.hpp"

namespace fleet_ops::discovery
{
    // Browses one DNS-SD service type through the local avahi-daemon and
    // feeds resolved records into an AnnouncementListener. Callbacks run on
    // avahi's own poll thread.
    class AvahiBrowser : public common::Service
    {
    public:
        AvahiBrowser(AnnouncementListener &listener, std::string service_type);
        ~AvahiBrowser();

        AvahiBrowser(const AvahiBrowser &) = delete;
        AvahiBrowser &operator=(const AvahiBrowser &) = delete;

        // A missing daemon is logged, not thrown: the scanner still works.
        void Start(common::StopToken &token) override;
        void Stop() override;
        std::string Name() const override { return "AnnouncementListener"; }

        static std::string NormalizeServiceType(std::string type);

    private:
        static void ClientCallback(AvahiClient *client, AvahiClientState state, void *userdata);

        static void BrowseCallback(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                                   AvahiBrowserEvent event, const char *name, const char *type,
                                   const char *domain, AvahiLookupResultFlags flags, void *userdata);

        static void ResolveCallback(AvahiServiceResolver *resolver, AvahiIfIndex interface, AvahiProtocol protocol,
                                    AvahiResolverEvent event, const char *name, const char *type,
                                    const char *domain, const char *host_name, const AvahiAddress *address,
                                    uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags flags,
                                    void *userdata);

        void Release();

        AnnouncementListener &m_listener;
        std::string m_service_type;

        AvahiThreadedPoll *m_poll;
        AvahiClient *m_client;
        AvahiServiceBrowser *m_browser;
    };
}
