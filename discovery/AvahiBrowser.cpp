#include "AvahiBrowser.hpp"
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <iostream>

namespace fleet_ops::discovery
{
    AvahiBrowser::AvahiBrowser(AnnouncementListener &listener, std::string service_type)
        : m_listener(listener), m_service_type(NormalizeServiceType(std::move(service_type))),
          m_poll(nullptr), m_client(nullptr), m_browser(nullptr)
    {
    }

    AvahiBrowser::~AvahiBrowser()
    {
        Stop();
    }

    // "_ewego._tcp.local." -> "_ewego._tcp"; avahi wants the bare type.
    std::string AvahiBrowser::NormalizeServiceType(std::string type)
    {
        while (!type.empty() && type.back() == '.')
            type.pop_back();

        const std::string suffix = ".local";
        if (type.size() > suffix.size() &&
            type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0)
        {
            type.erase(type.size() - suffix.size());
        }
        return type;
    }

    void AvahiBrowser::Start(common::StopToken &)
    {
        if (m_poll)
            return;

        m_poll = avahi_threaded_poll_new();
        if (!m_poll)
        {
            std::cerr << "[Announce] Failed to create avahi poll. Passive discovery disabled.\n";
            return;
        }

        int error = 0;
        m_client = avahi_client_new(avahi_threaded_poll_get(m_poll), static_cast<AvahiClientFlags>(0),
                                    &AvahiBrowser::ClientCallback, this, &error);
        if (!m_client)
        {
            std::cerr << "[Announce] Cannot reach avahi-daemon: " << avahi_strerror(error)
                      << ". Passive discovery disabled.\n";
            Release();
            return;
        }

        m_browser = avahi_service_browser_new(m_client, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC,
                                              m_service_type.c_str(), nullptr,
                                              static_cast<AvahiLookupFlags>(0),
                                              &AvahiBrowser::BrowseCallback, this);
        if (!m_browser)
        {
            std::cerr << "[Announce] Failed to browse " << m_service_type << ": "
                      << avahi_strerror(avahi_client_errno(m_client)) << "\n";
            Release();
            return;
        }

        if (avahi_threaded_poll_start(m_poll) < 0)
        {
            std::cerr << "[Announce] Failed to start avahi poll thread.\n";
            Release();
            return;
        }

        std::cout << "[Announce] Browsing for " << m_service_type << "\n";
    }

    void AvahiBrowser::Stop()
    {
        if (!m_poll)
            return;

        avahi_threaded_poll_stop(m_poll);
        Release();
    }

    void AvahiBrowser::Release()
    {
        if (m_browser)
        {
            avahi_service_browser_free(m_browser);
            m_browser = nullptr;
        }
        // Frees any resolvers still pending.
        if (m_client)
        {
            avahi_client_free(m_client);
            m_client = nullptr;
        }
        if (m_poll)
        {
            avahi_threaded_poll_free(m_poll);
            m_poll = nullptr;
        }
    }

    void AvahiBrowser::ClientCallback(AvahiClient *client, AvahiClientState state, void *)
    {
        if (state == AVAHI_CLIENT_FAILURE)
        {
            std::cerr << "[Announce] avahi client failure: " << avahi_strerror(avahi_client_errno(client)) << "\n";
        }
    }

    void AvahiBrowser::BrowseCallback(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                                      AvahiBrowserEvent event, const char *name, const char *type,
                                      const char *domain, AvahiLookupResultFlags, void *userdata)
    {
        auto *self = static_cast<AvahiBrowser *>(userdata);

        switch (event)
        {
        case AVAHI_BROWSER_NEW:
        {
            AvahiClient *client = avahi_service_browser_get_client(browser);
            AvahiServiceResolver *resolver = avahi_service_resolver_new(
                client, interface, protocol, name, type, domain, AVAHI_PROTO_INET,
                static_cast<AvahiLookupFlags>(0), &AvahiBrowser::ResolveCallback, self);
            if (!resolver)
            {
                std::cerr << "[Announce] Failed to resolve '" << name << "': "
                          << avahi_strerror(avahi_client_errno(client)) << "\n";
            }
            break;
        }
        case AVAHI_BROWSER_REMOVE:
            self->m_listener.OnServiceRemoved(name);
            break;

        case AVAHI_BROWSER_FAILURE:
            std::cerr << "[Announce] Browser failure: "
                      << avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(browser))) << "\n";
            break;

        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
        default:
            break;
        }
    }

    void AvahiBrowser::ResolveCallback(AvahiServiceResolver *resolver, AvahiIfIndex, AvahiProtocol,
                                       AvahiResolverEvent event, const char *name, const char *,
                                       const char *, const char *host_name, const AvahiAddress *address,
                                       uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags,
                                       void *userdata)
    {
        auto *self = static_cast<AvahiBrowser *>(userdata);

        if (event == AVAHI_RESOLVER_FOUND)
        {
            ServiceAnnouncement announcement;
            announcement.instance_name = name ? name : "";
            announcement.host_name = host_name ? host_name : "";
            announcement.port = port;

            if (address)
            {
                char text[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(text, sizeof(text), address);
                announcement.addresses.emplace_back(text);
            }

            for (AvahiStringList *item = txt; item; item = avahi_string_list_get_next(item))
            {
                char *key = nullptr;
                char *value = nullptr;
                if (avahi_string_list_get_pair(item, &key, &value, nullptr) < 0)
                    continue;

                announcement.txt[key] = value ? value : "";
                avahi_free(key);
                avahi_free(value);
            }

            self->m_listener.OnServiceAdded(announcement);
        }
        else
        {
            std::cerr << "[Announce] Resolve failed for '" << (name ? name : "") << "': "
                      << avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))) << "\n";
        }

        avahi_service_resolver_free(resolver);
    }
}
