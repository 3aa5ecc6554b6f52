#include "AnnouncementListener.hpp"
#include <arpa/inet.h>
#include <iostream>

namespace fleet_ops::discovery
{
    namespace
    {
        std::string TxtValue(const ServiceAnnouncement &announcement, const std::string &key)
        {
            auto it = announcement.txt.find(key);
            return it == announcement.txt.end() ? "" : it->second;
        }

        bool IsIPv4(const std::string &text)
        {
            in_addr addr{};
            return inet_pton(AF_INET, text.c_str(), &addr) == 1;
        }
    }

    AnnouncedDevice DecodeAnnouncement(const ServiceAnnouncement &announcement)
    {
        AnnouncedDevice device;
        device.instance_name = announcement.instance_name;
        device.service = TxtValue(announcement, "service");
        device.version = TxtValue(announcement, "version");
        device.seen_at = std::chrono::system_clock::now();

        auto id_it = announcement.txt.find("device_id");
        if (id_it != announcement.txt.end())
        {
            if (id_it->second.empty())
                throw AnnouncementDecodeError("'" + announcement.instance_name + "' advertises an empty device_id");
            device.record.device_id = id_it->second;
        }
        else
        {
            device.record.device_id = announcement.instance_name;
        }

        if (device.record.device_id.empty())
            throw AnnouncementDecodeError("Announcement carries no device identity");

        for (const auto &address : announcement.addresses)
        {
            if (IsIPv4(address))
            {
                device.record.ip = address;
                break;
            }
        }
        if (device.record.ip.empty())
            throw AnnouncementDecodeError("'" + device.record.device_id + "' advertises no IPv4 address");

        if (announcement.port <= 0 || announcement.port > 65535)
            throw AnnouncementDecodeError("'" + device.record.device_id + "' advertises invalid port " +
                                          std::to_string(announcement.port));
        device.record.port = announcement.port;

        std::string name = device.service.empty() ? announcement.instance_name : device.service;
        device.record.display_name = name.empty() ? device.record.device_id : name;

        return device;
    }

    bool AnnouncementListener::OnServiceAdded(const ServiceAnnouncement &announcement)
    {
        AnnouncedDevice device;
        try
        {
            device = DecodeAnnouncement(announcement);
        }
        catch (const AnnouncementDecodeError &e)
        {
            std::cerr << "[Announce] Skipping '" << announcement.instance_name << "': " << e.what() << "\n";
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_decode_failures;
            return false;
        }

        std::cout << "[Announce] Device up: " << device.record.device_id << " at "
                  << device.record.ip << ":" << device.record.port;
        if (!device.version.empty())
            std::cout << " (v" << device.version << ")";
        std::cout << "\n";

        std::lock_guard<std::mutex> lock(m_mutex);
        m_present[announcement.instance_name] = std::move(device);
        return true;
    }

    void AnnouncementListener::OnServiceRemoved(const std::string &instance_name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_present.find(instance_name);
        if (it == m_present.end())
            return;

        std::cout << "[Announce] Device withdrawn: " << it->second.record.device_id << "\n";
        m_present.erase(it);
    }

    std::vector<common::DeviceRecord> AnnouncementListener::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<common::DeviceRecord> records;
        records.reserve(m_present.size());
        for (const auto &[name, device] : m_present)
        {
            records.push_back(device.record);
        }
        return records;
    }

    std::vector<AnnouncedDevice> AnnouncementListener::Devices() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<AnnouncedDevice> devices;
        devices.reserve(m_present.size());
        for (const auto &[name, device] : m_present)
        {
            devices.push_back(device);
        }
        return devices;
    }

    std::size_t AnnouncementListener::DecodeFailures() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_decode_failures;
    }
}
