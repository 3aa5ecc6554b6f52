#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "../common/FleetTypes.hpp"

namespace fleet_ops::discovery
{
    class AnnouncementDecodeError : public std::runtime_error
    {
    public:
        explicit AnnouncementDecodeError(const std::string &what) : std::runtime_error(what) {}
    };

    // One resolved DNS-SD record, as handed over by the browser.
    struct ServiceAnnouncement
    {
        std::string instance_name;
        std::string host_name;
        std::vector<std::string> addresses;
        int port = 0;
        std::map<std::string, std::string> txt;
    };

    struct AnnouncedDevice
    {
        common::DeviceRecord record;
        std::string instance_name;
        std::string service;
        std::string version;
        std::chrono::system_clock::time_point seen_at;
    };

    // Throws AnnouncementDecodeError if the record has no usable identity,
    // IPv4 address or port.
    AnnouncedDevice DecodeAnnouncement(const ServiceAnnouncement &announcement);

    // Presence view of the passive channel. A removal only drops the device
    // from this view; whether it is still alive is the poller's call.
    class AnnouncementListener
    {
    public:
        // False if the record could not be decoded; it is logged and skipped.
        bool OnServiceAdded(const ServiceAnnouncement &announcement);
        void OnServiceRemoved(const std::string &instance_name);

        std::vector<common::DeviceRecord> Snapshot() const;
        std::vector<AnnouncedDevice> Devices() const;

        std::size_t DecodeFailures() const;

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, AnnouncedDevice> m_present; // by instance name
        std::size_t m_decode_failures = 0;
    };
}
