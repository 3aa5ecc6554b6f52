#pragma once

#include <optional>
#include <set>
#include <string>
#include "../common/FleetTypes.hpp"
#include "../common/HttpMessage.hpp"
#include "../monitor/FleetDirectory.hpp"

namespace fleet_ops::server
{
    // A device command resolved against the directory, ready to forward.
    struct CommandJob
    {
        std::string device_id;
        std::string command; // "toggle_recording", "sync"
        common::DeviceRecord target;
    };

    struct RouteResult
    {
        std::optional<http::Response> response;
        std::optional<CommandJob> command;
    };

    // Request routing for the fleet API. Reads go straight to a directory
    // snapshot; commands are resolved to a target and handed back so the
    // forwarding call runs off the serving thread.
    //
    //   GET  /api/devices
    //   GET  /api/devices/<id>
    //   POST /api/device/<id>/toggle_recording
    //   POST /api/device/<id>/sync
    class FleetApi
    {
    public:
        explicit FleetApi(const monitor::FleetDirectory &directory);

        RouteResult Route(const http::Request &req) const;

        static std::string PercentDecode(const std::string &text);

    private:
        http::Response ListDevices() const;
        http::Response GetDevice(const std::string &device_id) const;
        RouteResult ResolveCommand(const std::string &device_id, const std::string &command) const;

        const monitor::FleetDirectory &m_directory;
        std::set<std::string> m_commands;
    };
}
