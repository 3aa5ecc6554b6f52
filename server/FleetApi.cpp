#include "FleetApi.hpp"
#include <cctype>
#include <vector>

namespace fleet_ops::server
{
    namespace
    {
        std::vector<std::string> SplitPath(const std::string &path)
        {
            std::vector<std::string> parts;
            std::size_t start = 1;
            while (start <= path.size())
            {
                std::size_t slash = path.find('/', start);
                if (slash == std::string::npos)
                    slash = path.size();
                if (slash > start)
                    parts.push_back(path.substr(start, slash - start));
                start = slash + 1;
            }
            return parts;
        }

        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }
    }

    FleetApi::FleetApi(const monitor::FleetDirectory &directory)
        : m_directory(directory), m_commands{"toggle_recording", "sync"}
    {
    }

    std::string FleetApi::PercentDecode(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size())
            {
                int hi = HexValue(text[i + 1]);
                int lo = HexValue(text[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(text[i]);
        }
        return out;
    }

    RouteResult FleetApi::Route(const http::Request &req) const
    {
        RouteResult result;

        std::string path = req.target.substr(0, req.target.find('?'));
        std::vector<std::string> parts = SplitPath(path);

        if (parts.size() < 2 || parts[0] != "api")
        {
            result.response = http::MakeErrorResponse(404, "No route for " + path);
            return result;
        }

        // /api/devices[/<id>]
        if (parts[1] == "devices" && parts.size() <= 3)
        {
            if (req.method != "GET")
            {
                result.response = http::MakeErrorResponse(405, "Use GET");
                return result;
            }
            result.response = parts.size() == 2 ? ListDevices() : GetDevice(PercentDecode(parts[2]));
            return result;
        }

        // /api/device/<id>/<command>
        if (parts[1] == "device" && parts.size() == 4)
        {
            if (req.method != "POST")
            {
                result.response = http::MakeErrorResponse(405, "Use POST");
                return result;
            }
            return ResolveCommand(PercentDecode(parts[2]), parts[3]);
        }

        result.response = http::MakeErrorResponse(404, "No route for " + path);
        return result;
    }

    http::Response FleetApi::ListDevices() const
    {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &entry : m_directory.Snapshot())
        {
            devices.push_back(common::ToJson(entry));
        }

        nlohmann::json body;
        body["count"] = devices.size();
        body["devices"] = std::move(devices);
        return http::MakeJsonResponse(200, body);
    }

    http::Response FleetApi::GetDevice(const std::string &device_id) const
    {
        auto entry = m_directory.Lookup(device_id);
        if (!entry)
            return http::MakeErrorResponse(404, "Unknown device '" + device_id + "'");
        return http::MakeJsonResponse(200, common::ToJson(*entry));
    }

    RouteResult FleetApi::ResolveCommand(const std::string &device_id, const std::string &command) const
    {
        RouteResult result;

        if (m_commands.count(command) == 0)
        {
            result.response = http::MakeErrorResponse(404, "Unknown command '" + command + "'");
            return result;
        }

        auto entry = m_directory.Lookup(device_id);
        if (!entry)
        {
            result.response = http::MakeErrorResponse(404, "Unknown device '" + device_id + "'");
            return result;
        }

        result.command = CommandJob{device_id, command, entry->record};
        return result;
    }
}
