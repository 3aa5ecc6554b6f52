#include "FleetTypes.hpp"

namespace fleet_ops::common
{
    std::string DeviceRecord::BaseUrl() const
    {
        return "http://" + ip + ":" + std::to_string(port);
    }

    bool DeviceRecord::operator==(const DeviceRecord &other) const
    {
        return device_id == other.device_id && ip == other.ip && port == other.port &&
               display_name == other.display_name;
    }

    std::string ToString(HealthStatus status)
    {
        switch (status)
        {
        case HealthStatus::Online:
            return "online";
        case HealthStatus::Error:
            return "error";
        case HealthStatus::Offline:
            return "offline";
        case HealthStatus::Unknown:
        default:
            return "unknown";
        }
    }

    nlohmann::json ToJson(const FleetEntry &entry)
    {
        nlohmann::json out;
        out["device_id"] = entry.record.device_id;
        out["display_name"] = entry.record.display_name;
        out["ip"] = entry.record.ip;
        out["port"] = entry.record.port;
        out["base_url"] = entry.record.BaseUrl();
        out["status"] = ToString(entry.health.status);
        out["health"] = entry.health.payload;

        if (entry.health.observed_at)
        {
            std::chrono::duration<double> since_epoch = entry.health.observed_at->time_since_epoch();
            out["observed_at"] = since_epoch.count();
        }
        else
        {
            out["observed_at"] = nullptr;
        }
        return out;
    }
}
