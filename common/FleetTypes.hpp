#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace fleet_ops::common
{
    enum class HealthStatus
    {
        Unknown,
        Online,
        Error,
        Offline
    };

    struct DeviceRecord
    {
        std::string device_id;
        std::string ip;
        int port = 0;
        std::string display_name;

        // Derived, never stored separately.
        std::string BaseUrl() const;

        bool operator==(const DeviceRecord &other) const;
        bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
    };

    struct HealthObservation
    {
        HealthStatus status = HealthStatus::Unknown;
        nlohmann::json payload; // null unless the last poll succeeded
        std::optional<std::chrono::system_clock::time_point> observed_at;
    };

    struct FleetEntry
    {
        DeviceRecord record;
        HealthObservation health;
    };

    std::string ToString(HealthStatus status);

    nlohmann::json ToJson(const FleetEntry &entry);
}
