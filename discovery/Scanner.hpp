#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/FleetTypes.hpp"
#include "AddressRange.hpp"
#include "ProbeClient.hpp"

namespace fleet_ops::common { class StopToken; }

namespace fleet_ops::discovery
{
    struct ScanConflict
    {
        std::string device_id;
        std::string kept_ip;
        std::string dropped_ip;
    };

    struct ScanReport
    {
        std::string range;
        std::vector<common::DeviceRecord> devices; // unique by device_id, in address order
        std::vector<ScanConflict> conflicts;
        uint64_t probed = 0;
        bool cancelled = false;
    };

    struct ScanOptions
    {
        int port = 5000;
        int concurrency = 50;
        std::chrono::milliseconds timeout = DEFAULT_SCAN_TIMEOUT;
    };

    class NetworkScanner
    {
    public:
        explicit NetworkScanner(ProbeFunction probe = Probe);

        // Probes every host in the range through a pool of at most
        // options.concurrency workers. When two hosts report the same
        // device_id the one later in address order wins and the clash is
        // listed in the report's conflicts. Memory stays bounded by the
        // pool's queue whatever the range size.
        ScanReport Scan(const AddressRange &range, const ScanOptions &options,
                        common::StopToken *token = nullptr) const;

        // Builds a candidate from a health body, or nullopt if the body
        // carries no device identity.
        static std::optional<common::DeviceRecord> RecordFromBody(const nlohmann::json &body,
                                                                  const std::string &ip, int port);

    private:
        ProbeFunction m_probe;
    };
}
