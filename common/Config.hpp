#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fleet_ops::common
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    enum class DiscoveryMode
    {
        Scan,
        Announce,
        Both
    };

    struct FleetConfig
    {
        int listen_port = 8080;
        int device_port = 5000;

        std::optional<std::string> scan_range; // derived from the default route when empty
        DiscoveryMode mode = DiscoveryMode::Both;
        int scan_workers = 50;
        std::string service_type = "_ewego._tcp";

        std::chrono::seconds discovery_interval{30};
        std::chrono::seconds poll_interval{2};
        std::chrono::milliseconds probe_timeout{3000};
        std::chrono::milliseconds scan_timeout{1000};
        std::chrono::milliseconds command_timeout{5000};

        std::string tls_cert;
        std::string tls_key;

        bool show_help = false;

        bool ScanEnabled() const { return mode != DiscoveryMode::Announce; }
        bool AnnounceEnabled() const { return mode != DiscoveryMode::Scan; }
        bool TlsEnabled() const { return !tls_cert.empty() && !tls_key.empty(); }
    };

    FleetConfig ParseArgs(const std::vector<std::string> &args);
    FleetConfig ParseArgs(int argc, char *argv[]);

    std::string Usage(const std::string &program);
    std::string ToString(DiscoveryMode mode);
}
