#include "Config.hpp"
#include <sstream>

namespace fleet_ops::common
{
    namespace
    {
        int ParsePositive(const std::string &flag, const std::string &value, int max_value)
        {
            int parsed = 0;
            std::size_t consumed = 0;
            try
            {
                parsed = std::stoi(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigError(flag + " expects a number, got '" + value + "'");
            }

            if (consumed != value.size() || parsed <= 0 || parsed > max_value)
                throw ConfigError(flag + " out of range: '" + value + "'");
            return parsed;
        }

        DiscoveryMode ParseMode(const std::string &value)
        {
            if (value == "scan")
                return DiscoveryMode::Scan;
            if (value == "announce")
                return DiscoveryMode::Announce;
            if (value == "both")
                return DiscoveryMode::Both;
            throw ConfigError("--mode must be scan, announce or both, got '" + value + "'");
        }
    }

    std::string ToString(DiscoveryMode mode)
    {
        switch (mode)
        {
        case DiscoveryMode::Scan:
            return "scan";
        case DiscoveryMode::Announce:
            return "announce";
        case DiscoveryMode::Both:
        default:
            return "both";
        }
    }

    FleetConfig ParseArgs(const std::vector<std::string> &args)
    {
        FleetConfig config;

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &flag = args[i];

            if (flag == "-h" || flag == "--help")
            {
                config.show_help = true;
                continue;
            }

            if (i + 1 >= args.size())
                throw ConfigError("Missing value for " + flag);
            const std::string &value = args[++i];

            if (flag == "--listen-port")
                config.listen_port = ParsePositive(flag, value, 65535);
            else if (flag == "--device-port")
                config.device_port = ParsePositive(flag, value, 65535);
            else if (flag == "--range")
                config.scan_range = value;
            else if (flag == "--mode")
                config.mode = ParseMode(value);
            else if (flag == "--scan-workers")
                config.scan_workers = ParsePositive(flag, value, 1024);
            else if (flag == "--service-type")
                config.service_type = value;
            else if (flag == "--discovery-interval")
                config.discovery_interval = std::chrono::seconds(ParsePositive(flag, value, 86400));
            else if (flag == "--poll-interval")
                config.poll_interval = std::chrono::seconds(ParsePositive(flag, value, 3600));
            else if (flag == "--probe-timeout")
                config.probe_timeout = std::chrono::milliseconds(ParsePositive(flag, value, 60000));
            else if (flag == "--scan-timeout")
                config.scan_timeout = std::chrono::milliseconds(ParsePositive(flag, value, 60000));
            else if (flag == "--command-timeout")
                config.command_timeout = std::chrono::milliseconds(ParsePositive(flag, value, 60000));
            else if (flag == "--tls-cert")
                config.tls_cert = value;
            else if (flag == "--tls-key")
                config.tls_key = value;
            else
                throw ConfigError("Unknown option " + flag);
        }

        if (config.tls_cert.empty() != config.tls_key.empty())
            throw ConfigError("--tls-cert and --tls-key must be given together");

        return config;
    }

    FleetConfig ParseArgs(int argc, char *argv[])
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);
        return ParseArgs(args);
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream ss;
        ss << "Usage: " << program << " [options]\n"
           << "  --listen-port <port>          Fleet API port (default 8080)\n"
           << "  --device-port <port>          Device status port (default 5000)\n"
           << "  --range <cidr>                Scan range (default: default-route /24)\n"
           << "  --mode scan|announce|both     Discovery sources (default both)\n"
           << "  --scan-workers <n>            Concurrent scan probes (default 50)\n"
           << "  --service-type <type>         DNS-SD type (default _ewego._tcp)\n"
           << "  --discovery-interval <sec>    Discovery period (default 30)\n"
           << "  --poll-interval <sec>         Health poll period (default 2)\n"
           << "  --probe-timeout <ms>          Health probe deadline (default 3000)\n"
           << "  --scan-timeout <ms>           Scan probe deadline (default 1000)\n"
           << "  --command-timeout <ms>        Forwarded command deadline (default 5000)\n"
           << "  --tls-cert <file> --tls-key <file>  Serve the API over TLS\n";
        return ss.str();
    }
}
