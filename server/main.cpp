#include "ApiServer.hpp"
#include "CommandWorker.hpp"
#include "../common/Config.hpp"
#include "../common/ServiceRegistry.hpp"
#include "../discovery/AddressRange.hpp"
#include "../discovery/AnnouncementListener.hpp"
#include "../discovery/AvahiBrowser.hpp"
#include "../discovery/DiscoveryCoordinator.hpp"
#include "../discovery/Scanner.hpp"
#include "../monitor/FleetDirectory.hpp"
#include "../monitor/HealthPoller.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>

using namespace fleet_ops;

int main(int argc, char *argv[])
{
    common::FleetConfig config;
    try
    {
        config = common::ParseArgs(argc, argv);
        if (config.scan_range)
            discovery::ParseCidr(*config.scan_range);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Config] " << e.what() << "\n\n"
                  << common::Usage(argv[0]);
        return 1;
    }

    if (config.show_help)
    {
        std::cout << common::Usage(argv[0]);
        return 0;
    }

    // Signals are taken synchronously by sigwait below; every thread
    // started from here inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "[Main] Discovery mode: " << common::ToString(config.mode)
              << ", device port " << config.device_port << std::endl;

    monitor::FleetDirectory directory;
    discovery::NetworkScanner scanner;
    discovery::AnnouncementListener listener;
    server::CommandWorker worker(config.command_timeout);
    common::ServiceRegistry registry;

    try
    {
        auto api = std::make_shared<server::ApiServer>(directory, worker, config.listen_port,
                                                       config.tls_cert, config.tls_key);
        api->Init();

        discovery::DiscoveryOptions options;
        options.interval = config.discovery_interval;
        options.range = config.scan_range;
        options.scan.port = config.device_port;
        options.scan.concurrency = config.scan_workers;
        options.scan.timeout = config.scan_timeout;

        if (config.AnnounceEnabled())
            registry.RegisterService(std::make_shared<discovery::AvahiBrowser>(listener, config.service_type));

        registry.RegisterService(std::make_shared<discovery::DiscoveryCoordinator>(
            directory,
            config.ScanEnabled() ? &scanner : nullptr,
            config.AnnounceEnabled() ? &listener : nullptr,
            options));

        registry.RegisterService(std::make_shared<monitor::HealthPoller>(
            directory, config.poll_interval, config.probe_timeout));

        registry.RegisterService(api);

        registry.StartAll();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        registry.StopAll();
        return -1;
    }

    int received = 0;
    sigwait(&signals, &received);
    std::cout << "[Main] Caught signal " << received << ", shutting down" << std::endl;

    registry.StopAll();
    return 0;
}
