#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../common/Service.hpp"
#include "../common/StopToken.hpp"
#include "../monitor/FleetDirectory.hpp"
#include "AnnouncementListener.hpp"
#include "Scanner.hpp"

namespace fleet_ops::discovery
{
    enum class DiscoveryState
    {
        Idle,
        Scanning
    };

    struct DiscoveryOptions
    {
        std::chrono::milliseconds interval = std::chrono::seconds(30);
        std::optional<std::string> range; // default-route /24 when empty
        ScanOptions scan;
    };

    struct DiscoveryOutcome
    {
        std::size_t scanned = 0;
        std::size_t announced = 0;
        monitor::UpsertSummary published;
        std::vector<ScanConflict> conflicts;
        std::optional<std::string> scan_error;
    };

    // Alternates Idle/Scanning on a fixed period. Each scan publishes the
    // merged candidate set into the directory as one batch: scan results
    // first, then announced devices, so an announcement wins a tie.
    class DiscoveryCoordinator : public common::Service
    {
    public:
        // Either source may be null to disable it.
        DiscoveryCoordinator(monitor::FleetDirectory &directory,
                             const NetworkScanner *scanner,
                             const AnnouncementListener *listener,
                             DiscoveryOptions options);
        ~DiscoveryCoordinator();

        void Start(common::StopToken &token) override;
        void Stop() override;
        std::string Name() const override { return "DiscoveryCoordinator"; }

        DiscoveryOutcome RunCycle(common::StopToken *token = nullptr);

        DiscoveryState State() const { return m_state; }
        uint64_t Cycles() const { return m_cycles; }

    private:
        void DiscoveryLoop();

        monitor::FleetDirectory &m_directory;
        const NetworkScanner *m_scanner;
        const AnnouncementListener *m_listener;
        DiscoveryOptions m_options;

        std::atomic<DiscoveryState> m_state;
        std::atomic<uint64_t> m_cycles;
        std::atomic<bool> m_running;
        std::thread m_thread;
        common::StopToken *m_token;
    };
}
