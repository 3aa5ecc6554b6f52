#include "DiscoveryCoordinator.hpp"
#include <iostream>

namespace fleet_ops::discovery
{
    DiscoveryCoordinator::DiscoveryCoordinator(monitor::FleetDirectory &directory,
                                               const NetworkScanner *scanner,
                                               const AnnouncementListener *listener,
                                               DiscoveryOptions options)
        : m_directory(directory), m_scanner(scanner), m_listener(listener), m_options(std::move(options)),
          m_state(DiscoveryState::Idle), m_cycles(0), m_running(false), m_token(nullptr)
    {
    }

    DiscoveryCoordinator::~DiscoveryCoordinator()
    {
        Stop();
    }

    void DiscoveryCoordinator::Start(common::StopToken &token)
    {
        if (m_running)
            return;
        m_running = true;
        m_token = &token;
        m_thread = std::thread(&DiscoveryCoordinator::DiscoveryLoop, this);
    }

    void DiscoveryCoordinator::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    DiscoveryOutcome DiscoveryCoordinator::RunCycle(common::StopToken *token)
    {
        DiscoveryOutcome outcome;
        std::vector<common::DeviceRecord> candidates;

        m_state = DiscoveryState::Scanning;

        if (m_scanner)
        {
            try
            {
                AddressRange range = m_options.range ? ParseCidr(*m_options.range) : DeriveLocalRange();
                std::cout << "[Discovery] Scanning " << range.ToString() << " port " << m_options.scan.port
                          << " (" << range.HostCount() << " hosts, " << m_options.scan.concurrency << " workers)\n";

                ScanReport report = m_scanner->Scan(range, m_options.scan, token);
                outcome.scanned = report.devices.size();
                outcome.conflicts = std::move(report.conflicts);
                candidates = std::move(report.devices);
            }
            catch (const ScanError &e)
            {
                std::cerr << "[Discovery] Scan aborted: " << e.what() << "\n";
                outcome.scan_error = e.what();
            }
        }

        if (m_listener)
        {
            std::vector<common::DeviceRecord> announced = m_listener->Snapshot();
            outcome.announced = announced.size();
            candidates.insert(candidates.end(), announced.begin(), announced.end());
        }

        if (candidates.empty())
        {
            std::cout << "[Discovery] No devices found this cycle\n";
        }
        else
        {
            outcome.published = m_directory.UpsertRecords(candidates);
            std::cout << "[Discovery] Published " << candidates.size() << " candidate(s): "
                      << outcome.published.added << " new, " << outcome.published.moved << " changed, "
                      << outcome.published.unchanged << " unchanged\n";
        }

        m_state = DiscoveryState::Idle;
        ++m_cycles;
        return outcome;
    }

    void DiscoveryCoordinator::DiscoveryLoop()
    {
        while (m_running && !m_token->StopRequested())
        {
            try
            {
                RunCycle(m_token);
            }
            catch (const std::exception &e)
            {
                m_state = DiscoveryState::Idle;
                std::cerr << "[Discovery] Cycle failed: " << e.what() << "\n";
            }

            if (m_token->WaitFor(m_options.interval))
                break;
        }
    }
}
