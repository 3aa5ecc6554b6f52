#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../common/FleetTypes.hpp"

namespace fleet_ops::monitor
{
    // Raised when a lock wait exceeds its budget. Nothing holds the lock
    // across I/O, so seeing this means a caller broke that rule.
    class DirectoryLockTimeout : public std::runtime_error
    {
    public:
        explicit DirectoryLockTimeout(const std::string &what) : std::runtime_error(what) {}
    };

    struct UpsertSummary
    {
        std::size_t added = 0;
        std::size_t moved = 0; // known id, different address or name
        std::size_t unchanged = 0;
    };

    // The one piece of state shared between discovery, polling and the API.
    // Each public call is a single critical section: a batch of record
    // replacements, one device's health result, or one snapshot.
    class FleetDirectory
    {
    public:
        explicit FleetDirectory(std::chrono::milliseconds lock_budget = std::chrono::seconds(2));

        FleetDirectory(const FleetDirectory &) = delete;
        FleetDirectory &operator=(const FleetDirectory &) = delete;

        // Replaces the record of every candidate; new ids start with an
        // Unknown health observation. Health of known ids is not touched and
        // absent ids are never removed. Later duplicates in the batch win.
        UpsertSummary UpsertRecords(const std::vector<common::DeviceRecord> &batch);

        // Replaces the health observation wholesale. False if the id is unknown.
        bool WriteHealth(const std::string &device_id, common::HealthObservation observation);

        std::vector<common::FleetEntry> Snapshot() const;
        std::vector<common::DeviceRecord> Records() const;
        std::optional<common::FleetEntry> Lookup(const std::string &device_id) const;

        std::size_t Size() const;

    private:
        std::unique_lock<std::timed_mutex> Acquire(const char *operation) const;

        mutable std::timed_mutex m_mutex;
        std::chrono::milliseconds m_lock_budget;
        std::map<std::string, common::FleetEntry> m_entries;
    };
}
