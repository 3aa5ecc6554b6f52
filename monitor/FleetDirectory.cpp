#include "FleetDirectory.hpp"

namespace fleet_ops::monitor
{
    FleetDirectory::FleetDirectory(std::chrono::milliseconds lock_budget) : m_lock_budget(lock_budget)
    {
    }

    std::unique_lock<std::timed_mutex> FleetDirectory::Acquire(const char *operation) const
    {
        std::unique_lock<std::timed_mutex> lock(m_mutex, std::defer_lock);
        if (!lock.try_lock_for(m_lock_budget))
        {
            throw DirectoryLockTimeout(std::string("FleetDirectory::") + operation + " waited longer than " +
                                       std::to_string(m_lock_budget.count()) + "ms");
        }
        return lock;
    }

    UpsertSummary FleetDirectory::UpsertRecords(const std::vector<common::DeviceRecord> &batch)
    {
        UpsertSummary summary;
        auto lock = Acquire("UpsertRecords");

        for (const auto &record : batch)
        {
            auto it = m_entries.find(record.device_id);
            if (it == m_entries.end())
            {
                common::FleetEntry entry;
                entry.record = record;
                m_entries.emplace(record.device_id, std::move(entry));
                ++summary.added;
                continue;
            }

            if (it->second.record == record)
            {
                ++summary.unchanged;
                continue;
            }

            it->second.record = record;
            ++summary.moved;
        }
        return summary;
    }

    bool FleetDirectory::WriteHealth(const std::string &device_id, common::HealthObservation observation)
    {
        auto lock = Acquire("WriteHealth");

        auto it = m_entries.find(device_id);
        if (it == m_entries.end())
            return false;

        it->second.health = std::move(observation);
        return true;
    }

    std::vector<common::FleetEntry> FleetDirectory::Snapshot() const
    {
        auto lock = Acquire("Snapshot");

        std::vector<common::FleetEntry> entries;
        entries.reserve(m_entries.size());
        for (const auto &[id, entry] : m_entries)
        {
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<common::DeviceRecord> FleetDirectory::Records() const
    {
        auto lock = Acquire("Records");

        std::vector<common::DeviceRecord> records;
        records.reserve(m_entries.size());
        for (const auto &[id, entry] : m_entries)
        {
            records.push_back(entry.record);
        }
        return records;
    }

    std::optional<common::FleetEntry> FleetDirectory::Lookup(const std::string &device_id) const
    {
        auto lock = Acquire("Lookup");

        auto it = m_entries.find(device_id);
        if (it == m_entries.end())
            return std::nullopt;
        return it->second;
    }

    std::size_t FleetDirectory::Size() const
    {
        auto lock = Acquire("Size");
        return m_entries.size();
    }
}
