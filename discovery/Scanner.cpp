#include "Scanner.hpp"
#include "WorkerPool.hpp"
#include "../common/StopToken.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace fleet_ops::discovery
{
    namespace
    {
        std::string StringField(const nlohmann::json &body, const char *key)
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string())
                return "";
            return it->get<std::string>();
        }
    }

    NetworkScanner::NetworkScanner(ProbeFunction probe) : m_probe(std::move(probe))
    {
    }

    std::optional<common::DeviceRecord> NetworkScanner::RecordFromBody(const nlohmann::json &body,
                                                                       const std::string &ip, int port)
    {
        if (!body.is_object())
            return std::nullopt;

        std::string device_id = StringField(body, "device_id");
        std::string device_name = StringField(body, "device_name");

        if (device_id.empty())
            device_id = device_name;
        if (device_id.empty())
            return std::nullopt;

        common::DeviceRecord record;
        record.device_id = device_id;
        record.ip = ip;
        record.port = port;
        record.display_name = device_name.empty() ? device_id : device_name;
        return record;
    }

    ScanReport NetworkScanner::Scan(const AddressRange &range, const ScanOptions &options,
                                    common::StopToken *token) const
    {
        ScanReport report;
        report.range = range.ToString();

        const uint64_t host_count = range.HostCount();

        std::size_t workers = static_cast<std::size_t>(std::max(options.concurrency, 1));
        if (host_count < workers)
            workers = static_cast<std::size_t>(host_count);

        std::mutex results_mutex;
        std::vector<std::pair<uint64_t, common::DeviceRecord>> found;
        std::atomic<uint64_t> probed(0);

        {
            WorkerPool pool(workers, workers * 2);

            for (uint64_t index = 0; index < host_count; ++index)
            {
                if (token && token->StopRequested())
                {
                    report.cancelled = true;
                    break;
                }

                const std::string ip = IpToString(range.HostAt(index));
                bool queued = pool.Submit([&, index, ip]()
                                          {
                    if (token && token->StopRequested())
                        return;

                    ProbeResult result = m_probe(ip, options.port, options.timeout);
                    ++probed;
                    if (!result.Ok())
                        return;

                    auto record = RecordFromBody(result.body, ip, options.port);
                    if (!record)
                        return;

                    std::lock_guard<std::mutex> lock(results_mutex);
                    found.emplace_back(index, std::move(*record)); });

                if (!queued)
                    break;
            }

            pool.Drain();
        }

        report.probed = probed;

        // Completion order depends on timing; address order does not.
        std::sort(found.begin(), found.end(), [](const auto &a, const auto &b)
                  { return a.first < b.first; });

        std::unordered_map<std::string, std::size_t> position;
        for (auto &[index, record] : found)
        {
            auto it = position.find(record.device_id);
            if (it == position.end())
            {
                position[record.device_id] = report.devices.size();
                report.devices.push_back(std::move(record));
                continue;
            }

            common::DeviceRecord &kept = report.devices[it->second];
            std::cerr << "[Scanner] WARNING: device_id '" << record.device_id << "' answered from "
                      << kept.ip << " and " << record.ip << "; keeping " << record.ip << "\n";
            report.conflicts.push_back({record.device_id, record.ip, kept.ip});
            kept = std::move(record);
        }

        return report;
    }
}
