#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace fleet_ops::discovery
{
    inline constexpr std::chrono::milliseconds DEFAULT_POLL_TIMEOUT{3000};
    inline constexpr std::chrono::milliseconds DEFAULT_SCAN_TIMEOUT{1000};

    enum class ProbeError
    {
        None,
        Timeout,
        Unreachable,
        BadStatus,
        Malformed
    };

    struct ProbeResult
    {
        ProbeError error = ProbeError::None;
        int http_status = 0;
        nlohmann::json body;
        std::string detail;

        bool Ok() const { return error == ProbeError::None; }

        static ProbeResult Success(nlohmann::json body);
        static ProbeResult Failure(ProbeError error, std::string detail = "");
    };

    // Scanner and poller take their probe as a function so tests can swap in
    // a scripted fleet.
    using ProbeFunction = std::function<ProbeResult(const std::string &ip, int port,
                                                    std::chrono::milliseconds timeout)>;

    // GET /api/health on ip:port. Succeeds only on a 200 whose body is JSON.
    ProbeResult Probe(const std::string &ip, int port, std::chrono::milliseconds timeout);

    std::string ToString(ProbeError error);
}
