#include "ProbeClient.hpp"
#include "../common/HttpClient.hpp"

namespace fleet_ops::discovery
{
    ProbeResult ProbeResult::Success(nlohmann::json body)
    {
        ProbeResult result;
        result.http_status = 200;
        result.body = std::move(body);
        return result;
    }

    ProbeResult ProbeResult::Failure(ProbeError error, std::string detail)
    {
        ProbeResult result;
        result.error = error;
        result.detail = std::move(detail);
        return result;
    }

    std::string ToString(ProbeError error)
    {
        switch (error)
        {
        case ProbeError::None:
            return "None";
        case ProbeError::Timeout:
            return "Timeout";
        case ProbeError::Unreachable:
            return "Unreachable";
        case ProbeError::BadStatus:
            return "BadStatus";
        case ProbeError::Malformed:
            return "Malformed";
        default:
            return "Unknown";
        }
    }

    ProbeResult Probe(const std::string &ip, int port, std::chrono::milliseconds timeout)
    {
        http::Request req;
        req.method = "GET";
        req.target = http::HEALTH_PATH;
        req.headers["accept"] = "application/json";

        http::ExchangeResult exchange = http::Exchange(ip, port, req, timeout);

        switch (exchange.error)
        {
        case http::ExchangeError::None:
            break;
        case http::ExchangeError::Timeout:
            return ProbeResult::Failure(ProbeError::Timeout, exchange.detail);
        case http::ExchangeError::Malformed:
            return ProbeResult::Failure(ProbeError::Malformed, exchange.detail);
        case http::ExchangeError::Unreachable:
        default:
            return ProbeResult::Failure(ProbeError::Unreachable, exchange.detail);
        }

        if (exchange.response.status != 200)
        {
            ProbeResult result = ProbeResult::Failure(ProbeError::BadStatus,
                                                      "HTTP " + std::to_string(exchange.response.status));
            result.http_status = exchange.response.status;
            return result;
        }

        nlohmann::json body = nlohmann::json::parse(exchange.response.body, nullptr, false);
        if (body.is_discarded() || !body.is_structured())
        {
            ProbeResult result = ProbeResult::Failure(ProbeError::Malformed, "body is not a JSON document");
            result.http_status = exchange.response.status;
            return result;
        }

        return ProbeResult::Success(std::move(body));
    }
}
