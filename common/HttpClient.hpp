#pragma once

#include <chrono>
#include <string>
#include "HttpMessage.hpp"

namespace fleet_ops::http
{
    enum class ExchangeError
    {
        None,
        Timeout,     // deadline hit during connect, send or receive
        Unreachable, // refused, no route, reset, bad address
        Malformed    // peer answered but the bytes are not a valid HTTP response
    };

    struct ExchangeResult
    {
        ExchangeError error = ExchangeError::None;
        Response response;
        std::string detail;

        bool Ok() const { return error == ExchangeError::None; }
    };

    // One libcurl request to http://ip:port<target> on a fresh connection.
    // The timeout is a single deadline covering connect, send and receive;
    // there are no retries and no redirects.
    ExchangeResult Exchange(const std::string &ip, int port, const Request &req,
                            std::chrono::milliseconds timeout);

    ExchangeError ClassifyCurlCode(int code);
}
