#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace fleet_ops::http
{
    inline constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;
    inline constexpr std::size_t MAX_BODY_BYTES = 1024 * 1024; // 1MB

    inline constexpr const char *HEALTH_PATH = "/api/health";

    // Header names are stored lower-cased.
    using HeaderMap = std::map<std::string, std::string>;

    struct Request
    {
        std::string method;
        std::string target;
        HeaderMap headers;
        std::string body;
    };

    struct Response
    {
        int status = 0;
        std::string reason;
        HeaderMap headers;
        std::string body;
    };

    std::string SerializeResponse(const Response &resp);

    std::string ReasonPhrase(int status);
    std::string ToLower(std::string text);

    Response MakeJsonResponse(int status, const nlohmann::json &body);
    Response MakeErrorResponse(int status, const std::string &message);
}
