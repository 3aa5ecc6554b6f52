#include "HttpMessage.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace fleet_ops::http
{
    std::string ToLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string ReasonPhrase(int status)
    {
        switch (status)
        {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Unknown";
        }
    }

    std::string SerializeResponse(const Response &resp)
    {
        std::ostringstream ss;
        std::string reason = resp.reason.empty() ? ReasonPhrase(resp.status) : resp.reason;
        ss << "HTTP/1.1 " << resp.status << " " << reason << "\r\n";

        for (const auto &[name, value] : resp.headers)
        {
            if (name == "content-length" || name == "connection")
                continue;
            ss << name << ": " << value << "\r\n";
        }

        ss << "Content-Length: " << resp.body.size() << "\r\n";
        ss << "Connection: close\r\n";
        ss << "\r\n";
        ss << resp.body;
        return ss.str();
    }

    Response MakeJsonResponse(int status, const nlohmann::json &body)
    {
        Response resp;
        resp.status = status;
        resp.reason = ReasonPhrase(status);
        resp.headers["content-type"] = "application/json";
        resp.body = body.dump();
        return resp;
    }

    Response MakeErrorResponse(int status, const std::string &message)
    {
        return MakeJsonResponse(status, nlohmann::json{{"error", message}});
    }
}
