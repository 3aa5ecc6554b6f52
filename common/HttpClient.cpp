#include "HttpClient.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <curl/curl.h>
#include <memory>

namespace fleet_ops::http
{
    namespace
    {
        struct CurlDeleter
        {
            void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };

        using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

        bool curl_ready()
        {
            static bool ready = []
            {
                return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
            }();
            return ready;
        }

        std::string Trim(const std::string &text)
        {
            const char *ws = " \t\r\n";
            std::size_t start = text.find_first_not_of(ws);
            if (start == std::string::npos)
                return "";
            std::size_t end = text.find_last_not_of(ws);
            return text.substr(start, end - start + 1);
        }

        size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *resp = static_cast<Response *>(userdata);
            if (resp->body.size() + size * nmemb > MAX_BODY_BYTES)
                return 0; // aborts the transfer with CURLE_WRITE_ERROR
            resp->body.append(ptr, size * nmemb);
            return size * nmemb;
        }

        // Called once per header line, status line included. A second status
        // line (after 100 Continue) starts the header set over.
        size_t write_header(char *ptr, size_t size, size_t nitems, void *userdata)
        {
            auto *resp = static_cast<Response *>(userdata);
            std::string line = Trim(std::string(ptr, size * nitems));

            if (line.compare(0, 5, "HTTP/") == 0)
            {
                resp->headers.clear();
                resp->reason.clear();
                std::size_t sp1 = line.find(' ');
                std::size_t sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
                if (sp2 != std::string::npos)
                    resp->reason = Trim(line.substr(sp2 + 1));
                return size * nitems;
            }

            std::size_t colon = line.find(':');
            if (colon != std::string::npos && colon > 0)
                resp->headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
            return size * nitems;
        }

        bool AppendHeader(HeaderList &list, const std::string &line)
        {
            curl_slist *head = curl_slist_append(list.get(), line.c_str());
            if (!head)
                return false;
            list.release();
            list.reset(head);
            return true;
        }

        ExchangeResult Fail(ExchangeError error, const std::string &detail)
        {
            ExchangeResult result;
            result.error = error;
            result.detail = detail;
            return result;
        }
    }

    ExchangeError ClassifyCurlCode(int code)
    {
        switch (static_cast<CURLcode>(code))
        {
        case CURLE_OK:
            return ExchangeError::None;
        case CURLE_OPERATION_TIMEDOUT:
            return ExchangeError::Timeout;
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_UNSUPPORTED_PROTOCOL: // HTTP/0.9 reply, i.e. not HTTP
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_WRITE_ERROR:
            return ExchangeError::Malformed;
        default:
            return ExchangeError::Unreachable;
        }
    }

    ExchangeResult Exchange(const std::string &ip, int port, const Request &req,
                            std::chrono::milliseconds timeout)
    {
        in_addr parsed{};
        if (port <= 0 || port > 65535 || inet_pton(AF_INET, ip.c_str(), &parsed) != 1)
            return Fail(ExchangeError::Unreachable, "invalid address " + ip + ":" + std::to_string(port));

        if (!curl_ready())
            return Fail(ExchangeError::Unreachable, "Unable to initialize libcurl");

        CurlHandle curl(curl_easy_init());
        if (!curl)
            return Fail(ExchangeError::Unreachable, "Unable to allocate curl handle");

        const std::string url = "http://" + ip + ":" + std::to_string(port) + req.target;

        HeaderList headers;
        for (const auto &[name, value] : req.headers)
        {
            if (!AppendHeader(headers, name + ": " + value))
                return Fail(ExchangeError::Unreachable, "Unable to build request headers");
        }
        // No 100-continue round trip for command bodies.
        if (!AppendHeader(headers, "Expect:"))
            return Fail(ExchangeError::Unreachable, "Unable to build request headers");

        // libcurl reads 0 as "no timeout".
        const long timeout_ms = std::max<long>(1, static_cast<long>(timeout.count()));

        ExchangeResult result;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTP09_ALLOWED, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_FORBID_REUSE, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "fleet-monitor/0.1");
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.response);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &result.response);

        if (req.method == "POST")
        {
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        }
        else if (req.method != "GET")
        {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK)
        {
            // Partial data does not count: a deadline mid-body is still a timeout.
            return Fail(ClassifyCurlCode(rc), curl_easy_strerror(rc));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        result.response.status = static_cast<int>(status);
        if (result.response.reason.empty())
            result.response.reason = ReasonPhrase(result.response.status);
        return result;
    }
}
