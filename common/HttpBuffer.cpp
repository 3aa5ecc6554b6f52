#include "HttpBuffer.hpp"
#include <cstdlib>
#include <sstream>

namespace fleet_ops::http
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            const char *ws = " \t\r\n";
            std::size_t start = text.find_first_not_of(ws);
            if (start == std::string::npos)
                return "";
            std::size_t end = text.find_last_not_of(ws);
            return text.substr(start, end - start + 1);
        }

        bool ParseContentLength(const HeaderMap &headers, std::size_t &length, bool &present)
        {
            present = false;
            auto it = headers.find("content-length");
            if (it == headers.end())
                return true;

            present = true;
            const std::string &value = it->second;
            if (value.empty())
                return false;

            char *end = nullptr;
            unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0')
                return false;
            if (parsed > MAX_BODY_BYTES)
                return false;

            length = static_cast<std::size_t>(parsed);
            return true;
        }

        bool IsChunked(const HeaderMap &headers)
        {
            auto it = headers.find("transfer-encoding");
            return it != headers.end() && ToLower(it->second).find("chunked") != std::string::npos;
        }
    }

    void HttpBuffer::Append(const char *data, std::size_t size)
    {
        m_buffer.append(data, size);
    }

    std::size_t HttpBuffer::HeaderEnd() const
    {
        return m_buffer.find("\r\n\r\n");
    }

    bool HttpBuffer::HasHeader() const
    {
        return HeaderEnd() != std::string::npos;
    }

    bool HttpBuffer::Overflowed() const
    {
        if (!HasHeader())
            return m_buffer.size() > MAX_HEADER_BYTES;
        return m_buffer.size() > MAX_HEADER_BYTES + MAX_BODY_BYTES;
    }

    bool HttpBuffer::ParseHeaderLines(const std::string &block, HeaderMap &headers)
    {
        std::istringstream lines(block);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            std::size_t colon = line.find(':');
            if (colon == std::string::npos || colon == 0)
                return false;

            headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
        }
        return true;
    }

    ParseState HttpBuffer::ParseRequest(Request &out) const
    {
        std::size_t header_end = HeaderEnd();
        if (header_end == std::string::npos)
        {
            if (m_buffer.size() > MAX_HEADER_BYTES)
                return ParseState::Invalid;
            return ParseState::Incomplete;
        }

        std::size_t line_end = m_buffer.find("\r\n");
        std::istringstream request_line(m_buffer.substr(0, line_end));

        Request req;
        std::string version;
        if (!(request_line >> req.method >> req.target >> version))
            return ParseState::Invalid;
        if (version.compare(0, 5, "HTTP/") != 0 || req.target.empty() || req.target[0] != '/')
            return ParseState::Invalid;

        if (line_end < header_end &&
            !ParseHeaderLines(m_buffer.substr(line_end + 2, header_end - line_end - 2), req.headers))
            return ParseState::Invalid;

        if (IsChunked(req.headers))
            return ParseState::Invalid;

        std::size_t length = 0;
        bool has_length = false;
        if (!ParseContentLength(req.headers, length, has_length))
            return ParseState::Invalid;

        std::size_t body_start = header_end + 4;
        if (m_buffer.size() - body_start < length)
            return ParseState::Incomplete;

        req.body = m_buffer.substr(body_start, length);
        out = std::move(req);
        return ParseState::Complete;
    }
}
