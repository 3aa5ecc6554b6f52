#pragma once

#include <cstddef>
#include <string>
#include "HttpMessage.hpp"

namespace fleet_ops::http
{
    enum class ParseState
    {
        Incomplete,
        Complete,
        Invalid
    };

    // Accumulates the bytes an API client sends until one full request is
    // present. Requests with chunked bodies are refused.
    class HttpBuffer
    {
    private:
        std::string m_buffer;

        std::size_t HeaderEnd() const;
        bool HasHeader() const;
        static bool ParseHeaderLines(const std::string &block, HeaderMap &headers);

    public:
        HttpBuffer() = default;

        void Append(const char *data, std::size_t size);
        bool Overflowed() const;
        void Clear() { m_buffer.clear(); }

        ParseState ParseRequest(Request &out) const;
    };
}
