#include <gtest/gtest.h>

#include "common/HttpBuffer.hpp"
#include "common/HttpMessage.hpp"

using namespace fleet_ops::http;

namespace
{
    HttpBuffer Fill(const std::string &raw)
    {
        HttpBuffer buffer;
        buffer.Append(raw.data(), raw.size());
        return buffer;
    }
}

TEST(HttpBufferTest, RequestLineAndBody)
{
    HttpBuffer buffer = Fill("POST /api/device/pi-01/sync HTTP/1.1\r\nHost: x\r\nContent-Length: 2\r\n\r\n{}");

    Request req;
    ASSERT_EQ(buffer.ParseRequest(req), ParseState::Complete);
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.target, "/api/device/pi-01/sync");
    EXPECT_EQ(req.headers["host"], "x");
    EXPECT_EQ(req.body, "{}");
}

TEST(HttpBufferTest, RequestIncompleteUntilHeaderEnd)
{
    Request req;
    EXPECT_EQ(Fill("GET /api/devices HTTP/1.1\r\nHost: x\r\n").ParseRequest(req), ParseState::Incomplete);
    EXPECT_EQ(Fill("GET api/devices HTTP/1.1\r\n\r\n").ParseRequest(req), ParseState::Invalid);
    EXPECT_EQ(Fill("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n").ParseRequest(req), ParseState::Invalid);
}

TEST(HttpBufferTest, GarbageIsInvalid)
{
    Request req;
    EXPECT_EQ(Fill("SSH-2.0-OpenSSH\r\n\r\n").ParseRequest(req), ParseState::Invalid);
    EXPECT_EQ(Fill("GET /x HTTP/1.1\r\nno colon here\r\n\r\n").ParseRequest(req), ParseState::Invalid);
    EXPECT_EQ(Fill("POST /x HTTP/1.1\r\nContent-Length: ten\r\n\r\n").ParseRequest(req), ParseState::Invalid);
}

TEST(HttpBufferTest, RequestWaitsForFullBody)
{
    Request req;
    HttpBuffer buffer = Fill("POST /api/device/pi-01/sync HTTP/1.1\r\nContent-Length: 5\r\n\r\n{}");
    EXPECT_EQ(buffer.ParseRequest(req), ParseState::Incomplete);

    buffer.Append("{}{", 3);
    ASSERT_EQ(buffer.ParseRequest(req), ParseState::Complete);
    EXPECT_EQ(req.body, "{}{}{");
}

TEST(HttpBufferTest, OversizedHeaderOverflows)
{
    HttpBuffer buffer = Fill("GET / HTTP/1.1\r\nX: " + std::string(MAX_HEADER_BYTES, 'a'));
    EXPECT_TRUE(buffer.Overflowed());
}

TEST(HttpMessageTest, ErrorResponseIsJson)
{
    Response resp = MakeErrorResponse(404, "Unknown device 'x'");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.reason, "Not Found");
    EXPECT_EQ(nlohmann::json::parse(resp.body)["error"], "Unknown device 'x'");

    std::string wire = SerializeResponse(resp);
    EXPECT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Length: " + std::to_string(resp.body.size())), std::string::npos);
}
