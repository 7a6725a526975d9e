#include <gtest/gtest.h>
#include "network/CurlTransport.hpp"
#include "core/Errors.hpp"
#include "support/SlowHttpServer.hpp"

static std::string ok_head(size_t length) {
    return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(length) + "\r\nConnection: close\r\n\r\n";
}

TEST(CurlTransportTest, StallWindowRoundsUpToWholeSeconds) {
    EXPECT_EQ(CurlTransport::stall_seconds(1), 1);
    EXPECT_EQ(CurlTransport::stall_seconds(1000), 1);
    EXPECT_EQ(CurlTransport::stall_seconds(1500), 2);
    EXPECT_EQ(CurlTransport::stall_seconds(15000), 15);
}

TEST(CurlTransportTest, SlowButSteadyBodyOutlivesTimeout) {
    SlowHttpServer server;
    std::vector<std::string> chunks(5, std::string(1000, 'a'));
    server.start(ok_head(5000), chunks, 400);

    CurlTransport transport(1000, "zdm-test");
    std::string received;
    HttpResponse response = transport.get_stream(server.url("/slow"), [&](const uint8_t* data, size_t size) {
        received.append(reinterpret_cast<const char*>(data), size);
    });

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(received.size(), 5000u);
}

TEST(CurlTransportTest, StalledBodyIsATransportError) {
    SlowHttpServer server;
    server.start(ok_head(5000), {std::string(100, 'a')}, 0, 3000);

    CurlTransport transport(1000, "zdm-test");
    size_t received = 0;
    EXPECT_THROW(transport.get_stream(server.url("/stall"), [&](const uint8_t*, size_t size) { received += size; }),
                 TransportError);
    EXPECT_EQ(received, 100u);
}

TEST(CurlTransportTest, RangedAnswerCarriesBodyAndHeaders) {
    SlowHttpServer server;
    server.start("HTTP/1.1 206 Partial Content\r\nContent-Range: bytes 10-19/100\r\n"
                 "Content-Length: 10\r\nConnection: close\r\n\r\n",
                 {"0123456789"}, 0);

    CurlTransport transport(2000, "zdm-test");
    HttpResponse response = transport.get_range(server.url("/file"), 10, 10);

    EXPECT_EQ(response.status, 206);
    EXPECT_EQ(response.content_range_total(), 100);
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "0123456789");
}

TEST(CurlTransportTest, FullAnswerToRangedRequestDropsBody) {
    SlowHttpServer server;
    server.start(ok_head(20), {std::string(20, 'x')}, 0);

    CurlTransport transport(2000, "zdm-test");
    HttpResponse response = transport.get_range(server.url("/file"), 0, 10);

    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body.empty());
    EXPECT_EQ(response.content_length(), 20);
}
