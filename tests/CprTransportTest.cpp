#include "core/downloader/CprTransport.hpp"

#include <gtest/gtest.h>

namespace modelfetch::core::downloader {

TEST(CprTransportTest, ParsesStatusAndLength) {
    ResponseHead head;
    CprTransport::parseHeaderLine("HTTP/1.1 200 OK\r\n", head);
    CprTransport::parseHeaderLine("Content-Length: 1024\r\n", head);
    CprTransport::parseHeaderLine("Content-Type: application/octet-stream\r\n", head);

    EXPECT_EQ(head.statusCode, 200);
    EXPECT_EQ(head.contentLength, 1024);
    EXPECT_EQ(head.contentRangeTotal, -1);
}

TEST(CprTransportTest, ParsesContentRangeTotal) {
    ResponseHead head;
    CprTransport::parseHeaderLine("HTTP/2 206\r\n", head);
    CprTransport::parseHeaderLine("content-range: bytes 500-999/1000\r\n", head);
    CprTransport::parseHeaderLine("CONTENT-LENGTH: 500\r\n", head);

    EXPECT_TRUE(head.isPartialContent());
    EXPECT_EQ(head.contentRangeStart, 500);
    EXPECT_EQ(head.contentRangeTotal, 1000);
    EXPECT_EQ(head.contentLength, 500);
}

TEST(CprTransportTest, UnsatisfiedRangeHasNoStart) {
    ResponseHead head;
    CprTransport::parseHeaderLine("HTTP/1.1 416 Range Not Satisfiable\r\n", head);
    CprTransport::parseHeaderLine("Content-Range: bytes */1000\r\n", head);

    EXPECT_EQ(head.contentRangeStart, -1);
    EXPECT_EQ(head.contentRangeTotal, 1000);
}

TEST(CprTransportTest, StatusLineResetsAfterRedirect) {
    ResponseHead head;
    CprTransport::parseHeaderLine("HTTP/1.1 302 Found\r\n", head);
    CprTransport::parseHeaderLine("Content-Length: 12\r\n", head);
    CprTransport::parseHeaderLine("\r\n", head);
    CprTransport::parseHeaderLine("HTTP/1.1 200 OK\r\n", head);

    EXPECT_EQ(head.statusCode, 200);
    EXPECT_EQ(head.contentLength, -1);
}

TEST(CprTransportTest, IgnoresMalformedLines) {
    ResponseHead head;
    CprTransport::parseHeaderLine("HTTP/1.1 200 OK", head);
    CprTransport::parseHeaderLine("garbage without colon", head);
    CprTransport::parseHeaderLine("Content-Length: lots", head);

    EXPECT_EQ(head.statusCode, 200);
    EXPECT_EQ(head.contentLength, -1);
}

} // namespace modelfetch::core::downloader
