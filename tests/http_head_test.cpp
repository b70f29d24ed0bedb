#include "rdm/detail/http_head.hpp"
#include "rdm/errors.hpp"

#include <gtest/gtest.h>

#include <string>

using rdm::ResponseHead;
using rdm::detail::parseContentRange;
using rdm::detail::parseHeaderLine;
using rdm::detail::requireSuccessStatus;
using rdm::TransferError;

namespace {

TEST(HttpHeadTest, ParsesPartialContentHead) {
    ResponseHead head;
    parseHeaderLine("HTTP/1.1 206 Partial Content\r\n", head);
    parseHeaderLine("Content-Length: 3976\r\n", head);
    parseHeaderLine("content-range: bytes 1024-4999/5000\r\n", head);

    EXPECT_EQ(head.status_code, 206);
    EXPECT_EQ(head.content_length, 3976);
    EXPECT_EQ(head.range_start, 1024);
    EXPECT_EQ(head.range_total, 5000);
}

TEST(HttpHeadTest, StatusLineResetsPreviousHead) {
    ResponseHead head;
    parseHeaderLine("HTTP/1.1 302 Found\r\n", head);
    parseHeaderLine("Content-Length: 17\r\n", head);
    parseHeaderLine("HTTP/2 200\r\n", head);

    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(head.content_length, -1);
    EXPECT_EQ(head.range_start, -1);
}

TEST(HttpHeadTest, IgnoresMalformedValues) {
    ResponseHead head;
    parseHeaderLine("HTTP/1.1 200 OK\r\n", head);
    parseHeaderLine("Content-Length: lots\r\n", head);
    parseHeaderLine("Content-Range: items 0-1/2\r\n", head);
    parseHeaderLine("no colon here\r\n", head);

    EXPECT_EQ(head.content_length, -1);
    EXPECT_EQ(head.range_start, -1);
}

TEST(HttpHeadTest, ContentRangeWithUnknownTotal) {
    ResponseHead head;
    ASSERT_TRUE(parseContentRange("bytes 0-99/*", head));
    EXPECT_EQ(head.range_start, 0);
    EXPECT_EQ(head.range_total, -1);

    ResponseHead untouched;
    EXPECT_FALSE(parseContentRange("bytes 50-10/100", untouched));
    EXPECT_FALSE(parseContentRange("bytes */100", untouched));
    EXPECT_EQ(untouched.range_start, -1);
}

TEST(HttpHeadTest, UnfollowedRedirectIsRejected) {
    ResponseHead head;
    parseHeaderLine("HTTP/1.1 302 Found\r\n", head);
    parseHeaderLine("Content-Length: 18\r\n", head);

    try {
        requireSuccessStatus(head, "http://example.com/data.bin");
        FAIL() << "302 accepted as a body";
    } catch (const TransferError& ex) {
        EXPECT_NE(std::string{ex.what()}.find("HTTP status 302"), std::string::npos);
    }
}

TEST(HttpHeadTest, OnlySuccessStatusesCarryTheResource) {
    for (long code : {100L, 301L, 304L, 404L, 416L, 503L}) {
        ResponseHead head;
        head.status_code = code;
        EXPECT_THROW(requireSuccessStatus(head, "http://example.com/data.bin"), TransferError) << code;
    }
    for (long code : {0L, 200L, 206L}) {
        ResponseHead head;
        head.status_code = code;
        EXPECT_NO_THROW(requireSuccessStatus(head, "file:///tmp/data.bin")) << code;
    }
}

} // namespace
