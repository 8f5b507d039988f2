#include <catch2/catch_test_macros.hpp>
#include "upstream/header_filter.hpp"

using namespace rulegate;

TEST_CASE("HeaderFilter: hop-by-hop names, any case", "[headers]") {
    CHECK(header_filter::is_hop_by_hop("Connection"));
    CHECK(header_filter::is_hop_by_hop("transfer-encoding"));
    CHECK(header_filter::is_hop_by_hop("KEEP-ALIVE"));
    CHECK(header_filter::is_hop_by_hop("Upgrade"));
    CHECK_FALSE(header_filter::is_hop_by_hop("Content-Type"));
    CHECK_FALSE(header_filter::is_hop_by_hop("X-Request-Id"));
}

TEST_CASE("HeaderFilter: caller headers going upstream", "[headers]") {
    HeaderMap in{
        {"Authorization", "Bearer caller-key"},
        {"Host", "gateway.local"},
        {"Content-Length", "12"},
        {"Connection", "keep-alive"},
        {"Content-Type", "multipart/form-data; boundary=x"},
        {"X-Request-Id", "abc"},
        {"Accept-Language", "en"},
    };

    const auto out = header_filter::for_upstream(in);
    CHECK(out.count("authorization") == 0);
    CHECK(out.count("host") == 0);
    CHECK(out.count("content-length") == 0);
    CHECK(out.count("connection") == 0);
    CHECK(header_value(out, "content-type") == "multipart/form-data; boundary=x");
    CHECK(header_value(out, "x-request-id") == "abc");
    CHECK(out.size() == 3);
}

TEST_CASE("HeaderFilter: upstream headers going back to the caller", "[headers]") {
    HeaderMap in{
        {"Content-Type", "application/json"},
        {"Content-Length", "2"},
        {"Transfer-Encoding", "chunked"},
        {"Set-Cookie", "a=1"},
        {"Set-Cookie", "b=2"},
        {"ETag", "\"v1\""},
    };

    const auto out = header_filter::for_caller(in);
    CHECK(out.count("content-type") == 0);
    CHECK(out.count("content-length") == 0);
    CHECK(out.count("transfer-encoding") == 0);
    CHECK(out.count("set-cookie") == 2);
    CHECK(header_value(out, "etag") == "\"v1\"");
}
