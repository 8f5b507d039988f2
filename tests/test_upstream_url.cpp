#include <catch2/catch_test_macros.hpp>
#include "upstream/upstream_url.hpp"

using namespace rulegate;

TEST_CASE("UpstreamUrl: http with port and base path", "[upstream][url]") {
    auto url = UpstreamUrl::parse("http://127.0.0.1:9380/api/");
    REQUIRE(url.has_value());
    CHECK_FALSE(url->use_ssl);
    CHECK(url->host == "127.0.0.1");
    CHECK(url->port == 9380);
    CHECK(url->base_path == "/api");
    CHECK(url->scheme_host_port() == "http://127.0.0.1:9380");
}

TEST_CASE("UpstreamUrl: default ports", "[upstream][url]") {
    auto plain = UpstreamUrl::parse("http://ragflow");
    REQUIRE(plain.has_value());
    CHECK(plain->port == 80);
    CHECK(plain->base_path.empty());

    auto tls = UpstreamUrl::parse("https://agents.example.com/v2");
    REQUIRE(tls.has_value());
    CHECK(tls->use_ssl);
    CHECK(tls->port == 443);
    CHECK(tls->base_path == "/v2");
    CHECK(tls->scheme_host_port() == "https://agents.example.com:443");
}

TEST_CASE("UpstreamUrl: rejects unusable URLs", "[upstream][url]") {
    CHECK_FALSE(UpstreamUrl::parse("").has_value());
    CHECK_FALSE(UpstreamUrl::parse("ftp://host").has_value());
    CHECK_FALSE(UpstreamUrl::parse("127.0.0.1:8080").has_value());
    CHECK_FALSE(UpstreamUrl::parse("http://").has_value());
    CHECK_FALSE(UpstreamUrl::parse("http://host:0").has_value());
    CHECK_FALSE(UpstreamUrl::parse("http://host:99999").has_value());
    CHECK_FALSE(UpstreamUrl::parse("http://host:abc/x").has_value());
}

TEST_CASE("UpstreamUrl: root path is not a base path", "[upstream][url]") {
    auto url = UpstreamUrl::parse("http://host:8000/");
    REQUIRE(url.has_value());
    CHECK(url->base_path.empty());
}
