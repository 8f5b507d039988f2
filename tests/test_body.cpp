#include <catch2/catch_test_macros.hpp>
#include "core/body.hpp"

using namespace rulegate;

TEST_CASE("Body: empty bytes parse to an empty body", "[body]") {
    const auto body = Body::parse("");
    CHECK(body.is_empty());
    CHECK_FALSE(body.is_json());
    CHECK(body.serialize().empty());
}

TEST_CASE("Body: JSON is parsed and re-serialized compactly", "[body]") {
    const auto body = Body::parse(R"({ "name" : "kb", "size": 3 })");
    REQUIRE(body.is_json());
    CHECK(body.json()["name"] == "kb");
    CHECK(body.serialize() == R"({"name":"kb","size":3})");
}

TEST_CASE("Body: non-JSON bytes survive unchanged", "[body]") {
    const std::string form = "--boundary\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\nabc";
    const auto body = Body::parse(form);
    REQUIRE(body.is_raw());
    CHECK(body.raw_bytes() == form);
    CHECK(body.serialize() == form);
}

TEST_CASE("Body: truncated JSON stays raw", "[body]") {
    const auto body = Body::parse(R"({"a": [1, 2)");
    CHECK(body.is_raw());
}

TEST_CASE("Body: edits to the JSON value show up in serialize", "[body]") {
    auto body = Body::parse(R"({"data":[1,2,3]})");
    REQUIRE(body.is_json());
    body.json()["data"].erase(1);
    CHECK(body.serialize() == R"({"data":[1,3]})");
}
