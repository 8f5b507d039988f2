#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"

using namespace rulegate;

TEST_CASE("Base64: encodes with padding", "[base64]") {
    CHECK(base64::encode("") == "");
    CHECK(base64::encode("f") == "Zg==");
    CHECK(base64::encode("fo") == "Zm8=");
    CHECK(base64::encode("foo") == "Zm9v");
    CHECK(base64::encode("s3cr3t!") == "czNjcjN0IQ==");
}

TEST_CASE("Base64: long input has no line breaks", "[base64]") {
    const std::string input(200, 'x');
    const auto encoded = base64::encode(input);
    CHECK(encoded.find('\n') == std::string::npos);
    CHECK(encoded.size() == 4 * ((input.size() + 2) / 3));
}

TEST_CASE("Base64: decode strips padding bytes", "[base64]") {
    auto one = base64::decode("Zg==");
    REQUIRE(one.has_value());
    CHECK(*one == "f");

    auto two = base64::decode("Zm8=");
    REQUIRE(two.has_value());
    CHECK(*two == "fo");

    auto none = base64::decode("Zm9v");
    REQUIRE(none.has_value());
    CHECK(*none == "foo");
}

TEST_CASE("Base64: decode ignores line breaks", "[base64]") {
    auto decoded = base64::decode("Zm9v\nYmFy\r\n");
    REQUIRE(decoded.has_value());
    CHECK(*decoded == "foobar");
}

TEST_CASE("Base64: decode keeps binary bytes", "[base64]") {
    const std::string binary{'\0', '\xff', '\x10', '\0'};
    auto decoded = base64::decode(base64::encode(binary));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == binary);
}

TEST_CASE("Base64: decode rejects malformed input", "[base64]") {
    CHECK_FALSE(base64::decode("abc").has_value());
    CHECK_FALSE(base64::decode("a!c=").has_value());
    auto empty = base64::decode("");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}
