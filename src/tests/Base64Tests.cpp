// SPDX-License-Identifier: Apache-2.0
#include <core/Base64.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>

using namespace meetlink;

namespace
{

    auto bytesOf(std::string_view text) -> std::vector<std::byte>
    {
        auto out = std::vector<std::byte> {};
        for (auto const c: text)
            out.push_back(static_cast<std::byte>(c));
        return out;
    }

} // namespace

TEST_CASE("base64::encode pads to a multiple of four", "[base64]")
{
    CHECK(base64::encode(bytesOf("")).empty());
    CHECK(base64::encode(bytesOf("M")) == "TQ==");
    CHECK(base64::encode(bytesOf("Ma")) == "TWE=");
    CHECK(base64::encode(bytesOf("Man")) == "TWFu");
    CHECK(base64::encode(bytesOf("hello world")) == "aGVsbG8gd29ybGQ=");
}

TEST_CASE("base64::decode reverses encode for binary data", "[base64]")
{
    auto data = std::vector<std::byte> {};
    for (auto i = 0; i < 256; ++i)
        data.push_back(static_cast<std::byte>(i));

    auto decoded = base64::decode(base64::encode(data));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == data);
}

TEST_CASE("base64::decode ignores whitespace and accepts missing padding", "[base64]")
{
    auto wrapped = base64::decode("aGVs\nbG8g\r\nd29y bGQ=");
    REQUIRE(wrapped.has_value());
    CHECK(*wrapped == bytesOf("hello world"));

    auto unpadded = base64::decode("TWE");
    REQUIRE(unpadded.has_value());
    CHECK(*unpadded == bytesOf("Ma"));
}

TEST_CASE("base64::decode rejects malformed input", "[base64]")
{
    SECTION("invalid character")
    {
        auto result = base64::decode("TW$u");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }

    SECTION("data after padding")
    {
        auto result = base64::decode("TQ==TWFu");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }

    SECTION("truncated quantum")
    {
        auto result = base64::decode("TWFuT");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }
}
