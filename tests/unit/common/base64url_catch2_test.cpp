#include <catch2/catch_test_macros.hpp>
#include <chunkfetch/common/base64url.h>

#include "../../common/fake_chunk_client.h"

#include <string>
#include <vector>

using namespace chunkfetch;
using namespace chunkfetch::common;

namespace {

ByteVector bytes(const std::string& s) {
    ByteVector out;
    for (char c : s)
        out.push_back(static_cast<std::byte>(c));
    return out;
}

} // namespace

TEST_CASE("base64UrlEncode matches RFC 4648 vectors without padding", "[common][base64]") {
    CHECK(base64UrlEncode(ByteSpan{}).empty());
    CHECK(base64UrlEncode(bytes("f")) == "Zg");
    CHECK(base64UrlEncode(bytes("fo")) == "Zm8");
    CHECK(base64UrlEncode(bytes("foo")) == "Zm9v");
    CHECK(base64UrlEncode(bytes("foob")) == "Zm9vYg");
    CHECK(base64UrlEncode(bytes("fooba")) == "Zm9vYmE");
    CHECK(base64UrlEncode(bytes("foobar")) == "Zm9vYmFy");
}

TEST_CASE("base64UrlEncode uses the URL-safe alphabet", "[common][base64]") {
    const ByteVector data{std::byte{0xFB}, std::byte{0xFF}, std::byte{0xBF}};
    CHECK(base64UrlEncode(data) == "-_-_");
}

TEST_CASE("base64UrlDecode accepts padded, unpadded and standard-alphabet input",
          "[common][base64]") {
    CHECK(base64UrlDecode("Zm9vYmE").value() == bytes("fooba"));
    CHECK(base64UrlDecode("Zm9vYmE=").value() == bytes("fooba"));
    CHECK(base64UrlDecode("Zm8=").value() == bytes("fo"));
    CHECK(base64UrlDecode("").value().empty());

    const ByteVector data{std::byte{0xFB}, std::byte{0xFF}, std::byte{0xBF}};
    CHECK(base64UrlDecode("-_-_").value() == data);
    CHECK(base64UrlDecode("+/+/").value() == data);
}

TEST_CASE("base64UrlDecode reverses encoding of a full chunk", "[common][base64]") {
    const auto data = test::makePatternBytes(MAX_CHUNK_SIZE + 2, 21);
    auto decoded = base64UrlDecode(base64UrlEncode(data));
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == data);
}

TEST_CASE("base64UrlDecode rejects malformed input", "[common][base64][error]") {
    for (const char* bad : {"Zm9v!", "Zm 9v", "Z", "Zm9vY", "Zm=v"}) {
        INFO("input: " << bad);
        auto r = base64UrlDecode(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidData);
    }
}
