// libcurl gateway client against an endpoint that refuses connections

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <chunkfetch/downloader/downloader.hpp>

#include <chrono>

using namespace chunkfetch;
using namespace chunkfetch::downloader;
using Catch::Matchers::ContainsSubstring;

namespace {

std::shared_ptr<IChunkClient> unreachableGateway() {
    GatewayConfig cfg;
    cfg.baseUrl = "http://127.0.0.1:1/";
    cfg.timeout = std::chrono::milliseconds(2000);
    return makeGatewayClient(cfg);
}

} // namespace

TEST_CASE("Gateway client reports transport failures with endpoint-specific codes",
          "[downloader][gateway]") {
    auto client = unreachableGateway();

    SECTION("metadata") {
        auto r = client->getMetadata("some/tx id");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::MetadataFetchFailed);
        CHECK_THAT(r.error().message, ContainsSubstring("Unable to get transaction offset"));
    }

    SECTION("chunk") {
        auto r = client->getChunk(BigInt(1) << 70);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::ChunkFetchFailed);
        CHECK_THAT(r.error().message, ContainsSubstring("1180591620717411303424"));
    }
}

TEST_CASE("ChunkedDownloader over an unreachable gateway fails before any chunk",
          "[downloader][gateway]") {
    ChunkedDownloader dl(unreachableGateway());
    auto r = dl.downloadChunkedData("tx");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::MetadataFetchFailed);
}
