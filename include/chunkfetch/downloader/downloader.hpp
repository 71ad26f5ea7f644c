#pragma once

/*
 * chunkfetch downloader - public types and interfaces
 *
 * Reassembles a content object that a gateway stores as a run of fixed-size chunks
 * addressed by absolute byte offset.
 *
 * Design principles:
 * - Metadata first: size/offset decide the chunk plan before any chunk is requested
 * - Arbitrary-precision offsets (boost::multiprecision::cpp_int) end to end
 * - Bounded window of concurrent fetches, output strictly in chunk order
 * - Exact byte accounting: a stream either yields the declared size or fails
 * - Transport behind IChunkClient (libcurl implementation in gateway_client.cpp)
 */

#include <chunkfetch/core/types.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkfetch::downloader {

using BigInt = boost::multiprecision::cpp_int;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Size and end offset of a content object, as reported by the metadata endpoint.
 * Invariant: offset >= size - 1.
 */
struct ContentMetadata {
    BigInt size;
    BigInt offset; // absolute position of the last byte
};

/**
 * One chunk as returned by the chunk endpoint. The proofs are carried untouched.
 */
struct ChunkResponse {
    std::string chunk; // base64url
    std::string dataPath;
    std::string txPath;
};

/**
 * Chunk boundaries derived from ContentMetadata.
 */
struct ChunkPlan {
    BigInt startOffset;
    BigInt size;
    std::uint64_t chunkCount{0};

    // Absolute offset of chunk `index`
    [[nodiscard]] BigInt offsetOf(std::uint64_t index) const {
        return startOffset + BigInt(index) * MAX_CHUNK_SIZE;
    }
};

/**
 * Progress after a chunk has been handed to the consumer.
 */
struct ProgressEvent {
    std::string id;
    std::uint64_t chunkIndex{0};
    std::uint64_t chunkCount{0};
    BigInt processedBytes;
    BigInt totalBytes;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * Per-download options.
 */
struct DownloadOptions {
    int concurrency{DEFAULT_DOWNLOAD_CONCURRENCY}; // must be > 0
    ProgressCallback onProgress{};
};

/**
 * Gateway connection settings for the libcurl client.
 */
struct GatewayConfig {
    std::string baseUrl{"https://arweave.net"};
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{60000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

// ==========================
// Service interface classes
// ==========================

/**
 * Transport seam for the two gateway endpoints.
 * Implementations must tolerate concurrent getChunk() calls from worker threads.
 */
class IChunkClient {
public:
    virtual ~IChunkClient() = default;

    /**
     * Size/offset of the content object `id`.
     * Fails with ErrorCode::MetadataFetchFailed on any non-success response.
     */
    virtual Result<ContentMetadata> getMetadata(std::string_view id) = 0;

    /**
     * Chunk stored at absolute `offset`.
     * Fails with ErrorCode::ChunkFetchFailed on any non-success response.
     */
    virtual Result<ChunkResponse> getChunk(const BigInt& offset) = 0;
};

// ======================
// Plan helpers
// ======================

/**
 * Parse a decimal, non-negative integer as sent by the gateway.
 */
Result<BigInt> parseDecimal(std::string_view text);

/**
 * offset - size + 1. Fails with ErrorCode::InvalidData when offset < size - 1.
 */
Result<BigInt> firstChunkOffset(const ContentMetadata& metadata);

/**
 * Start offset and chunk count (ceil(size / MAX_CHUNK_SIZE)) for `metadata`.
 */
Result<ChunkPlan> planChunks(const ContentMetadata& metadata);

// ======================
// Streaming download
// ======================

/**
 * Lazy, finite, non-restartable sequence of chunk payloads for one content object.
 *
 * Chunks 0..count-3 are fetched through a FIFO window of at most `concurrency` outstanding
 * requests; the consumer always waits on the oldest one, so output follows chunk index even
 * when later requests finish first. The final two chunks are fetched one at a time, the very
 * last only while the running total is short of the declared size. After the last chunk the
 * total is checked against the declared size (ErrorCode::SizeMismatch).
 *
 * Destroying a stream does not abort requests already issued; it waits for them and drops
 * their results.
 */
class ChunkStream {
public:
    // Throws std::invalid_argument for a null client or concurrency <= 0
    ChunkStream(std::shared_ptr<IChunkClient> client, std::string id, ChunkPlan plan,
                DownloadOptions options);
    ~ChunkStream();

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;
    ChunkStream(ChunkStream&&) noexcept;
    ChunkStream& operator=(ChunkStream&&) noexcept;

    /**
     * Next chunk payload, std::nullopt when the sequence ended and verified.
     * After an error every further call reports the same error.
     */
    Result<std::optional<ByteVector>> next();

    [[nodiscard]] const ChunkPlan& plan() const;
    [[nodiscard]] const BigInt& processedBytes() const;
    // Largest number of window fetches that were outstanding at once
    [[nodiscard]] std::size_t peakInFlight() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Entry point: metadata lookup, chunk access and stream construction over one client.
 */
class ChunkedDownloader {
public:
    explicit ChunkedDownloader(std::shared_ptr<IChunkClient> client);

    Result<ContentMetadata> getMetadata(std::string_view id);
    Result<ChunkResponse> getChunk(const BigInt& offset);

    // Chunk payload at `offset`, base64url-decoded
    Result<ByteVector> getChunkData(const BigInt& offset);

    /**
     * Fetch metadata for `id` and return a stream over its chunks.
     * Fails with MetadataFetchFailed before any chunk is requested, or InvalidArgument for a
     * non-positive concurrency.
     */
    Result<ChunkStream> open(std::string_view id, DownloadOptions options = {});

    /**
     * Drain a stream into one buffer of the declared size.
     */
    Result<ByteVector> downloadChunkedData(std::string_view id, DownloadOptions options = {});

private:
    std::shared_ptr<IChunkClient> client_;
};

/**
 * libcurl-backed client for `{baseUrl}/tx/{id}/offset` and `{baseUrl}/chunk/{offset}`.
 */
std::shared_ptr<IChunkClient> makeGatewayClient(GatewayConfig config);

} // namespace chunkfetch::downloader
