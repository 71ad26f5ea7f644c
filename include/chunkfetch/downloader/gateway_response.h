#pragma once

/*
 * Interpretation of gateway HTTP responses, independent of the transport that fetched them.
 */

#include <chunkfetch/downloader/downloader.hpp>

#include <string>
#include <string_view>

namespace chunkfetch::downloader {

/**
 * Status and body of one completed HTTP exchange.
 */
struct HttpResponse {
    long status{0};
    std::string body;
};

// Longest slice of a non-JSON error body carried into an error message
inline constexpr std::size_t kMaxErrorBody = 256;

// Percent-encode everything outside the RFC 3986 unreserved set
std::string escapePathSegment(std::string_view segment);

/**
 * "HTTP <status>" followed by the JSON "error" field, or by the first kMaxErrorBody bytes of a
 * non-JSON body.
 */
std::string describeFailure(const HttpResponse& resp);

/**
 * `{ "size": "<dec>", "offset": "<dec>" }` from the metadata endpoint. Numbers are accepted as
 * strings or unsigned JSON integers. A non-200 status, a malformed body or a missing/invalid
 * field fails with ErrorCode::MetadataFetchFailed.
 */
Result<ContentMetadata> parseMetadataResponse(const HttpResponse& resp);

/**
 * `{ "chunk": "<b64url>", "data_path": ..., "tx_path": ... }` from the chunk endpoint.
 * A non-200 status or a body without a string "chunk" fails with ErrorCode::ChunkFetchFailed.
 */
Result<ChunkResponse> parseChunkResponse(const BigInt& offset, const HttpResponse& resp);

} // namespace chunkfetch::downloader
