#pragma once

#include <chunkfetch/chunking/chunk_buffer.h>
#include <chunkfetch/core/types.h>

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <vector>

namespace chunkfetch::chunking {

/**
 * Pull-based source of input buffers. Returns std::nullopt once the input is exhausted and
 * keeps returning it afterwards.
 */
using ByteSource = std::function<std::optional<ByteVector>()>;

struct FixedSizeChunkerOptions {
    // Emit the trailing partial chunk instead of dropping it
    bool flush = false;
};

/**
 * Re-slices a stream of arbitrarily sized buffers into buffers of exactly chunkSize bytes.
 *
 * Two ways to drive it:
 * - pull: construct with a ByteSource and call next() until it returns std::nullopt
 * - push: construct without a source, feed write() and close with finish()
 *
 * Only the last emitted buffer may be shorter than chunkSize, and only with options.flush.
 * Once exhausted the chunker stays exhausted; build a new one to chunk again.
 */
class FixedSizeChunker {
public:
    // Throws std::invalid_argument when chunkSize is zero.
    explicit FixedSizeChunker(std::size_t chunkSize, FixedSizeChunkerOptions options = {});
    FixedSizeChunker(ByteSource source, std::size_t chunkSize,
                     FixedSizeChunkerOptions options = {});

    FixedSizeChunker(const FixedSizeChunker&) = delete;
    FixedSizeChunker& operator=(const FixedSizeChunker&) = delete;
    FixedSizeChunker(FixedSizeChunker&&) = default;
    FixedSizeChunker& operator=(FixedSizeChunker&&) = default;

    /**
     * Next output buffer, pulling from the source as needed.
     * Returns std::nullopt once the source is drained and any flushed remainder was returned.
     * Without a source there is nothing to pull: drive the chunker with write() instead.
     */
    std::optional<ByteVector> next();

    /**
     * Push one input buffer and collect every complete chunk it produced.
     * Fails with ErrorCode::InvalidState after finish().
     */
    Result<std::vector<ByteVector>> write(ByteSpan data);

    /**
     * Close the input. Returns the flushed remainder when options.flush is set and bytes are
     * pending, otherwise an empty vector.
     */
    std::vector<ByteVector> finish();

    std::size_t chunkSize() const noexcept { return chunkSize_; }
    std::size_t buffered() const noexcept { return buffer_.size(); }
    bool exhausted() const noexcept { return inputDone_ && buffer_.empty(); }

private:
    std::optional<ByteVector> popChunk();
    std::optional<ByteVector> closeInput();

    ByteSource source_;
    ChunkBuffer buffer_;
    std::size_t chunkSize_;
    FixedSizeChunkerOptions options_;
    bool inputDone_ = false;
};

// Source that reads an istream in readSize pieces until EOF.
ByteSource sourceFromStream(std::istream& in, std::size_t readSize = DEFAULT_READ_BUFFER_SIZE);

// Source that yields the given buffers in order.
ByteSource sourceFromBuffers(std::vector<ByteVector> buffers);

} // namespace chunkfetch::chunking
