#pragma once

#include <chunkfetch/core/types.h>

#include <cstddef>
#include <deque>

namespace chunkfetch::chunking {

/**
 * Ordered queue of byte segments that can be drained in exact-length pieces.
 *
 * Segments are kept as pushed; pop() splices across as many of them as needed and splits the
 * head segment when it holds more than requested. The buffer is not synchronized: one caller
 * at a time.
 */
class ChunkBuffer {
public:
    ChunkBuffer() = default;

    // Append a segment to the tail. Zero-length segments are accepted and ignored.
    void push(ByteSpan data);
    void push(ByteVector&& data);

    /**
     * Remove exactly n bytes from the head.
     * Fails with ErrorCode::InsufficientBuffer, leaving the buffer untouched, when fewer than n
     * bytes are buffered.
     */
    Result<ByteVector> pop(std::size_t n);

    // Return every buffered byte in order and reset to empty.
    ByteVector flush();

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    std::size_t segmentCount() const noexcept { return segments_.size(); }

private:
    std::deque<ByteVector> segments_;
    // Bytes of segments_.front() already handed out by pop()
    std::size_t headOffset_ = 0;
    std::size_t size_ = 0;
};

} // namespace chunkfetch::chunking
