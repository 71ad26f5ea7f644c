#include <chunkfetch/chunking/chunk_buffer.h>

#include <algorithm>
#include <string>

namespace chunkfetch::chunking {

void ChunkBuffer::push(ByteSpan data) {
    if (data.empty())
        return;
    segments_.emplace_back(data.begin(), data.end());
    size_ += data.size();
}

void ChunkBuffer::push(ByteVector&& data) {
    if (data.empty())
        return;
    size_ += data.size();
    segments_.push_back(std::move(data));
}

Result<ByteVector> ChunkBuffer::pop(std::size_t n) {
    if (n > size_) {
        return Error{ErrorCode::InsufficientBuffer, "Requested " + std::to_string(n) +
                                                        " bytes but only " +
                                                        std::to_string(size_) + " buffered"};
    }

    // Whole, untouched head segment of exactly the requested size: hand it over without copying
    if (headOffset_ == 0 && !segments_.empty() && segments_.front().size() == n) {
        ByteVector out = std::move(segments_.front());
        segments_.pop_front();
        size_ -= n;
        return out;
    }

    ByteVector out;
    out.reserve(n);
    while (out.size() < n) {
        auto& head = segments_.front();
        const std::size_t available = head.size() - headOffset_;
        const std::size_t take = std::min(available, n - out.size());
        auto first = head.begin() + static_cast<std::ptrdiff_t>(headOffset_);
        out.insert(out.end(), first, first + static_cast<std::ptrdiff_t>(take));
        headOffset_ += take;
        if (headOffset_ == head.size()) {
            segments_.pop_front();
            headOffset_ = 0;
        }
    }
    size_ -= n;
    return out;
}

ByteVector ChunkBuffer::flush() {
    ByteVector out;
    out.reserve(size_);
    std::size_t skip = headOffset_;
    for (auto& segment : segments_) {
        out.insert(out.end(), segment.begin() + static_cast<std::ptrdiff_t>(skip), segment.end());
        skip = 0;
    }
    segments_.clear();
    headOffset_ = 0;
    size_ = 0;
    return out;
}

} // namespace chunkfetch::chunking
