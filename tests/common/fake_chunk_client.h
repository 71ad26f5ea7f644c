#pragma once

#include <chunkfetch/common/base64url.h>
#include <chunkfetch/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkfetch::test {

using downloader::BigInt;

/**
 * Deterministic byte pattern so reassembly errors show up as content mismatches.
 */
inline ByteVector makePatternBytes(std::size_t n, std::uint32_t seed = 0) {
    ByteVector out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::byte>(((i + seed) * 1315423911u + 0x9E3779B9u) >> 7 & 0xFF);
    }
    return out;
}

/**
 * In-memory gateway.
 *
 * The content is laid out as consecutive stored chunks (by default MAX_CHUNK_SIZE slices);
 * a request for any absolute offset returns the stored chunk containing it, as a real gateway
 * does. Hooks let tests delay, reorder or fail individual requests, and the client records how
 * many requests were executing at the same time.
 */
class FakeChunkClient final : public downloader::IChunkClient {
public:
    FakeChunkClient(ByteVector content, BigInt startOffset,
                    std::vector<std::size_t> layout = {})
        : content_(std::move(content)), startOffset_(std::move(startOffset)),
          declaredSize_(content_.size()) {
        if (layout.empty()) {
            for (std::size_t pos = 0; pos < content_.size(); pos += MAX_CHUNK_SIZE)
                layout.push_back(std::min(MAX_CHUNK_SIZE, content_.size() - pos));
        }
        std::size_t pos = 0;
        for (auto len : layout) {
            bounds_.emplace_back(pos, len);
            pos += len;
        }
        if (pos != content_.size()) {
            throw std::invalid_argument("FakeChunkClient: layout does not cover the content");
        }
    }

    // Report a size different from the stored content
    void setDeclaredSize(std::size_t size) { declaredSize_ = size; }
    void failMetadata(std::string message) { metadataFailure_ = std::move(message); }
    void failChunk(std::size_t storedIndex) { failing_ = storedIndex; }
    void throwOnChunk(std::size_t storedIndex) { throwing_ = storedIndex; }
    // Throw a value that is not a std::exception
    void throwForeignOnChunk(std::size_t storedIndex) { throwingForeign_ = storedIndex; }

    // Called on the requesting thread before / after a chunk is served
    std::function<void(std::size_t storedIndex)> beforeServe;
    std::function<void(std::size_t storedIndex)> afterServe;

    Result<downloader::ContentMetadata> getMetadata(std::string_view id) override {
        metadataCalls_.fetch_add(1);
        if (metadataFailure_) {
            return Error{ErrorCode::MetadataFetchFailed,
                         "Unable to get transaction offset: " + *metadataFailure_};
        }
        lastId_ = std::string(id);
        downloader::ContentMetadata md;
        md.size = declaredSize_;
        md.offset = startOffset_ + declaredSize_ - 1;
        return md;
    }

    Result<downloader::ChunkResponse> getChunk(const BigInt& offset) override {
        const int now = inFlight_.fetch_add(1) + 1;
        int peak = peakInFlight_.load();
        while (now > peak && !peakInFlight_.compare_exchange_weak(peak, now)) {
        }
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { n.fetch_sub(1); }
        } leave{inFlight_};

        {
            std::lock_guard<std::mutex> lk(mutex_);
            requested_.push_back(offset);
        }

        auto stored = locate(offset);
        if (!stored) {
            return Error{ErrorCode::ChunkFetchFailed,
                         "Unable to get chunk: HTTP 404 at offset " + offset.str()};
        }
        const std::size_t index = *stored;

        if (beforeServe)
            beforeServe(index);
        if (throwing_ && *throwing_ == index)
            throw std::runtime_error("connection reset");
        if (throwingForeign_ && *throwingForeign_ == index)
            throw 42;
        if (failing_ && *failing_ == index) {
            return Error{ErrorCode::ChunkFetchFailed, "Unable to get chunk: HTTP 500"};
        }

        const auto [pos, len] = bounds_[index];
        downloader::ChunkResponse resp;
        resp.chunk = common::base64UrlEncode(ByteSpan(content_).subspan(pos, len));
        resp.dataPath = "data-path";
        resp.txPath = "tx-path";

        {
            std::lock_guard<std::mutex> lk(mutex_);
            completed_.push_back(index);
        }
        if (afterServe)
            afterServe(index);
        return resp;
    }

    std::vector<BigInt> requestedOffsets() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requested_;
    }
    std::vector<std::size_t> completionOrder() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return completed_;
    }
    int peakInFlight() const { return peakInFlight_.load(); }
    int metadataCalls() const { return metadataCalls_.load(); }
    const ByteVector& content() const { return content_; }
    const BigInt& startOffset() const { return startOffset_; }

private:
    std::optional<std::size_t> locate(const BigInt& offset) const {
        if (offset < startOffset_)
            return std::nullopt;
        const BigInt rel = offset - startOffset_;
        if (rel >= content_.size())
            return std::nullopt;
        const auto r = rel.convert_to<std::size_t>();
        for (std::size_t i = 0; i < bounds_.size(); ++i) {
            if (r >= bounds_[i].first && r < bounds_[i].first + bounds_[i].second)
                return i;
        }
        return std::nullopt;
    }

    ByteVector content_;
    BigInt startOffset_;
    std::size_t declaredSize_;
    std::vector<std::pair<std::size_t, std::size_t>> bounds_;

    std::optional<std::string> metadataFailure_;
    std::optional<std::size_t> failing_;
    std::optional<std::size_t> throwing_;
    std::optional<std::size_t> throwingForeign_;
    std::string lastId_;

    mutable std::mutex mutex_;
    std::vector<BigInt> requested_;
    std::vector<std::size_t> completed_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> peakInFlight_{0};
    std::atomic<int> metadataCalls_{0};
};

} // namespace chunkfetch::test
