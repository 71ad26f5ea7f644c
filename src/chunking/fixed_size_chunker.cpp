#include <chunkfetch/chunking/fixed_size_chunker.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace chunkfetch::chunking {

FixedSizeChunker::FixedSizeChunker(std::size_t chunkSize, FixedSizeChunkerOptions options)
    : chunkSize_(chunkSize), options_(options) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("FixedSizeChunker: chunkSize must be > 0");
    }
}

FixedSizeChunker::FixedSizeChunker(ByteSource source, std::size_t chunkSize,
                                   FixedSizeChunkerOptions options)
    : FixedSizeChunker(chunkSize, options) {
    source_ = std::move(source);
}

std::optional<ByteVector> FixedSizeChunker::popChunk() {
    if (buffer_.size() < chunkSize_)
        return std::nullopt;
    auto chunk = buffer_.pop(chunkSize_);
    if (!chunk) {
        // Size was checked above; the buffer cannot be short here.
        spdlog::error("FixedSizeChunker: {}", chunk.error().message);
        return std::nullopt;
    }
    return std::move(chunk).value();
}

std::optional<ByteVector> FixedSizeChunker::closeInput() {
    inputDone_ = true;
    if (buffer_.empty())
        return std::nullopt;
    auto remainder = buffer_.flush();
    if (!options_.flush) {
        spdlog::debug("FixedSizeChunker: dropping {} trailing bytes", remainder.size());
        return std::nullopt;
    }
    return remainder;
}

std::optional<ByteVector> FixedSizeChunker::next() {
    while (true) {
        if (auto chunk = popChunk())
            return chunk;
        if (inputDone_ || !source_)
            return std::nullopt;

        auto input = source_();
        if (!input) {
            return closeInput();
        }
        buffer_.push(std::move(*input));
    }
}

Result<std::vector<ByteVector>> FixedSizeChunker::write(ByteSpan data) {
    if (inputDone_) {
        return Error{ErrorCode::InvalidState, "FixedSizeChunker: write after finish"};
    }
    buffer_.push(data);

    std::vector<ByteVector> out;
    out.reserve(buffer_.size() / chunkSize_);
    while (auto chunk = popChunk()) {
        out.push_back(std::move(*chunk));
    }
    return out;
}

std::vector<ByteVector> FixedSizeChunker::finish() {
    std::vector<ByteVector> out;
    if (inputDone_)
        return out;
    while (auto chunk = popChunk()) {
        out.push_back(std::move(*chunk));
    }
    if (auto remainder = closeInput()) {
        out.push_back(std::move(*remainder));
    }
    return out;
}

ByteSource sourceFromStream(std::istream& in, std::size_t readSize) {
    if (readSize == 0) {
        throw std::invalid_argument("sourceFromStream: readSize must be > 0");
    }
    return [&in, readSize]() -> std::optional<ByteVector> {
        if (!in.good())
            return std::nullopt;
        ByteVector buffer(readSize);
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(readSize));
        const std::streamsize readCount = in.gcount();
        if (readCount <= 0)
            return std::nullopt;
        buffer.resize(static_cast<std::size_t>(readCount));
        return buffer;
    };
}

ByteSource sourceFromBuffers(std::vector<ByteVector> buffers) {
    auto state = std::make_shared<std::vector<ByteVector>>(std::move(buffers));
    auto index = std::make_shared<std::size_t>(0);
    return [state, index]() -> std::optional<ByteVector> {
        if (*index >= state->size())
            return std::nullopt;
        return std::move((*state)[(*index)++]);
    };
}

} // namespace chunkfetch::chunking
