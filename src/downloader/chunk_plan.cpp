#include <chunkfetch/downloader/downloader.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace chunkfetch::downloader {

Result<BigInt> parseDecimal(std::string_view text) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidData, "Expected a decimal integer, got an empty string"};
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return Error{ErrorCode::InvalidData,
                         "Expected a decimal integer, got '" + std::string(text) + "'"};
        }
    }
    // cpp_int reads a leading zero as an octal prefix
    auto first = text.find_first_not_of('0');
    if (first == std::string_view::npos)
        return BigInt(0);
    return BigInt(std::string(text.substr(first)));
}

Result<BigInt> firstChunkOffset(const ContentMetadata& metadata) {
    if (metadata.size < 0 || metadata.offset < 0) {
        return Error{ErrorCode::InvalidData, "Negative size or offset in content metadata"};
    }
    if (metadata.offset + 1 < metadata.size) {
        return Error{ErrorCode::InvalidData, "End offset " + metadata.offset.str() +
                                                 " precedes content size " + metadata.size.str()};
    }
    return BigInt(metadata.offset - metadata.size + 1);
}

Result<ChunkPlan> planChunks(const ContentMetadata& metadata) {
    auto start = firstChunkOffset(metadata);
    if (!start)
        return start.error();

    const BigInt chunkSize(MAX_CHUNK_SIZE);
    const BigInt count = (metadata.size + chunkSize - 1) / chunkSize;
    if (count > std::numeric_limits<std::uint64_t>::max()) {
        return Error{ErrorCode::InvalidData, "Chunk count " + count.str() + " out of range"};
    }

    ChunkPlan plan;
    plan.startOffset = std::move(start).value();
    plan.size = metadata.size;
    plan.chunkCount = count.convert_to<std::uint64_t>();
    return plan;
}

} // namespace chunkfetch::downloader
