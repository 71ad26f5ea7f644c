#include <chunkfetch/common/base64url.h>
#include <chunkfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkfetch::downloader {

Result<ByteVector> fetchChunkData(IChunkClient& client, const BigInt& offset) {
    auto response = client.getChunk(offset);
    if (!response) {
        const auto& err = response.error();
        if (err.code == ErrorCode::ChunkFetchFailed)
            return err;
        return Error{ErrorCode::ChunkFetchFailed,
                     "Unable to get chunk at offset " + offset.str() + ": " + err.message};
    }

    auto data = common::base64UrlDecode(response.value().chunk);
    if (!data) {
        return Error{ErrorCode::ChunkFetchFailed, "Unable to decode chunk at offset " +
                                                      offset.str() + ": " + data.error().message};
    }
    return data;
}

ChunkedDownloader::ChunkedDownloader(std::shared_ptr<IChunkClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("ChunkedDownloader: client cannot be null");
    }
}

Result<ContentMetadata> ChunkedDownloader::getMetadata(std::string_view id) {
    auto metadata = client_->getMetadata(id);
    if (!metadata && metadata.error().code != ErrorCode::MetadataFetchFailed) {
        return Error{ErrorCode::MetadataFetchFailed,
                     "Unable to get transaction offset: " + metadata.error().message};
    }
    return metadata;
}

Result<ChunkResponse> ChunkedDownloader::getChunk(const BigInt& offset) {
    return client_->getChunk(offset);
}

Result<ByteVector> ChunkedDownloader::getChunkData(const BigInt& offset) {
    return fetchChunkData(*client_, offset);
}

Result<ChunkStream> ChunkedDownloader::open(std::string_view id, DownloadOptions options) {
    if (options.concurrency <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "concurrency must be > 0, got " + std::to_string(options.concurrency)};
    }

    auto metadata = getMetadata(id);
    if (!metadata)
        return metadata.error();

    auto plan = planChunks(metadata.value());
    if (!plan)
        return plan.error();

    return ChunkStream(client_, std::string(id), std::move(plan).value(), std::move(options));
}

Result<ByteVector> ChunkedDownloader::downloadChunkedData(std::string_view id,
                                                          DownloadOptions options) {
    auto opened = open(id, std::move(options));
    if (!opened)
        return opened.error();
    ChunkStream stream = std::move(opened).value();

    const BigInt& size = stream.plan().size;
    if (size > std::numeric_limits<std::size_t>::max()) {
        return Error{ErrorCode::ResourceExhausted,
                     "Content of " + size.str() + " bytes does not fit in memory"};
    }

    ByteVector data;
    data.reserve(size.convert_to<std::size_t>());
    while (true) {
        auto chunk = stream.next();
        if (!chunk)
            return chunk.error();
        if (!chunk.value())
            break;
        const auto& bytes = *chunk.value();
        data.insert(data.end(), bytes.begin(), bytes.end());
    }
    spdlog::info("Downloaded {} ({} bytes in {} chunks)", id, data.size(),
                 stream.plan().chunkCount);
    return data;
}

} // namespace chunkfetch::downloader
