/*
 * chunk_stream.cpp
 *
 * Ordered, bounded-concurrency chunk stream.
 * - Window phase: chunks [0, count-2) go through a FIFO of std::futures backed by a
 *   boost::asio::thread_pool with one thread per window slot. The consumer always waits on the
 *   front entry, which is what keeps output in chunk order.
 * - Tail phase: chunk count-2 (or 0) is fetched on the consumer thread; chunk count-1 only if
 *   the running total is still below the declared size.
 * - Verify: total yielded must equal the declared size.
 */

#include <chunkfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkfetch::downloader {

// Defined in chunked_downloader.cpp
Result<ByteVector> fetchChunkData(IChunkClient& client, const BigInt& offset);

namespace {

enum class Phase { Window, Tail, Last, Verify, Done, Failed };

struct PendingChunk {
    std::uint64_t index{0};
    std::future<Result<ByteVector>> result;
};

} // namespace

struct ChunkStream::Impl {
    std::shared_ptr<IChunkClient> client;
    std::string id;
    ChunkPlan plan;
    DownloadOptions options;

    std::uint64_t parallelChunks{0};
    std::size_t concurrency{0};
    std::uint64_t nextIndex{0};
    std::deque<PendingChunk> window;
    std::unique_ptr<boost::asio::thread_pool> pool;

    BigInt processed{0};
    std::size_t peakInFlight{0};
    Phase phase{Phase::Window};
    Error failure{};

    Impl(std::shared_ptr<IChunkClient> c, std::string i, ChunkPlan p, DownloadOptions o)
        : client(std::move(c)), id(std::move(i)), plan(std::move(p)), options(std::move(o)) {
        // The last two chunks may be resized by rebalancing and never enter the window
        parallelChunks = plan.chunkCount > 2 ? plan.chunkCount - 2 : 0;
        const auto configured = static_cast<std::uint64_t>(options.concurrency);
        concurrency = static_cast<std::size_t>(std::min(parallelChunks, configured));
        if (concurrency > 0) {
            pool = std::make_unique<boost::asio::thread_pool>(concurrency);
        }
        spdlog::debug("[download] {} start {} size {} chunks {} concurrency {}", id,
                      plan.startOffset.str(), plan.size.str(), plan.chunkCount, concurrency);
    }

    ~Impl() {
        // Issued fetches are not retracted; wait for them and drop the results
        if (pool) {
            pool->join();
        }
    }

    void schedule(std::uint64_t index) {
        auto task = std::make_shared<std::packaged_task<Result<ByteVector>()>>(
            [client = client, offset = plan.offsetOf(index)]() {
                return fetchChunkData(*client, offset);
            });
        PendingChunk pending;
        pending.index = index;
        pending.result = task->get_future();
        boost::asio::post(*pool, [task]() { (*task)(); });
        window.push_back(std::move(pending));
        peakInFlight = std::max(peakInFlight, window.size());
    }

    Result<std::optional<ByteVector>> fail(Error error) {
        spdlog::error("[download] {} failed at {}/{}: {}", id, processed.str(), plan.size.str(),
                      error.message);
        failure = std::move(error);
        phase = Phase::Failed;
        window.clear();
        return failure;
    }

    Result<std::optional<ByteVector>> emit(std::uint64_t index, ByteVector data) {
        processed += data.size();
        spdlog::debug("[chunk] {}/{}", processed.str(), plan.size.str());
        if (options.onProgress) {
            ProgressEvent ev;
            ev.id = id;
            ev.chunkIndex = index;
            ev.chunkCount = plan.chunkCount;
            ev.processedBytes = processed;
            ev.totalBytes = plan.size;
            options.onProgress(ev);
        }
        return std::optional<ByteVector>{std::move(data)};
    }

    Result<std::optional<ByteVector>> awaitFront() {
        PendingChunk front = std::move(window.front());
        window.pop_front();

        Result<ByteVector> data = Error{ErrorCode::ChunkFetchFailed};
        try {
            data = front.result.get();
        } catch (const std::exception& e) {
            data = Error{ErrorCode::ChunkFetchFailed,
                         "Chunk " + std::to_string(front.index) + " fetch threw: " + e.what()};
        } catch (...) {
            data = Error{ErrorCode::ChunkFetchFailed, "Chunk " + std::to_string(front.index) +
                                                          " fetch threw a non-standard exception"};
        }
        if (!data)
            return fail(data.error());
        return emit(front.index, std::move(data).value());
    }

    Result<std::optional<ByteVector>> fetchNow() {
        const std::uint64_t index = nextIndex++;
        Result<ByteVector> data = Error{ErrorCode::ChunkFetchFailed};
        try {
            data = fetchChunkData(*client, plan.offsetOf(index));
        } catch (const std::exception& e) {
            data = Error{ErrorCode::ChunkFetchFailed,
                         "Chunk " + std::to_string(index) + " fetch threw: " + e.what()};
        } catch (...) {
            data = Error{ErrorCode::ChunkFetchFailed, "Chunk " + std::to_string(index) +
                                                          " fetch threw a non-standard exception"};
        }
        if (!data)
            return fail(data.error());
        return emit(index, std::move(data).value());
    }

    Result<std::optional<ByteVector>> next() {
        if (phase == Phase::Window) {
            while (window.size() < concurrency && nextIndex < parallelChunks) {
                schedule(nextIndex++);
            }
            if (!window.empty())
                return awaitFront();
            phase = Phase::Tail;
        }

        if (phase == Phase::Tail) {
            if (plan.chunkCount == 0) {
                phase = Phase::Verify;
            } else {
                phase = Phase::Last;
                return fetchNow();
            }
        }

        if (phase == Phase::Last) {
            phase = Phase::Verify;
            if (processed < plan.size)
                return fetchNow();
        }

        if (phase == Phase::Verify) {
            if (processed != plan.size) {
                return fail(Error{ErrorCode::SizeMismatch, "got " + processed.str() +
                                                               "B, expected " +
                                                               plan.size.str() + "B"});
            }
            phase = Phase::Done;
            spdlog::debug("[download] {} complete ({} bytes)", id, processed.str());
        }

        if (phase == Phase::Failed)
            return failure;
        return std::optional<ByteVector>{};
    }
};

ChunkStream::ChunkStream(std::shared_ptr<IChunkClient> client, std::string id, ChunkPlan plan,
                         DownloadOptions options) {
    if (!client) {
        throw std::invalid_argument("ChunkStream: client cannot be null");
    }
    if (options.concurrency <= 0) {
        throw std::invalid_argument("ChunkStream: concurrency must be > 0, got " +
                                    std::to_string(options.concurrency));
    }
    pImpl = std::make_unique<Impl>(std::move(client), std::move(id), std::move(plan),
                                   std::move(options));
}

ChunkStream::~ChunkStream() = default;
ChunkStream::ChunkStream(ChunkStream&&) noexcept = default;
ChunkStream& ChunkStream::operator=(ChunkStream&&) noexcept = default;

Result<std::optional<ByteVector>> ChunkStream::next() {
    if (!pImpl) {
        return Error{ErrorCode::InvalidState, "ChunkStream was moved from"};
    }
    return pImpl->next();
}

const ChunkPlan& ChunkStream::plan() const {
    return pImpl->plan;
}

const BigInt& ChunkStream::processedBytes() const {
    return pImpl->processed;
}

std::size_t ChunkStream::peakInFlight() const {
    return pImpl->peakInFlight;
}

} // namespace chunkfetch::downloader
