/*
 * chunkfetch/src/cli/cmd_download.cpp
 *
 * `chunkfetch download <id>`: stream a content object from the gateway, chunk by chunk, into a
 * file (or stdout). Chunks are written in order as the stream yields them; a failed download
 * removes the partial output file.
 */

#include <chunkfetch/cli/commands.h>
#include <chunkfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace chunkfetch::cli {

namespace {

struct DownloadOpts {
    std::string id;
    std::optional<fs::path> output;
    std::optional<int> concurrency;
    bool emit_json{false};
    bool progress{false};
};

json errorJson(const std::string& id, const Error& err) {
    return json{{"type", "result"},
                {"id", id},
                {"success", false},
                {"error", {{"code", errorToString(err.code)}, {"message", err.message}}}};
}

int runDownload(const DownloadOpts& opts, const GlobalOptions& globals) {
    auto settings = resolveSettings(globals);
    if (!settings) {
        spdlog::error("{}", settings.error().message);
        return 2;
    }
    applyLogLevel(settings.value().logLevel);

    downloader::ChunkedDownloader dl(downloader::makeGatewayClient(settings.value().gateway));

    downloader::DownloadOptions options;
    options.concurrency = opts.concurrency.value_or(settings.value().concurrency);
    if (opts.progress) {
        options.onProgress = [](const downloader::ProgressEvent& ev) {
            spdlog::info("[{}] chunk {}/{} - {}/{} bytes", ev.id, ev.chunkIndex + 1,
                         ev.chunkCount, ev.processedBytes.str(), ev.totalBytes.str());
        };
    }

    const auto started = std::chrono::steady_clock::now();
    auto opened = dl.open(opts.id, std::move(options));
    if (!opened) {
        if (opts.emit_json)
            std::cout << errorJson(opts.id, opened.error()).dump() << std::endl;
        spdlog::error("{}", opened.error().message);
        return 1;
    }
    downloader::ChunkStream stream = std::move(opened).value();

    std::ofstream file;
    if (opts.output) {
        file.open(*opts.output, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Cannot open {} for writing", opts.output->string());
            return 1;
        }
    }
    std::ostream& out = opts.output ? static_cast<std::ostream&>(file) : std::cout;

    std::optional<Error> failure;
    while (true) {
        auto chunk = stream.next();
        if (!chunk) {
            failure = chunk.error();
            break;
        }
        if (!chunk.value())
            break;
        const auto& bytes = *chunk.value();
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            failure = Error{ErrorCode::WriteError, "Failed writing downloaded data"};
            break;
        }
    }
    out.flush();

    if (failure) {
        if (opts.output) {
            file.close();
            std::error_code ec;
            fs::remove(*opts.output, ec);
        }
        if (opts.emit_json)
            std::cout << errorJson(opts.id, *failure).dump() << std::endl;
        spdlog::error("Download of {} failed: {}", opts.id, failure->message);
        return 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (opts.emit_json) {
        json result = {{"type", "result"},
                       {"id", opts.id},
                       {"success", true},
                       {"size_bytes", stream.processedBytes().str()},
                       {"chunks", stream.plan().chunkCount},
                       {"start_offset", stream.plan().startOffset.str()},
                       {"output", opts.output ? opts.output->string() : std::string{}},
                       {"elapsed_ms", elapsed.count()}};
        std::cout << result.dump() << std::endl;
    } else {
        spdlog::info("Downloaded {} bytes in {} ms", stream.processedBytes().str(),
                     elapsed.count());
    }
    return 0;
}

} // namespace

void registerDownloadCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals) {
    auto* sub = app.add_subcommand(
        "download", "Download a content object chunk by chunk and write it out in order.");

    auto opts = std::make_shared<DownloadOpts>();

    sub->add_option("id", opts->id, "Content identifier.")->required();
    sub->add_option("-o,--output", opts->output, "Output file (default: stdout).");
    sub->add_option("-c,--concurrency", opts->concurrency,
                    "Concurrent chunk requests (default 10).")
        ->check(CLI::Range(1, 1024));
    sub->add_flag("--json", opts->emit_json, "Emit the final result as JSON to stdout.");
    sub->add_flag("--progress", opts->progress, "Log progress after every chunk.");

    sub->callback([opts, globals]() {
        if (opts->emit_json && !opts->output) {
            throw CLI::ValidationError("download", "--json requires --output.");
        }
        if (int rc = runDownload(*opts, *globals); rc != 0) {
            throw CLI::RuntimeError(rc);
        }
    });

    sub->footer(R"(Behavior:
  - Chunks are requested concurrently but written strictly in order.
  - The total is checked against the size the gateway declared; a mismatch fails the download.
  - Failed requests are not retried.)");
}

} // namespace chunkfetch::cli
