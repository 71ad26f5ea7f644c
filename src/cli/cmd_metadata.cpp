#include <chunkfetch/cli/commands.h>
#include <chunkfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;

namespace chunkfetch::cli {

void registerMetadataCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals) {
    auto* sub = app.add_subcommand("metadata", "Show size, offsets and chunk plan of an object.");

    auto id = std::make_shared<std::string>();
    auto emitJson = std::make_shared<bool>(false);

    sub->add_option("id", *id, "Content identifier.")->required();
    sub->add_flag("--json", *emitJson, "Emit JSON instead of text.");

    sub->callback([id, emitJson, globals]() {
        auto settings = resolveSettings(*globals);
        if (!settings) {
            spdlog::error("{}", settings.error().message);
            throw CLI::RuntimeError(2);
        }
        applyLogLevel(settings.value().logLevel);

        downloader::ChunkedDownloader dl(downloader::makeGatewayClient(settings.value().gateway));
        auto metadata = dl.getMetadata(*id);
        if (!metadata) {
            spdlog::error("{}", metadata.error().message);
            throw CLI::RuntimeError(1);
        }
        auto plan = downloader::planChunks(metadata.value());
        if (!plan) {
            spdlog::error("{}", plan.error().message);
            throw CLI::RuntimeError(1);
        }

        const auto& p = plan.value();
        if (*emitJson) {
            json out = {{"id", *id},
                        {"size", metadata.value().size.str()},
                        {"offset", metadata.value().offset.str()},
                        {"start_offset", p.startOffset.str()},
                        {"chunk_count", p.chunkCount},
                        {"max_chunk_size", MAX_CHUNK_SIZE}};
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << "id:           " << *id << "\n"
                      << "size:         " << metadata.value().size.str() << "\n"
                      << "end offset:   " << metadata.value().offset.str() << "\n"
                      << "start offset: " << p.startOffset.str() << "\n"
                      << "chunks:       " << p.chunkCount << std::endl;
        }
    });
}

} // namespace chunkfetch::cli
