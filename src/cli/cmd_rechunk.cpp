/*
 * chunkfetch/src/cli/cmd_rechunk.cpp
 *
 * `chunkfetch rechunk <file> --size N`: split a file into fixed-size parts named
 * <stem>.part000000, <stem>.part000001, ... The trailing short part is kept only with --flush.
 */

#include <chunkfetch/chunking/fixed_size_chunker.h>
#include <chunkfetch/cli/commands.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace chunkfetch::cli {

namespace {

struct RechunkOpts {
    fs::path input;
    std::size_t size{MAX_CHUNK_SIZE};
    bool flush{false};
    std::optional<fs::path> outDir;
    bool dryRun{false};
};

int runRechunk(const RechunkOpts& opts) {
    std::ifstream in(opts.input, std::ios::binary);
    if (!in) {
        spdlog::error("Cannot open {}", opts.input.string());
        return 1;
    }

    const fs::path outDir = opts.outDir.value_or(opts.input.parent_path());
    if (!opts.dryRun && !outDir.empty()) {
        std::error_code ec;
        fs::create_directories(outDir, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", outDir.string(), ec.message());
            return 1;
        }
    }

    chunking::FixedSizeChunker chunker(chunking::sourceFromStream(in), opts.size,
                                       chunking::FixedSizeChunkerOptions{.flush = opts.flush});

    std::uint64_t index = 0;
    std::uint64_t total = 0;
    while (auto part = chunker.next()) {
        total += part->size();
        if (opts.dryRun) {
            std::cout << fmt::format("part {:06} {} bytes", index, part->size()) << std::endl;
        } else {
            const fs::path name =
                outDir / fmt::format("{}.part{:06}", opts.input.filename().string(), index);
            std::ofstream out(name, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(part->data()),
                      static_cast<std::streamsize>(part->size()));
            if (!out) {
                spdlog::error("Failed writing {}", name.string());
                return 1;
            }
            spdlog::debug("Wrote {} ({} bytes)", name.string(), part->size());
        }
        ++index;
    }
    if (in.bad()) {
        spdlog::error("Read error on {}", opts.input.string());
        return 1;
    }

    spdlog::info("{} parts, {} bytes", index, total);
    return 0;
}

} // namespace

void registerRechunkCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals) {
    auto* sub = app.add_subcommand("rechunk", "Split a file into fixed-size parts.");

    auto opts = std::make_shared<RechunkOpts>();

    sub->add_option("file", opts->input, "Input file.")->required()->check(CLI::ExistingFile);
    sub->add_option("-s,--size", opts->size, "Part size in bytes (default 262144).")
        ->check(CLI::Range(std::size_t{1}, std::size_t{1} << 30));
    sub->add_flag("--flush", opts->flush, "Keep the trailing short part.");
    sub->add_option("--out-dir", opts->outDir, "Directory for parts (default: next to input).");
    sub->add_flag("-n,--dry-run", opts->dryRun, "List parts without writing them.");

    sub->callback([opts, globals]() {
        auto settings = resolveSettings(*globals);
        if (settings) {
            applyLogLevel(settings.value().logLevel);
        } else {
            spdlog::warn("{}", settings.error().message);
        }
        if (int rc = runRechunk(*opts); rc != 0) {
            throw CLI::RuntimeError(rc);
        }
    });
}

} // namespace chunkfetch::cli
