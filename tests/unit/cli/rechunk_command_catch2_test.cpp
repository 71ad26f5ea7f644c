// `chunkfetch rechunk` end to end through the CLI11 parser

#include <catch2/catch_test_macros.hpp>
#include <chunkfetch/cli/commands.h>

#include "../../common/fake_chunk_client.h"
#include "../../support/temp_dir_scope.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace chunkfetch;
using chunkfetch::test::makePatternBytes;
using chunkfetch::test_support::ScopedEnv;
using chunkfetch::test_support::TempDirScope;

namespace {

struct CliHarness {
    CLI::App app{"chunkfetch test", "chunkfetch"};
    std::shared_ptr<cli::GlobalOptions> globals = std::make_shared<cli::GlobalOptions>();

    CliHarness() {
        app.require_subcommand(1);
        app.add_option("--config", globals->configPath);
        cli::registerDownloadCommand(app, globals);
        cli::registerMetadataCommand(app, globals);
        cli::registerRechunkCommand(app, globals);
    }

    void run(const std::string& args) { app.parse(args, false); }
};

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("rechunk splits a file into fixed-size parts", "[cli][rechunk]") {
    ScopedEnv cfg("CHUNKFETCH_CONFIG", std::string("/nonexistent/chunkfetch.toml"));
    auto dir = TempDirScope::unique_under("chunkfetch-rechunk");

    const auto data = makePatternBytes(1026, 4);
    const std::string raw(reinterpret_cast<const char*>(data.data()), data.size());
    const auto input = dir.write("blob.bin", raw);
    const auto outDir = dir.path() / "parts";

    SECTION("trailing short part is dropped by default") {
        CliHarness cli;
        cli.run("rechunk " + input.string() + " --size 256 --out-dir " + outDir.string());

        for (int i = 0; i < 4; ++i) {
            auto part = outDir / ("blob.bin.part00000" + std::to_string(i));
            REQUIRE(fs::exists(part));
            CHECK(readFile(part) == raw.substr(static_cast<std::size_t>(i) * 256, 256));
        }
        CHECK_FALSE(fs::exists(outDir / "blob.bin.part000004"));
    }

    SECTION("--flush keeps the trailing short part") {
        CliHarness cli;
        cli.run("rechunk " + input.string() + " --size 256 --flush --out-dir " +
                outDir.string());

        auto last = outDir / "blob.bin.part000004";
        REQUIRE(fs::exists(last));
        CHECK(readFile(last) == raw.substr(1024));
    }

    SECTION("--dry-run writes nothing") {
        CliHarness cli;
        cli.run("rechunk " + input.string() + " --size 256 -n --out-dir " + outDir.string());
        CHECK_FALSE(fs::exists(outDir));
    }
}

TEST_CASE("rechunk rejects bad arguments", "[cli][rechunk][error]") {
    auto dir = TempDirScope::unique_under("chunkfetch-rechunk-args");
    const auto input = dir.write("blob.bin", "abc");

    SECTION("missing input file") {
        CliHarness cli;
        CHECK_THROWS_AS(cli.run("rechunk " + (dir.path() / "nope.bin").string()),
                        CLI::ValidationError);
    }

    SECTION("zero part size") {
        CliHarness cli;
        CHECK_THROWS_AS(cli.run("rechunk " + input.string() + " --size 0"),
                        CLI::ValidationError);
    }

    SECTION("part size above 1 GiB") {
        CliHarness cli;
        CHECK_THROWS_AS(cli.run("rechunk " + input.string() + " --size 1073741825 -n"),
                        CLI::ValidationError);
    }

    SECTION("part size of exactly 1 GiB is accepted") {
        CliHarness cli;
        CHECK_NOTHROW(cli.run("rechunk " + input.string() + " --size 1073741824 -n"));
    }
}

TEST_CASE("download --json requires an output file", "[cli][download][error]") {
    CliHarness cli;
    CHECK_THROWS_AS(cli.run("download some-id --json"), CLI::ValidationError);
}
