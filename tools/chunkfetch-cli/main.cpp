#include <chunkfetch/cli/commands.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <memory>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr; stdout may carry downloaded bytes
        spdlog::set_default_logger(spdlog::stderr_color_mt("chunkfetch"));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Chunked content fetcher and fixed-size rechunker", "chunkfetch"};
        app.set_version_flag("--version", "0.1.0");
        app.require_subcommand(1);

        auto globals = std::make_shared<chunkfetch::cli::GlobalOptions>();
        app.add_option("--config", globals->configPath,
                       "Config file (default: $XDG_CONFIG_HOME/chunkfetch/config.toml).");
        app.add_option("--gateway", globals->gateway, "Gateway base URL.");
        app.add_option("--timeout", globals->timeoutMs, "Per-request timeout in ms.")
            ->check(CLI::Range(1, 3600 * 1000));
        app.add_flag("--tls-insecure", globals->tlsInsecure,
                     "Disable TLS verification (NOT RECOMMENDED).");
        app.add_option("--log-level", globals->logLevel, "trace|debug|info|warn|error|off")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
        app.add_flag("-v,--verbose", globals->verbose, "Shortcut for --log-level debug.");

        chunkfetch::cli::registerDownloadCommand(app, globals);
        chunkfetch::cli::registerMetadataCommand(app, globals);
        chunkfetch::cli::registerRechunkCommand(app, globals);

        CLI11_PARSE(app, argc, argv);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
