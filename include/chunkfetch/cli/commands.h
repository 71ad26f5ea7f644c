#pragma once

#include <chunkfetch/config/downloader_config.h>
#include <chunkfetch/core/types.h>

#include <memory>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace chunkfetch::cli {

/**
 * Options shared by every subcommand. CLI flags win over config.toml and the environment.
 */
struct GlobalOptions {
    std::string configPath;
    std::optional<std::string> gateway;
    std::optional<std::string> logLevel;
    std::optional<int> timeoutMs;
    bool tlsInsecure{false};
    bool verbose{false};
};

// Merge config file, environment and flags into effective settings.
Result<config::Settings> resolveSettings(const GlobalOptions& globals);

// Apply "trace|debug|info|warn|error|off" to the default spdlog logger.
void applyLogLevel(const std::string& level);

void registerDownloadCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals);
void registerMetadataCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals);
void registerRechunkCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals);

} // namespace chunkfetch::cli
