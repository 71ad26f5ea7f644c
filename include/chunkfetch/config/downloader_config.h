#pragma once

#include <chunkfetch/core/types.h>
#include <chunkfetch/downloader/downloader.hpp>

#include <filesystem>
#include <string>

namespace chunkfetch::config {

/**
 * Effective settings for the CLI and any embedding that wants file-based defaults.
 *
 * Sources, lowest priority first: built-in defaults, config.toml, environment
 * (CHUNKFETCH_GATEWAY), then whatever the caller applies on top (CLI flags).
 *
 *   [gateway]
 *   url = "https://arweave.net"
 *   timeout_ms = 60000
 *   insecure = false
 *   ca_path = ""
 *   proxy = ""
 *
 *   [downloader]
 *   concurrency = 10
 *
 *   [logging]
 *   level = "info"
 */
struct Settings {
    downloader::GatewayConfig gateway{};
    int concurrency{DEFAULT_DOWNLOAD_CONCURRENCY};
    std::string logLevel{"info"};
};

/**
 * Load settings from `configPath` (a missing file leaves defaults in place) and apply
 * environment overrides. Fails with ErrorCode::InvalidArgument on values that do not parse.
 */
Result<Settings> loadSettings(const std::filesystem::path& configPath);

} // namespace chunkfetch::config
