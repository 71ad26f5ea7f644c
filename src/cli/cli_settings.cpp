#include <chunkfetch/cli/commands.h>
#include <chunkfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <chrono>

namespace chunkfetch::cli {

Result<config::Settings> resolveSettings(const GlobalOptions& globals) {
    auto loaded = config::loadSettings(config::get_config_path(globals.configPath));
    if (!loaded)
        return loaded.error();

    config::Settings settings = std::move(loaded).value();
    if (globals.gateway)
        settings.gateway.baseUrl = *globals.gateway;
    if (globals.timeoutMs)
        settings.gateway.timeout = std::chrono::milliseconds(*globals.timeoutMs);
    if (globals.tlsInsecure)
        settings.gateway.tls.insecure = true;
    if (globals.logLevel)
        settings.logLevel = *globals.logLevel;
    if (globals.verbose)
        settings.logLevel = "debug";
    return settings;
}

void applyLogLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("Unknown log level '{}', keeping current level", level);
    }
}

} // namespace chunkfetch::cli
