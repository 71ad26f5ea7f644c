#include <chunkfetch/config/config_helpers.h>
#include <chunkfetch/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace chunkfetch::config {

namespace {

Error invalidValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": '" + value + "'"};
}

} // namespace

Result<Settings> loadSettings(const std::filesystem::path& configPath) {
    Settings settings;

    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        spdlog::debug("Loading config from {}", configPath.string());

        if (auto v = parse_config_value(configPath, "gateway", "url"); !v.empty()) {
            settings.gateway.baseUrl = v;
        }
        if (auto v = parse_config_value(configPath, "gateway", "timeout_ms"); !v.empty()) {
            auto ms = parse_int(v);
            if (!ms || *ms == 0)
                return invalidValue("gateway.timeout_ms", v);
            settings.gateway.timeout = std::chrono::milliseconds(*ms);
        }
        if (auto v = parse_config_value(configPath, "gateway", "insecure"); !v.empty()) {
            auto b = parse_bool(v);
            if (!b)
                return invalidValue("gateway.insecure", v);
            settings.gateway.tls.insecure = *b;
        }
        if (auto v = parse_config_value(configPath, "gateway", "ca_path"); !v.empty()) {
            settings.gateway.tls.caPath = expand_tilde(v).string();
        }
        if (auto v = parse_config_value(configPath, "gateway", "proxy"); !v.empty()) {
            settings.gateway.proxy = v;
        }
        if (auto v = parse_config_value(configPath, "downloader", "concurrency"); !v.empty()) {
            auto n = parse_int(v);
            if (!n || *n == 0 || *n > 1024)
                return invalidValue("downloader.concurrency", v);
            settings.concurrency = static_cast<int>(*n);
        }
        if (auto v = parse_config_value(configPath, "logging", "level"); !v.empty()) {
            settings.logLevel = v;
        }
    }

    if (const char* env = std::getenv("CHUNKFETCH_GATEWAY"); env && *env) {
        settings.gateway.baseUrl = env;
    }

    return settings;
}

} // namespace chunkfetch::config
