/*
 * gateway_client.cpp
 *
 * Notes
 * - IChunkClient over the libcurl easy API: GET {base}/tx/{id}/offset and GET {base}/chunk/{offset}.
 * - One easy handle per request, so concurrent getChunk() calls from the stream's worker pool
 *   never share curl state.
 * - Honors timeout, TLS verify/CA, proxy, headers and redirects.
 * - No retries: a failed request is reported once and the caller decides.
 *
 * Build
 * - Linked via CURL::libcurl; response bodies are interpreted in gateway_response.cpp.
 */

#include <chunkfetch/downloader/downloader.hpp>
#include <chunkfetch/downloader/gateway_response.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>

namespace chunkfetch::downloader {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Accept: application/json");
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const GatewayConfig& cfg) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long long>(cfg.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tls.insecure ? 0L : 2L);
    if (!cfg.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.tls.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
}

class GatewayClient final : public IChunkClient {
public:
    explicit GatewayClient(GatewayConfig config) : config_(std::move(config)) {
        ensureCurlGlobalInit();
        while (!config_.baseUrl.empty() && config_.baseUrl.back() == '/')
            config_.baseUrl.pop_back();
    }

    Result<ContentMetadata> getMetadata(std::string_view id) override {
        const std::string url = config_.baseUrl + "/tx/" + escapePathSegment(id) + "/offset";
        auto resp = get(url);
        if (!resp) {
            return Error{ErrorCode::MetadataFetchFailed,
                         "Unable to get transaction offset: " + resp.error().message};
        }
        auto metadata = parseMetadataResponse(resp.value());
        if (metadata) {
            spdlog::debug("Gateway metadata for {}: size={} offset={}", id,
                          metadata.value().size.str(), metadata.value().offset.str());
        }
        return metadata;
    }

    Result<ChunkResponse> getChunk(const BigInt& offset) override {
        auto resp = get(config_.baseUrl + "/chunk/" + offset.str());
        if (!resp) {
            return Error{ErrorCode::ChunkFetchFailed,
                         "Unable to get chunk at offset " + offset.str() + ": " +
                             resp.error().message};
        }
        return parseChunkResponse(offset, resp.value());
    }

private:
    Result<HttpResponse> get(const std::string& url) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(config_.headers);
        HttpResponse resp;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
        configure_common(curl, config_);

        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(rc));
            return makeCurlError(rc, "GET " + url);
        }
        spdlog::trace("GET {} -> {} ({} bytes)", url, resp.status, resp.body.size());
        return resp;
    }

    GatewayConfig config_;
};

} // namespace

std::shared_ptr<IChunkClient> makeGatewayClient(GatewayConfig config) {
    return std::make_shared<GatewayClient>(std::move(config));
}

} // namespace chunkfetch::downloader
