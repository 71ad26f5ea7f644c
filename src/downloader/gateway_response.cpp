#include <chunkfetch/downloader/gateway_response.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <string>

namespace chunkfetch::downloader {

using json = nlohmann::json;

namespace {

// Accept both "123" and 123
Result<BigInt> readInteger(const json& obj, const char* key) {
    if (!obj.contains(key)) {
        return Error{ErrorCode::InvalidData, std::string("missing field '") + key + "'"};
    }
    const auto& v = obj[key];
    if (v.is_string())
        return parseDecimal(v.get<std::string>());
    if (v.is_number_unsigned())
        return BigInt(v.get<std::uint64_t>());
    return Error{ErrorCode::InvalidData, std::string("field '") + key + "' is not an integer"};
}

std::string readString(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return {};
}

} // namespace

std::string escapePathSegment(std::string_view segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string describeFailure(const HttpResponse& resp) {
    std::string reason = "HTTP " + std::to_string(resp.status);
    auto body = json::parse(resp.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error")) {
        const auto& e = body["error"];
        reason += ": " + (e.is_string() ? e.get<std::string>() : e.dump());
    } else if (!resp.body.empty()) {
        reason += ": " + resp.body.substr(0, kMaxErrorBody);
    }
    return reason;
}

Result<ContentMetadata> parseMetadataResponse(const HttpResponse& resp) {
    const std::string prefix = "Unable to get transaction offset: ";
    if (resp.status != 200) {
        return Error{ErrorCode::MetadataFetchFailed, prefix + describeFailure(resp)};
    }

    auto body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Error{ErrorCode::MetadataFetchFailed, prefix + "malformed JSON response"};
    }
    auto size = readInteger(body, "size");
    if (!size)
        return Error{ErrorCode::MetadataFetchFailed, prefix + size.error().message};
    auto offset = readInteger(body, "offset");
    if (!offset)
        return Error{ErrorCode::MetadataFetchFailed, prefix + offset.error().message};

    ContentMetadata metadata;
    metadata.size = std::move(size).value();
    metadata.offset = std::move(offset).value();
    return metadata;
}

Result<ChunkResponse> parseChunkResponse(const BigInt& offset, const HttpResponse& resp) {
    const std::string prefix = "Unable to get chunk at offset " + offset.str() + ": ";
    if (resp.status != 200) {
        return Error{ErrorCode::ChunkFetchFailed, prefix + describeFailure(resp)};
    }

    auto body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("chunk") ||
        !body["chunk"].is_string()) {
        return Error{ErrorCode::ChunkFetchFailed, prefix + "malformed JSON response"};
    }

    ChunkResponse chunk;
    chunk.chunk = body["chunk"].get<std::string>();
    chunk.dataPath = readString(body, "data_path");
    chunk.txPath = readString(body, "tx_path");
    return chunk;
}

} // namespace chunkfetch::downloader
