#include <chunkfetch/common/base64url.h>

#include <array>
#include <cstdint>

namespace chunkfetch::common {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<std::int8_t, 256> makeDecodeTable() {
    std::array<std::int8_t, 256> table{};
    for (auto& v : table)
        v = -1;
    for (int i = 0; i < 64; ++i)
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
    table[static_cast<unsigned char>('+')] = 62;
    table[static_cast<unsigned char>('/')] = 63;
    return table;
}

constexpr auto kDecodeTable = makeDecodeTable();

} // namespace

std::string base64UrlEncode(ByteSpan data) {
    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                                (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                                std::to_integer<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t n = std::to_integer<std::uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    } else if (rest == 2) {
        const std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                                (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    }
    return out;
}

Result<ByteVector> base64UrlDecode(std::string_view encoded) {
    while (!encoded.empty() && encoded.back() == '=')
        encoded.remove_suffix(1);

    if (encoded.size() % 4 == 1) {
        return Error{ErrorCode::InvalidData, "base64url: truncated input"};
    }

    ByteVector out;
    out.reserve(encoded.size() * 3 / 4);

    std::uint32_t acc = 0;
    int bits = 0;
    for (char c : encoded) {
        const auto v = kDecodeTable[static_cast<unsigned char>(c)];
        if (v < 0) {
            return Error{ErrorCode::InvalidData,
                         std::string("base64url: invalid character '") + c + "'"};
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::byte>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace chunkfetch::common
