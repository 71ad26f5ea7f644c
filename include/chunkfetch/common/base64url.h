#pragma once

#include <chunkfetch/core/types.h>

#include <string>
#include <string_view>

namespace chunkfetch::common {

// Encode bytes with the URL-safe alphabet ('-', '_') and no padding.
std::string base64UrlEncode(ByteSpan data);

// Decode URL-safe base64. Padding is optional; standard '+' and '/' are accepted as well.
// Fails with ErrorCode::InvalidData on characters outside the alphabet or a dangling sextet.
Result<ByteVector> base64UrlDecode(std::string_view encoded);

} // namespace chunkfetch::common
