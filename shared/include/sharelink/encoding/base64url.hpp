#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace sharelink::encoding
{

    // RFC 4648 section 5 alphabet, without padding.
    std::string encode_base64url(std::span<const std::byte> data);

} // namespace sharelink::encoding
