#include "sharelink/encoding/base64url.hpp"

#include <cstdint>

namespace sharelink::encoding
{

    std::string encode_base64url(std::span<const std::byte> data)
    {
        static constexpr char kAlphabet[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

        std::string output;
        output.reserve((data.size() * 4 + 2) / 3);

        std::uint32_t buffer = 0;
        int bits_collected = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                output.push_back(kAlphabet[(buffer >> bits_collected) & 0x3Fu]);
            }
        }

        if (bits_collected > 0)
        {
            output.push_back(kAlphabet[(buffer << (6 - bits_collected)) & 0x3Fu]);
        }

        return output;
    }

} // namespace sharelink::encoding
