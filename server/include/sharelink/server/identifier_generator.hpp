#pragma once

#include <cstddef>
#include <string>

namespace sharelink::server
{

    // Produces download identifiers: 128 random bits, base64url encoded.
    class IdentifierGenerator
    {
    public:
        static constexpr std::size_t kEntropyBytes = 16;

        std::string generate() const;
    };

} // namespace sharelink::server
