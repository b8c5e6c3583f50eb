#include "sharelink/server/identifier_generator.hpp"

#include "sharelink/crypto.hpp"
#include "sharelink/encoding/base64url.hpp"

namespace sharelink::server
{

    std::string IdentifierGenerator::generate() const
    {
        const auto bytes = crypto::random_bytes(kEntropyBytes);
        return encoding::encode_base64url(bytes);
    }

} // namespace sharelink::server
