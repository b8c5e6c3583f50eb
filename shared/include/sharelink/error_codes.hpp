/**
 * ShareLink - Error taxonomy shared by the registry, the service layer and the HTTP surface.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace sharelink
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidInput = 1,
        NotFound = 2,
        Expired = 3,
        StorageFailure = 4,
        InternalError = 5
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status a code surfaces as when it reaches a client.
    int http_status(ErrorCode code) noexcept;

} // namespace sharelink
