#include "sharelink/error_codes.hpp"

#include <array>

namespace sharelink
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int status;
        };

        constexpr std::array<ErrorCodeDescription, 6> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidInput, "invalid_input", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Expired, "expired", 410},
            {ErrorCode::StorageFailure, "storage_failure", 500},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace sharelink
