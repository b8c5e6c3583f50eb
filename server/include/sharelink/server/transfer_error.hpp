#pragma once

#include <stdexcept>
#include <string>

#include "sharelink/error_codes.hpp"

namespace sharelink::server
{

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(sharelink::ErrorCode code, std::string message)
            : std::runtime_error(std::move(message)), code_(code) {}

        sharelink::ErrorCode code() const noexcept { return code_; }

    private:
        sharelink::ErrorCode code_;
    };

} // namespace sharelink::server
