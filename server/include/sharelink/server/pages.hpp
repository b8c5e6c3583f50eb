#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "sharelink/server/transfer_service.hpp"

namespace sharelink::server::pages
{

    std::string html_escape(std::string_view text);

    std::string home();

    std::string manifest(const Manifest &manifest);

    std::string not_found();

    std::string expired(std::chrono::seconds retention);

} // namespace sharelink::server::pages
