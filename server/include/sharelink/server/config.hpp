#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sharelink/server/transfer_record.hpp"

namespace sharelink::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds retention{kDefaultRetention};
        std::chrono::seconds sweep_interval{std::chrono::hours{1}};
        std::chrono::seconds idle_timeout{std::chrono::seconds{60}};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace sharelink::server
