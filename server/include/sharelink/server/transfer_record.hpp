#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sharelink::server
{

    using Clock = std::chrono::system_clock;

    inline constexpr std::chrono::seconds kDefaultRetention{std::chrono::hours{24 * 7}};

    struct FileRecord
    {
        std::string original_name;
        std::string stored_name;
        std::filesystem::path storage_path;
        std::uint64_t size_bytes{};
    };

    struct TransferRecord
    {
        std::vector<FileRecord> files;
        std::optional<std::string> email;
        std::optional<std::string> message;
        Clock::time_point created_at{};
        Clock::time_point expires_at{};
    };

    // A file part handed over by the multipart decoder, spooled but not yet committed.
    struct UploadPart
    {
        std::string original_name;
        std::filesystem::path temp_path;
        std::uint64_t size_bytes{};
    };

    // Shared by lookup-time expiry and the periodic sweep.
    inline bool is_expired(const TransferRecord &record, Clock::time_point now) noexcept
    {
        return now > record.expires_at;
    }

} // namespace sharelink::server
