/**
 * ShareLink - JSON payloads of the HTTP API.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sharelink::protocol
{

    // Body of POST /api/upload.
    struct UploadResponse
    {
        bool success{};
        std::optional<std::string> download_id{};
        std::optional<std::string> message{};
        std::optional<std::size_t> file_count{};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const UploadResponse &response);
    void from_json(const nlohmann::json &json, UploadResponse &response);

    // Body of GET /api/test.
    struct HealthResponse
    {
        bool success{true};
        std::string message{};
        std::string timestamp{};
    };

    void to_json(nlohmann::json &json, const HealthResponse &response);
    void from_json(const nlohmann::json &json, HealthResponse &response);

} // namespace sharelink::protocol
