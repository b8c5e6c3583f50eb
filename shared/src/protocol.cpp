#include "sharelink/protocol.hpp"

namespace sharelink::protocol
{

    namespace
    {

        template <typename T>
        void set_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> get_optional(const nlohmann::json &json, const char *key)
        {
            if (!json.contains(key) || json.at(key).is_null())
            {
                return std::nullopt;
            }
            return json.at(key).get<T>();
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadResponse &response)
    {
        json = nlohmann::json{{"success", response.success}};
        set_optional(json, "downloadId", response.download_id);
        set_optional(json, "message", response.message);
        set_optional(json, "fileCount", response.file_count);
        set_optional(json, "error", response.error);
    }

    void from_json(const nlohmann::json &json, UploadResponse &response)
    {
        response.success = json.at("success").get<bool>();
        response.download_id = get_optional<std::string>(json, "downloadId");
        response.message = get_optional<std::string>(json, "message");
        response.file_count = get_optional<std::size_t>(json, "fileCount");
        response.error = get_optional<std::string>(json, "error");
    }

    void to_json(nlohmann::json &json, const HealthResponse &response)
    {
        json = nlohmann::json{
            {"success", response.success},
            {"message", response.message},
            {"timestamp", response.timestamp},
        };
    }

    void from_json(const nlohmann::json &json, HealthResponse &response)
    {
        response.success = json.at("success").get<bool>();
        response.message = json.value("message", std::string{});
        response.timestamp = json.value("timestamp", std::string{});
    }

} // namespace sharelink::protocol
