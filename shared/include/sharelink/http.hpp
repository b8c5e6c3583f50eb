/**
 * ShareLink - Minimal HTTP/1.1 message helpers.
 *
 * Only what a one-request-per-connection server needs: parsing a request
 * head, serialising responses, and the percent/quoting rules used in paths
 * and Content-Disposition values.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sharelink::http
{

    class HttpError : public std::runtime_error
    {
    public:
        HttpError(int status, std::string message);

        int status() const noexcept { return status_; }

    private:
        int status_;
    };

    struct Request
    {
        std::string method;
        std::string target;
        std::string version;
        // Decoded path segments, empty segments dropped.
        std::vector<std::string> segments;
        std::string query;
        // Header names are stored lower-cased.
        std::unordered_map<std::string, std::string> headers;

        std::optional<std::string> header(std::string_view name) const;
    };

    struct Response
    {
        int status{200};
        std::string content_type{"text/plain; charset=utf-8"};
        std::string body;
        std::vector<std::pair<std::string, std::string>> headers;

        static Response json(int status, std::string body);
        static Response html(int status, std::string body);
        static Response text(int status, std::string body);
    };

    // `head` is everything up to and including the blank line.
    Request parse_request_head(std::string_view head);

    std::string serialize(const Response &response);

    std::string serialize_head(int status, const std::vector<std::pair<std::string, std::string>> &headers,
                               std::uint64_t content_length);

    std::string_view status_text(int status) noexcept;

    std::string percent_decode(std::string_view input);

    std::string percent_encode(std::string_view input);

    // Parameters following the first ';' of a header value. Keys are lower-cased; quoted-string
    // values are unquoted and unescaped, so a ';' inside quotes belongs to the value.
    std::vector<std::pair<std::string, std::string>> header_parameters(std::string_view value);

    // Media type of a Content-Type value, lower-cased, parameters stripped.
    std::string media_type(std::string_view content_type);

    // Empty when the value carries no boundary parameter.
    std::string extract_boundary(std::string_view content_type);

    std::string content_disposition_attachment(std::string_view filename);

} // namespace sharelink::http
