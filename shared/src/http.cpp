#include "sharelink/http.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sharelink::http
{

    HttpError::HttpError(int status, std::string message)
        : std::runtime_error(std::move(message)), status_(status) {}

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r' ||
                                      value.back() == '\n'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            for (char &c : result)
            {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return result;
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        std::vector<std::string_view> split_lines(std::string_view head)
        {
            std::vector<std::string_view> lines;
            std::size_t pos = 0;
            while (pos < head.size())
            {
                auto eol = head.find('\n', pos);
                if (eol == std::string_view::npos)
                {
                    eol = head.size();
                }
                auto line = head.substr(pos, eol - pos);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                pos = eol + 1;
            }
            return lines;
        }

        std::vector<std::string> split_segments(std::string_view path)
        {
            std::vector<std::string> segments;
            std::size_t pos = 0;
            while (pos <= path.size())
            {
                auto slash = path.find('/', pos);
                if (slash == std::string_view::npos)
                {
                    slash = path.size();
                }
                if (slash > pos)
                {
                    segments.push_back(percent_decode(path.substr(pos, slash - pos)));
                }
                pos = slash + 1;
            }
            return segments;
        }

    } // namespace

    std::optional<std::string> Request::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    Response Response::json(int status, std::string body)
    {
        return Response{.status = status, .content_type = "application/json", .body = std::move(body), .headers = {}};
    }

    Response Response::html(int status, std::string body)
    {
        return Response{
            .status = status, .content_type = "text/html; charset=utf-8", .body = std::move(body), .headers = {}};
    }

    Response Response::text(int status, std::string body)
    {
        return Response{
            .status = status, .content_type = "text/plain; charset=utf-8", .body = std::move(body), .headers = {}};
    }

    Request parse_request_head(std::string_view head)
    {
        const auto lines = split_lines(head);
        if (lines.empty() || lines.front().empty())
        {
            throw HttpError(400, "Empty request line");
        }

        Request request;
        std::istringstream request_line{std::string(lines.front())};
        std::string extra;
        if (!(request_line >> request.method >> request.target >> request.version) || (request_line >> extra))
        {
            throw HttpError(400, "Malformed request line");
        }
        if (request.version.rfind("HTTP/1.", 0) != 0)
        {
            throw HttpError(505, "Unsupported HTTP version");
        }
        if (request.target.empty() || request.target.front() != '/')
        {
            throw HttpError(400, "Request target must be an absolute path");
        }

        std::string_view target = request.target;
        const auto question = target.find('?');
        if (question != std::string_view::npos)
        {
            request.query = std::string(target.substr(question + 1));
            target = target.substr(0, question);
        }
        request.segments = split_segments(target);

        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            const auto line = lines[i];
            if (line.empty())
            {
                break;
            }
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                throw HttpError(400, "Malformed header line");
            }
            request.headers[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        }
        return request;
    }

    std::string serialize_head(int status, const std::vector<std::pair<std::string, std::string>> &headers,
                               std::uint64_t content_length)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << ' ' << status_text(status) << "\r\n";
        for (const auto &[name, value] : headers)
        {
            out << name << ": " << value << "\r\n";
        }
        out << "Content-Length: " << content_length << "\r\n";
        out << "Connection: close\r\n\r\n";
        return out.str();
    }

    std::string serialize(const Response &response)
    {
        auto headers = response.headers;
        headers.emplace(headers.begin(), "Content-Type", response.content_type);
        auto text = serialize_head(response.status, headers, response.body.size());
        text += response.body;
        return text;
    }

    std::string_view status_text(int status) noexcept
    {
        switch (status)
        {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 410:
            return "Gone";
        case 411:
            return "Length Required";
        case 413:
            return "Payload Too Large";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 505:
            return "HTTP Version Not Supported";
        default:
            return "Unknown";
        }
    }

    std::string percent_decode(std::string_view input)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            if (input[i] == '%' && i + 2 < input.size())
            {
                const int high = hex_value(input[i + 1]);
                const int low = hex_value(input[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    output.push_back(static_cast<char>((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            output.push_back(input[i]);
        }
        return output;
    }

    std::string percent_encode(std::string_view input)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string output;
        output.reserve(input.size());
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
            {
                output.push_back(ch);
            }
            else
            {
                output.push_back('%');
                output.push_back(kHexDigits[c >> 4]);
                output.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return output;
    }

    std::vector<std::pair<std::string, std::string>> header_parameters(std::string_view value)
    {
        std::vector<std::pair<std::string, std::string>> params;
        std::size_t pos = value.find(';');
        if (pos == std::string_view::npos)
        {
            return params;
        }

        const auto size = value.size();
        while (pos < size)
        {
            while (pos < size && (value[pos] == ';' || value[pos] == ' ' || value[pos] == '\t'))
            {
                ++pos;
            }
            if (pos >= size)
            {
                break;
            }

            const auto key_end = value.find_first_of("=;", pos);
            if (key_end == std::string_view::npos || value[key_end] == ';')
            {
                // Parameter without a value.
                pos = key_end == std::string_view::npos ? size : key_end;
                continue;
            }
            const auto key = trim(value.substr(pos, key_end - pos));
            pos = key_end + 1;
            while (pos < size && (value[pos] == ' ' || value[pos] == '\t'))
            {
                ++pos;
            }

            std::string param;
            if (pos < size && value[pos] == '"')
            {
                // quoted-string: ';' is literal inside, '\' escapes the next character.
                ++pos;
                while (pos < size && value[pos] != '"')
                {
                    if (value[pos] == '\\' && pos + 1 < size)
                    {
                        ++pos;
                    }
                    param.push_back(value[pos]);
                    ++pos;
                }
                const auto next = value.find(';', pos);
                pos = next == std::string_view::npos ? size : next;
            }
            else
            {
                const auto next = value.find(';', pos);
                param = std::string(trim(value.substr(pos, next == std::string_view::npos ? size - pos : next - pos)));
                pos = next == std::string_view::npos ? size : next;
            }

            if (!key.empty())
            {
                params.emplace_back(to_lower(key), std::move(param));
            }
        }
        return params;
    }

    std::string media_type(std::string_view content_type)
    {
        return to_lower(trim(content_type.substr(0, content_type.find(';'))));
    }

    std::string extract_boundary(std::string_view content_type)
    {
        for (const auto &[key, value] : header_parameters(content_type))
        {
            if (key == "boundary")
            {
                return value;
            }
        }
        return {};
    }

    std::string content_disposition_attachment(std::string_view filename)
    {
        std::string fallback;
        fallback.reserve(filename.size());
        for (const char ch : filename)
        {
            const auto c = static_cast<unsigned char>(ch);
            fallback.push_back((c < 0x20 || c >= 0x7F || ch == '"' || ch == '\\') ? '_' : ch);
        }
        if (fallback.empty())
        {
            fallback = "download";
        }
        return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + percent_encode(filename);
    }

} // namespace sharelink::http
