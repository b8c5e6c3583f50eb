#include "sharelink/server/request_handler.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sharelink/error_codes.hpp"
#include "sharelink/protocol.hpp"
#include "sharelink/server/pages.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    namespace
    {

        std::string iso_timestamp(Clock::time_point time)
        {
            const auto millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
            const std::time_t seconds = Clock::to_time_t(time);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream out;
            out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
                << 'Z';
            return out.str();
        }

        http::Response method_not_allowed(const char *allowed)
        {
            auto response = http::Response::text(405, "Method Not Allowed");
            response.headers.emplace_back("Allow", allowed);
            return response;
        }

        bool is_path(const http::Request &request, std::string_view first, std::size_t size)
        {
            return request.segments.size() == size && request.segments.front() == first;
        }

    } // namespace

    RequestHandler::RequestHandler(TransferService &service) : service_(service) {}

    bool RequestHandler::is_upload(const http::Request &request)
    {
        return request.method == "POST" && is_path(request, "api", 2) && request.segments[1] == "upload";
    }

    Reply RequestHandler::handle(const http::Request &request)
    {
        const bool is_get = request.method == "GET";
        const auto &segments = request.segments;

        if (segments.empty())
        {
            return is_get ? http::Response::html(200, pages::home()) : method_not_allowed("GET");
        }
        if (is_path(request, "api", 2) && segments[1] == "test")
        {
            return is_get ? health() : method_not_allowed("GET");
        }
        if (is_path(request, "api", 2) && segments[1] == "upload")
        {
            return method_not_allowed("POST");
        }
        if (is_path(request, "download", 2))
        {
            if (!is_get)
            {
                return method_not_allowed("GET");
            }
            return download(segments[1]);
        }
        if (is_path(request, "download-file", 3))
        {
            if (!is_get)
            {
                return method_not_allowed("GET");
            }
            return download_file(segments[1], segments[2]);
        }
        return http::Response::text(404, "Not Found");
    }

    http::Response RequestHandler::handle_upload(UploadForm form)
    {
        try
        {
            const auto receipt = service_.handle_upload(std::move(form));
            const protocol::UploadResponse response{
                .success = true,
                .download_id = receipt.download_id,
                .message = std::string("Files uploaded successfully!"),
                .file_count = receipt.file_count,
                .error = std::nullopt,
            };
            return http::Response::json(200, nlohmann::json(response).dump());
        }
        catch (const TransferError &ex)
        {
            if (ex.code() == ErrorCode::InvalidInput)
            {
                return upload_error(http_status(ex.code()), ex.what());
            }
            spdlog::error("Upload failed ({}): {}", to_string(ex.code()), ex.what());
            return upload_error(http_status(ex.code()), std::string("Server error: ") + ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upload failed: {}", ex.what());
            return upload_error(500, std::string("Server error: ") + ex.what());
        }
    }

    http::Response RequestHandler::upload_error(int status, const std::string &message) const
    {
        protocol::UploadResponse response{};
        response.success = false;
        response.error = message;
        return http::Response::json(status, nlohmann::json(response).dump());
    }

    Reply RequestHandler::download(const std::string &download_id)
    {
        try
        {
            auto result = service_.handle_download(download_id);
            if (auto *file = std::get_if<FileDescriptor>(&result))
            {
                return std::move(*file);
            }
            return http::Response::html(200, pages::manifest(std::get<Manifest>(result)));
        }
        catch (const TransferError &ex)
        {
            switch (ex.code())
            {
            case ErrorCode::NotFound:
                return http::Response::html(404, pages::not_found());
            case ErrorCode::Expired:
                return http::Response::html(410, pages::expired(service_.registry().retention()));
            default:
                spdlog::error("Download of {} failed: {}", download_id, ex.what());
                return http::Response::text(500, "Server error");
            }
        }
    }

    Reply RequestHandler::download_file(const std::string &download_id, const std::string &stored_name)
    {
        try
        {
            return service_.handle_file_download(download_id, stored_name);
        }
        catch (const TransferError &ex)
        {
            switch (ex.code())
            {
            case ErrorCode::NotFound:
                return http::Response::text(404, "File not found");
            case ErrorCode::Expired:
                return http::Response::html(410, pages::expired(service_.registry().retention()));
            default:
                spdlog::error("Download of {}/{} failed: {}", download_id, stored_name, ex.what());
                return http::Response::text(500, "Server error");
            }
        }
    }

    http::Response RequestHandler::health() const
    {
        const protocol::HealthResponse response{
            .success = true,
            .message = "Server is working perfectly!",
            .timestamp = iso_timestamp(service_.registry().now()),
        };
        return http::Response::json(200, nlohmann::json(response).dump());
    }

} // namespace sharelink::server
