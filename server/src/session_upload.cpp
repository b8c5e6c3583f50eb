#include "sharelink/server/session.hpp"

#include <asio/buffers_iterator.hpp>

#include <algorithm>
#include <charconv>

#include <spdlog/spdlog.h>

#include "sharelink/error_codes.hpp"
#include "sharelink/multipart.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    void Session::begin_upload()
    {
        const auto length = request_.header("content-length");
        if (!length)
        {
            send_response(services_.handler.upload_error(411, "Content-Length is required"));
            return;
        }
        std::uint64_t content_length = 0;
        const auto *end = length->data() + length->size();
        const auto [ptr, parse_ec] = std::from_chars(length->data(), end, content_length);
        if (parse_ec != std::errc{} || ptr != end)
        {
            send_response(services_.handler.upload_error(400, "Invalid Content-Length"));
            return;
        }

        const auto content_type = request_.header("content-type").value_or("");
        const auto boundary = http::extract_boundary(content_type);
        if (http::media_type(content_type) != "multipart/form-data" || boundary.empty())
        {
            send_response(services_.handler.upload_error(400, "Expected a multipart/form-data body"));
            return;
        }

        try
        {
            upload_ = std::make_unique<UploadReceiver>(services_.content_store, boundary);
        }
        catch (const http::MultipartError &ex)
        {
            send_response(services_.handler.upload_error(400, ex.what()));
            return;
        }

        body_remaining_ = content_length;
        if (request_buffer_.size() > 0)
        {
            const auto take = static_cast<std::size_t>(
                std::min<std::uint64_t>(request_buffer_.size(), body_remaining_));
            const auto data = request_buffer_.data();
            const std::string buffered(asio::buffers_begin(data),
                                       asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(take));
            request_buffer_.consume(request_buffer_.size());
            body_remaining_ -= take;
            if (!consume_upload(buffered))
            {
                return;
            }
        }
        read_upload_body();
    }

    void Session::read_upload_body()
    {
        if (body_remaining_ == 0)
        {
            finish_upload();
            return;
        }
        arm_deadline();
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_buffer_.size(), body_remaining_));
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(chunk_buffer_.data(), want),
                                [this, self](const std::error_code &ec, std::size_t bytes_read)
                                {
                                    if (ec)
                                    {
                                        spdlog::debug("{} upload aborted: {}", peer_, ec.message());
                                        stop();
                                        return;
                                    }
                                    body_remaining_ -= bytes_read;
                                    if (!consume_upload(std::string_view(chunk_buffer_.data(), bytes_read)))
                                    {
                                        return;
                                    }
                                    read_upload_body();
                                });
    }

    bool Session::consume_upload(std::string_view chunk)
    {
        try
        {
            upload_->feed(chunk);
            return true;
        }
        catch (const http::MultipartError &ex)
        {
            upload_.reset();
            send_response(services_.handler.upload_error(400, ex.what()));
        }
        catch (const TransferError &ex)
        {
            spdlog::error("Upload from {} failed: {}", peer_, ex.what());
            upload_.reset();
            send_response(
                services_.handler.upload_error(http_status(ex.code()), std::string("Server error: ") + ex.what()));
        }
        return false;
    }

    void Session::finish_upload()
    {
        UploadForm form;
        try
        {
            form = upload_->finish();
        }
        catch (const http::MultipartError &ex)
        {
            upload_.reset();
            send_response(services_.handler.upload_error(400, ex.what()));
            return;
        }
        upload_.reset();
        send_response(services_.handler.handle_upload(std::move(form)));
    }

} // namespace sharelink::server
