#include "sharelink/server/session.hpp"

#include <asio/buffers_iterator.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <exception>
#include <variant>

#include <spdlog/spdlog.h>

namespace sharelink::server
{

    namespace
    {
        constexpr std::size_t kMaxRequestHead = 16 * 1024;
        constexpr std::size_t kChunkSize = 64 * 1024;
    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)),
          services_(services),
          deadline_(socket_.get_executor()),
          request_buffer_(kMaxRequestHead),
          chunk_buffer_(kChunkSize)
    {
        peer_ = remote_endpoint();
    }

    Session::~Session()
    {
        stop();
    }

    void Session::start()
    {
        spdlog::debug("Connection from {}", peer_);
        read_request_head();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        // Spooled parts are gone before the peer can observe the close.
        upload_.reset();
        if (file_.is_open())
        {
            file_.close();
        }
        std::error_code ec;
        deadline_.cancel();
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_request_head()
    {
        arm_deadline();
        auto self = shared_from_this();
        asio::async_read_until(socket_, request_buffer_, "\r\n\r\n",
                               [this, self](const std::error_code &ec, std::size_t head_size)
                               {
                                   if (ec == asio::error::not_found)
                                   {
                                       send_response(http::Response::text(431, "Request head too large"));
                                       return;
                                   }
                                   if (ec)
                                   {
                                       stop();
                                       return;
                                   }
                                   const auto data = request_buffer_.data();
                                   const std::string head(asio::buffers_begin(data),
                                                          asio::buffers_begin(data) +
                                                              static_cast<std::ptrdiff_t>(head_size));
                                   request_buffer_.consume(head_size);
                                   try
                                   {
                                       request_ = http::parse_request_head(head);
                                   }
                                   catch (const http::HttpError &ex)
                                   {
                                       send_response(http::Response::text(ex.status(), ex.what()));
                                       return;
                                   }
                                   spdlog::debug("{} -> {} {}", peer_, request_.method, request_.target);
                                   process_request();
                               });
    }

    void Session::process_request()
    {
        if (RequestHandler::is_upload(request_))
        {
            begin_upload();
            return;
        }

        try
        {
            auto reply = services_.handler.handle(request_);
            if (const auto *file = std::get_if<FileDescriptor>(&reply))
            {
                send_file(*file);
                return;
            }
            send_response(std::get<http::Response>(reply));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Request {} {} failed: {}", request_.method, request_.target, ex.what());
            send_response(http::Response::text(500, "Server error"));
        }
    }

    void Session::send_response(const http::Response &response)
    {
        write_buffer_ = http::serialize(response);
        arm_deadline();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_buffer_),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("{} write failed: {}", peer_, ec.message());
                              }
                              stop();
                          });
    }

    void Session::arm_deadline()
    {
        deadline_.expires_after(services_.idle_timeout);
        auto self = shared_from_this();
        deadline_.async_wait([this, self](const std::error_code &ec)
                             {
        if (ec == asio::error::operation_aborted || closed_) {
            return;
        }
        if (deadline_.expiry() <= asio::steady_timer::clock_type::now()) {
            spdlog::debug("{} idle for {}s, closing", peer_, services_.idle_timeout.count());
            stop();
        } });
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "<unknown>";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace sharelink::server
