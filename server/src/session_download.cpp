#include "sharelink/server/session.hpp"

#include <asio/write.hpp>

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace sharelink::server
{

    void Session::send_file(const FileDescriptor &file)
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(file.path, ec);
        if (!ec)
        {
            file_.open(file.path, std::ios::binary);
        }
        if (ec || !file_.is_open())
        {
            spdlog::error("Stored content {} is unreadable: {}", file.path.string(),
                          ec ? ec.message() : std::string("open failed"));
            send_response(http::Response::text(500, "Server error"));
            return;
        }

        file_remaining_ = size;
        write_buffer_ = http::serialize_head(200,
                                             {
                                                 {"Content-Type", "application/octet-stream"},
                                                 {"Content-Disposition",
                                                  http::content_disposition_attachment(file.display_name)},
                                             },
                                             size);
        spdlog::info("Sending {} ({} bytes) to {}", file.display_name, size, peer_);

        arm_deadline();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_buffer_),
                          [this, self](const std::error_code &write_ec, std::size_t /*bytes_transferred*/)
                          {
                              if (write_ec)
                              {
                                  stop();
                                  return;
                              }
                              send_file_chunk();
                          });
    }

    void Session::send_file_chunk()
    {
        if (file_remaining_ == 0)
        {
            stop();
            return;
        }

        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(chunk_buffer_.size(), file_remaining_));
        file_.read(chunk_buffer_.data(), want);
        const auto read_count = file_.gcount();
        if (read_count <= 0)
        {
            spdlog::error("Short read while sending to {}, {} bytes left", peer_, file_remaining_);
            stop();
            return;
        }
        file_remaining_ -= static_cast<std::uint64_t>(read_count);

        arm_deadline();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(chunk_buffer_.data(), static_cast<std::size_t>(read_count)),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("{} download aborted: {}", peer_, ec.message());
                                  stop();
                                  return;
                              }
                              send_file_chunk();
                          });
    }

} // namespace sharelink::server
