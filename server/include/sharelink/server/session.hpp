#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/streambuf.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sharelink/http.hpp"
#include "sharelink/server/content_store.hpp"
#include "sharelink/server/request_handler.hpp"
#include "sharelink/server/upload_receiver.hpp"

namespace sharelink::server
{

    struct ServerServices
    {
        RequestHandler &handler;
        ContentStore &content_store;
        std::chrono::seconds idle_timeout;
    };

    // One HTTP exchange on one connection. The socket's executor is a strand,
    // so handlers for a session never run concurrently.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_request_head();
        void process_request();
        void send_response(const http::Response &response);
        void arm_deadline();

        // Upload path
        void begin_upload();
        void read_upload_body();
        bool consume_upload(std::string_view chunk);
        void finish_upload();

        // Download path
        void send_file(const FileDescriptor &file);
        void send_file_chunk();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        asio::steady_timer deadline_;
        asio::streambuf request_buffer_;
        std::string peer_;
        bool closed_{false};

        http::Request request_{};
        std::string write_buffer_;
        std::vector<char> chunk_buffer_;

        std::unique_ptr<UploadReceiver> upload_;
        std::uint64_t body_remaining_{};

        std::ifstream file_;
        std::uint64_t file_remaining_{};
    };

} // namespace sharelink::server
