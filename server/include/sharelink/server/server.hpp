#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "sharelink/server/config.hpp"
#include "sharelink/server/content_store.hpp"
#include "sharelink/server/request_handler.hpp"
#include "sharelink/server/retention_reaper.hpp"
#include "sharelink/server/transfer_registry.hpp"
#include "sharelink/server/transfer_service.hpp"

namespace sharelink::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        // Thread-safe; run() returns once the event loop has wound down.
        void stop();

        // Port the acceptor is bound to, useful when the configured port is 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;

        // Declared ahead of the io_context: sessions still queued in it are
        // destroyed with it and release their spooled uploads through the store.
        ContentStore content_store_;
        TransferRegistry transfer_registry_;
        TransferService transfer_service_;
        RequestHandler request_handler_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        RetentionReaper reaper_;

        std::vector<std::thread> workers_;
    };

} // namespace sharelink::server
