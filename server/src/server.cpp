#include "sharelink/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "sharelink/server/session.hpp"

namespace sharelink::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          content_store_(config_.root),
          transfer_registry_(content_store_,
                             RegistryOptions{.retention = config_.retention, .clock = {}, .id_source = {}}),
          transfer_service_(content_store_, transfer_registry_),
          request_handler_(transfer_service_),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          reaper_(io_context_, transfer_registry_, config_.sweep_interval)
    {
        if (const auto purged = content_store_.purge_orphans(); purged > 0)
        {
            spdlog::info("Removed {} stale entries from {}", purged, config_.root.string());
        }

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        spdlog::info("Transfers expire after {}h",
                     std::chrono::duration_cast<std::chrono::hours>(config_.retention).count());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        reaper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{request_handler_, content_store_, config_.idle_timeout};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        reaper_.stop();
        io_context_.stop();
        spdlog::info("Shutting down");
    }

} // namespace sharelink::server
