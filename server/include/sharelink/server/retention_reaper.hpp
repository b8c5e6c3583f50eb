#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <chrono>
#include <cstddef>

#include "sharelink/server/transfer_registry.hpp"

namespace sharelink::server
{

    // Periodically purges expired transfers from the registry.
    class RetentionReaper
    {
    public:
        RetentionReaper(asio::io_context &io_context, TransferRegistry &registry, std::chrono::seconds interval);

        void start();
        void stop();

        std::size_t sweep_now();

        std::chrono::seconds interval() const noexcept { return interval_; }

    private:
        void schedule();
        void on_timer(const std::error_code &ec);

        TransferRegistry &registry_;
        std::chrono::seconds interval_;
        asio::strand<asio::io_context::executor_type> strand_;
        asio::steady_timer timer_;
        bool running_{false};
    };

} // namespace sharelink::server
