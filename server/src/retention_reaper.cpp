#include "sharelink/server/retention_reaper.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

namespace sharelink::server
{

    RetentionReaper::RetentionReaper(asio::io_context &io_context, TransferRegistry &registry,
                                     std::chrono::seconds interval)
        : registry_(registry),
          interval_(interval.count() > 0 ? interval : std::chrono::seconds{1}),
          strand_(asio::make_strand(io_context)),
          timer_(strand_) {}

    void RetentionReaper::start()
    {
        asio::post(strand_, [this]
                   {
        if (running_) {
            return;
        }
        running_ = true;
        spdlog::info("Retention sweep every {}s", interval_.count());
        schedule(); });
    }

    void RetentionReaper::stop()
    {
        asio::post(strand_, [this]
                   {
        running_ = false;
        timer_.cancel(); });
    }

    std::size_t RetentionReaper::sweep_now()
    {
        const auto removed = registry_.sweep_expired(registry_.now());
        if (removed > 0)
        {
            spdlog::info("Retention sweep purged {} expired transfer(s), {} remaining", removed, registry_.size());
        }
        else
        {
            spdlog::debug("Retention sweep found nothing to purge");
        }
        return removed;
    }

    void RetentionReaper::schedule()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          { on_timer(ec); });
    }

    void RetentionReaper::on_timer(const std::error_code &ec)
    {
        if (ec == asio::error::operation_aborted || !running_)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Retention timer error: {}", ec.message());
        }
        else
        {
            try
            {
                sweep_now();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Retention sweep failed: {}", ex.what());
            }
        }
        schedule();
    }

} // namespace sharelink::server
