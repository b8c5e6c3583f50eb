#include "sharelink/server/transfer_registry.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "sharelink/server/identifier_generator.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    TransferRegistry::TransferRegistry(ContentStore &store, RegistryOptions options)
        : store_(store),
          retention_(options.retention),
          clock_(std::move(options.clock)),
          id_source_(std::move(options.id_source))
    {
        if (!clock_)
        {
            clock_ = [] { return Clock::now(); };
        }
        if (!id_source_)
        {
            id_source_ = [generator = IdentifierGenerator{}] { return generator.generate(); };
        }
    }

    std::string TransferRegistry::create(std::vector<FileRecord> files, std::optional<std::string> email,
                                         std::optional<std::string> message)
    {
        if (files.empty())
        {
            throw TransferError(ErrorCode::InvalidInput, "A transfer needs at least one file");
        }

        const auto now = clock_();
        auto record = std::make_shared<const TransferRecord>(TransferRecord{
            .files = std::move(files),
            .email = std::move(email),
            .message = std::move(message),
            .created_at = now,
            .expires_at = now + retention_,
        });

        std::lock_guard lock(mutex_);
        for (int attempt = 0; attempt < kMaxIdentifierAttempts; ++attempt)
        {
            auto download_id = id_source_();
            const auto [it, inserted] = records_.try_emplace(download_id, record);
            if (inserted)
            {
                return download_id;
            }
            spdlog::warn("Download identifier collision on {}, drawing another", download_id);
        }
        throw TransferError(ErrorCode::InternalError, "Could not allocate a unique download identifier");
    }

    std::shared_ptr<const TransferRecord> TransferRegistry::resolve(const std::string &download_id)
    {
        std::shared_ptr<const TransferRecord> expired;
        {
            std::lock_guard lock(mutex_);
            auto it = records_.find(download_id);
            if (it == records_.end())
            {
                throw TransferError(ErrorCode::NotFound, "Transfer not found");
            }
            if (!is_expired(*it->second, clock_()))
            {
                return it->second;
            }
            expired = std::move(it->second);
            records_.erase(it);
        }

        spdlog::info("Transfer {} expired on access", download_id);
        release_content(download_id, *expired);
        throw TransferError(ErrorCode::Expired, "Transfer has expired");
    }

    FileRecord TransferRegistry::resolve_file(const std::string &download_id, const std::string &stored_name)
    {
        const auto record = resolve(download_id);
        const auto it = std::find_if(record->files.begin(), record->files.end(),
                                     [&](const FileRecord &file)
                                     { return file.stored_name == stored_name; });
        if (it == record->files.end())
        {
            throw TransferError(ErrorCode::NotFound, "File not found");
        }
        return *it;
    }

    bool TransferRegistry::remove(const std::string &download_id)
    {
        std::shared_ptr<const TransferRecord> removed;
        {
            std::lock_guard lock(mutex_);
            auto it = records_.find(download_id);
            if (it == records_.end())
            {
                return false;
            }
            removed = std::move(it->second);
            records_.erase(it);
        }
        release_content(download_id, *removed);
        return true;
    }

    std::size_t TransferRegistry::sweep_expired(Clock::time_point now)
    {
        std::vector<std::pair<std::string, std::shared_ptr<const TransferRecord>>> expired;
        {
            std::lock_guard lock(mutex_);
            for (auto it = records_.begin(); it != records_.end();)
            {
                if (is_expired(*it->second, now))
                {
                    expired.emplace_back(it->first, std::move(it->second));
                    it = records_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        for (const auto &[download_id, record] : expired)
        {
            release_content(download_id, *record);
        }
        return expired.size();
    }

    std::size_t TransferRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    Clock::time_point TransferRegistry::now() const
    {
        return clock_();
    }

    void TransferRegistry::release_content(const std::string &download_id, const TransferRecord &record)
    {
        std::size_t failures = 0;
        for (const auto &file : record.files)
        {
            if (!store_.remove(file.storage_path))
            {
                ++failures;
            }
        }
        if (failures > 0)
        {
            spdlog::warn("Transfer {} removed with {} of {} files left on disk", download_id, failures,
                         record.files.size());
        }
    }

} // namespace sharelink::server
