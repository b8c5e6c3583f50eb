#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sharelink/server/content_store.hpp"
#include "sharelink/server/transfer_record.hpp"

namespace sharelink::server
{

    struct RegistryOptions
    {
        std::chrono::seconds retention{kDefaultRetention};
        // Defaults to the system clock.
        std::function<Clock::time_point()> clock;
        // Defaults to IdentifierGenerator.
        std::function<std::string()> id_source;
    };

    /**
     * In-memory map from download identifier to transfer record.
     *
     * Records are immutable once inserted; the map is the unit of mutation.
     * Removing a record by any path deletes its stored content through the
     * ContentStore, after the map lock has been released.
     */
    class TransferRegistry
    {
    public:
        static constexpr int kMaxIdentifierAttempts = 16;

        TransferRegistry(ContentStore &store, RegistryOptions options = {});

        // Throws TransferError(InvalidInput) for an empty batch.
        std::string create(std::vector<FileRecord> files, std::optional<std::string> email,
                           std::optional<std::string> message);

        // Throws TransferError(NotFound) or, after purging the record, TransferError(Expired).
        std::shared_ptr<const TransferRecord> resolve(const std::string &download_id);

        FileRecord resolve_file(const std::string &download_id, const std::string &stored_name);

        // Idempotent; returns whether an entry was removed.
        bool remove(const std::string &download_id);

        // Removes every record whose expiry lies before `now`.
        std::size_t sweep_expired(Clock::time_point now);

        std::size_t size() const;

        Clock::time_point now() const;

        std::chrono::seconds retention() const noexcept { return retention_; }

    private:
        void release_content(const std::string &download_id, const TransferRecord &record);

        ContentStore &store_;
        std::chrono::seconds retention_;
        std::function<Clock::time_point()> clock_;
        std::function<std::string()> id_source_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<const TransferRecord>> records_;
    };

} // namespace sharelink::server
