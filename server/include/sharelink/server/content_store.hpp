#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "sharelink/server/transfer_record.hpp"

namespace sharelink::server
{

    // Local directory holding spooled uploads (incoming/) and committed content (files/).
    class ContentStore
    {
    public:
        explicit ContentStore(std::filesystem::path root);

        std::filesystem::path root() const;
        std::filesystem::path files_dir() const;
        std::filesystem::path incoming_dir() const;

        // Unused spool path for an upload part in progress.
        std::filesystem::path allocate_incoming() const;

        // Moves a spooled part into files/ under a freshly generated stored name.
        // Throws TransferError(StorageFailure) when the move fails.
        FileRecord commit(const UploadPart &part) const;

        // Best effort. Failures are logged; returns whether the path is gone.
        bool remove(const std::filesystem::path &path) const;

        // Clears content left by an earlier process; the registry does not survive restarts.
        std::size_t purge_orphans() const;

        // "<unix millis>-<jitter><.ext>", extension taken from the original name when it is plain.
        static std::string make_stored_name(std::string_view original_name);

        static std::string sanitized_extension(std::string_view original_name);

    private:
        std::filesystem::path base_;
    };

} // namespace sharelink::server
