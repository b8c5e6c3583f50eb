#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sharelink/server/content_store.hpp"
#include "sharelink/server/transfer_record.hpp"
#include "sharelink/server/transfer_registry.hpp"

namespace sharelink::server
{

    struct UploadForm
    {
        std::vector<UploadPart> files;
        std::optional<std::string> email;
        std::optional<std::string> message;
    };

    struct UploadReceipt
    {
        std::string download_id;
        std::size_t file_count{};
    };

    // Everything needed to stream one stored file to a client.
    struct FileDescriptor
    {
        std::filesystem::path path;
        std::string display_name;
        std::uint64_t size_bytes{};
    };

    struct ManifestEntry
    {
        std::string download_url;
        std::string display_name;
        std::string size_text;
    };

    struct Manifest
    {
        std::string download_id;
        std::vector<ManifestEntry> entries;
    };

    using DownloadResult = std::variant<FileDescriptor, Manifest>;

    class TransferService
    {
    public:
        TransferService(ContentStore &store, TransferRegistry &registry);

        // Commits every spooled part and registers the batch. Spooled parts are
        // consumed on failure as well: committed content is rolled back.
        UploadReceipt handle_upload(UploadForm form);

        // A single-file transfer downloads directly, larger ones list a manifest.
        DownloadResult handle_download(const std::string &download_id);

        FileDescriptor handle_file_download(const std::string &download_id, const std::string &stored_name);

        TransferRegistry &registry() noexcept { return registry_; }

        static std::string format_size(std::uint64_t bytes);

        static std::string file_download_url(const std::string &download_id, const std::string &stored_name);

    private:
        ContentStore &store_;
        TransferRegistry &registry_;
    };

} // namespace sharelink::server
