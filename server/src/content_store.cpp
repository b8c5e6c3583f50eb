#include "sharelink/server/content_store.hpp"

#include <cctype>
#include <chrono>
#include <system_error>

#include <spdlog/spdlog.h>

#include "sharelink/crypto.hpp"
#include "sharelink/encoding/base64url.hpp"
#include "sharelink/error_codes.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kIncomingDir = "incoming";
        constexpr std::size_t kMaxExtensionLength = 16;
        constexpr std::uint32_t kJitterRange = 1'000'000'000;
        constexpr int kMaxNameAttempts = 8;

        std::size_t clear_directory(const std::filesystem::path &directory)
        {
            std::size_t removed = 0;
            std::error_code ec;
            for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
            {
                std::error_code remove_ec;
                std::filesystem::remove_all(it->path(), remove_ec);
                if (remove_ec)
                {
                    spdlog::warn("Failed to remove orphan {}: {}", it->path().string(), remove_ec.message());
                    continue;
                }
                ++removed;
            }
            if (ec)
            {
                spdlog::warn("Failed to scan {}: {}", directory.string(), ec.message());
            }
            return removed;
        }

    } // namespace

    ContentStore::ContentStore(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_ / kFilesDir);
        std::filesystem::create_directories(base_ / kIncomingDir);
    }

    std::filesystem::path ContentStore::root() const
    {
        return base_;
    }

    std::filesystem::path ContentStore::files_dir() const
    {
        return base_ / kFilesDir;
    }

    std::filesystem::path ContentStore::incoming_dir() const
    {
        return base_ / kIncomingDir;
    }

    std::filesystem::path ContentStore::allocate_incoming() const
    {
        const auto token = encoding::encode_base64url(crypto::random_bytes(12));
        return incoming_dir() / (token + ".part");
    }

    FileRecord ContentStore::commit(const UploadPart &part) const
    {
        std::string stored_name;
        std::filesystem::path destination;
        for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt)
        {
            stored_name = make_stored_name(part.original_name);
            destination = files_dir() / stored_name;
            std::error_code exists_ec;
            if (!std::filesystem::exists(destination, exists_ec))
            {
                break;
            }
        }

        std::error_code ec;
        std::filesystem::rename(part.temp_path, destination, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::StorageFailure,
                                "Failed to store " + part.original_name + ": " + ec.message());
        }

        return FileRecord{
            .original_name = part.original_name,
            .stored_name = stored_name,
            .storage_path = destination,
            .size_bytes = part.size_bytes,
        };
    }

    bool ContentStore::remove(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Failed to delete stored content {}: {}", path.string(), ec.message());
            return false;
        }
        return true;
    }

    std::size_t ContentStore::purge_orphans() const
    {
        return clear_directory(files_dir()) + clear_directory(incoming_dir());
    }

    std::string ContentStore::make_stored_name(std::string_view original_name)
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                Clock::now().time_since_epoch())
                                .count();
        return std::to_string(millis) + "-" + std::to_string(crypto::random_uniform(kJitterRange)) +
               sanitized_extension(original_name);
    }

    std::string ContentStore::sanitized_extension(std::string_view original_name)
    {
        const auto separator = original_name.find_last_of("/\\");
        if (separator != std::string_view::npos)
        {
            original_name.remove_prefix(separator + 1);
        }
        const auto dot = original_name.rfind('.');
        // Dotfiles such as ".profile" have no extension.
        if (dot == std::string_view::npos || dot == 0)
        {
            return {};
        }
        const auto extension = original_name.substr(dot + 1);
        if (extension.empty() || extension.size() > kMaxExtensionLength)
        {
            return {};
        }
        for (const char ch : extension)
        {
            if (!std::isalnum(static_cast<unsigned char>(ch)))
            {
                return {};
            }
        }
        return "." + std::string(extension);
    }

} // namespace sharelink::server
