#include "sharelink/server/transfer_service.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

#include "sharelink/http.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    namespace
    {
        constexpr std::array<std::string_view, 4> kSizeUnits{"Bytes", "KB", "MB", "GB"};

        FileDescriptor describe(const FileRecord &file)
        {
            return FileDescriptor{
                .path = file.storage_path,
                .display_name = file.original_name,
                .size_bytes = file.size_bytes,
            };
        }

    } // namespace

    TransferService::TransferService(ContentStore &store, TransferRegistry &registry)
        : store_(store), registry_(registry) {}

    UploadReceipt TransferService::handle_upload(UploadForm form)
    {
        if (form.files.empty())
        {
            throw TransferError(ErrorCode::InvalidInput, "Please select files to upload");
        }

        std::vector<FileRecord> records;
        records.reserve(form.files.size());
        try
        {
            for (const auto &part : form.files)
            {
                records.push_back(store_.commit(part));
            }
        }
        catch (const TransferError &)
        {
            for (const auto &record : records)
            {
                store_.remove(record.storage_path);
            }
            for (std::size_t i = records.size(); i < form.files.size(); ++i)
            {
                store_.remove(form.files[i].temp_path);
            }
            throw;
        }

        std::vector<std::filesystem::path> committed;
        committed.reserve(records.size());
        for (const auto &record : records)
        {
            committed.push_back(record.storage_path);
        }

        const auto file_count = records.size();
        std::string download_id;
        try
        {
            download_id = registry_.create(std::move(records), std::move(form.email), std::move(form.message));
        }
        catch (const std::exception &)
        {
            for (const auto &path : committed)
            {
                store_.remove(path);
            }
            throw;
        }

        spdlog::info("Transfer {} created with {} file(s)", download_id, file_count);
        return UploadReceipt{.download_id = download_id, .file_count = file_count};
    }

    DownloadResult TransferService::handle_download(const std::string &download_id)
    {
        const auto record = registry_.resolve(download_id);
        if (record->files.size() == 1)
        {
            return describe(record->files.front());
        }

        Manifest manifest{.download_id = download_id, .entries = {}};
        manifest.entries.reserve(record->files.size());
        for (const auto &file : record->files)
        {
            manifest.entries.push_back(ManifestEntry{
                .download_url = file_download_url(download_id, file.stored_name),
                .display_name = file.original_name,
                .size_text = format_size(file.size_bytes),
            });
        }
        return manifest;
    }

    FileDescriptor TransferService::handle_file_download(const std::string &download_id,
                                                         const std::string &stored_name)
    {
        return describe(registry_.resolve_file(download_id, stored_name));
    }

    std::string TransferService::format_size(std::uint64_t bytes)
    {
        if (bytes == 0)
        {
            return "0 Bytes";
        }

        // floor(log1024(bytes)), capped at the last unit.
        std::size_t unit = 0;
        std::uint64_t scale = 1;
        while (unit + 1 < kSizeUnits.size() && bytes / scale >= 1024)
        {
            scale *= 1024;
            ++unit;
        }

        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / static_cast<double>(scale);
        auto text = out.str();
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.')
        {
            text.pop_back();
        }
        return text + " " + std::string(kSizeUnits[unit]);
    }

    std::string TransferService::file_download_url(const std::string &download_id, const std::string &stored_name)
    {
        return "/download-file/" + http::percent_encode(download_id) + "/" + http::percent_encode(stored_name);
    }

} // namespace sharelink::server
