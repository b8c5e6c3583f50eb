#include "sharelink/server/upload_receiver.hpp"

#include <spdlog/spdlog.h>

#include "sharelink/error_codes.hpp"
#include "sharelink/server/transfer_error.hpp"

namespace sharelink::server
{

    namespace
    {

        // Some browsers send the client-side path along with the name.
        std::string display_name(std::string_view filename)
        {
            const auto separator = filename.find_last_of("/\\");
            if (separator != std::string_view::npos)
            {
                filename.remove_prefix(separator + 1);
            }
            return filename.empty() ? std::string("download") : std::string(filename);
        }

    } // namespace

    UploadReceiver::UploadReceiver(ContentStore &store, std::string boundary)
        : store_(store),
          reader_(std::move(boundary), http::MultipartReader::Handler{
                                           .on_part_begin = [this](const http::PartHeaders &headers)
                                           { on_part_begin(headers); },
                                           .on_part_data = [this](std::string_view data)
                                           { on_part_data(data); },
                                           .on_part_end = [this]
                                           { on_part_end(); },
                                       }) {}

    UploadReceiver::~UploadReceiver()
    {
        if (file_.is_open())
        {
            file_.close();
        }
        if (current_file_)
        {
            store_.remove(current_file_->temp_path);
        }
        if (!released_)
        {
            for (const auto &part : form_.files)
            {
                store_.remove(part.temp_path);
            }
        }
    }

    void UploadReceiver::feed(std::string_view chunk)
    {
        reader_.feed(chunk);
    }

    UploadForm UploadReceiver::finish()
    {
        if (!reader_.done())
        {
            throw http::MultipartError("Incomplete multipart body");
        }
        released_ = true;
        return std::move(form_);
    }

    void UploadReceiver::on_part_begin(const http::PartHeaders &headers)
    {
        target_ = Target::Discard;
        if (headers.filename)
        {
            if (headers.name != kFileField || headers.filename->empty())
            {
                spdlog::debug("Skipping file part in field '{}'", headers.name);
                return;
            }
            const auto temp_path = store_.allocate_incoming();
            file_.open(temp_path, std::ios::binary | std::ios::trunc);
            if (!file_.is_open())
            {
                throw TransferError(ErrorCode::StorageFailure, "Failed to open spool file " + temp_path.string());
            }
            current_file_ = UploadPart{
                .original_name = display_name(*headers.filename),
                .temp_path = temp_path,
                .size_bytes = 0,
            };
            target_ = Target::File;
            return;
        }

        if (headers.name == "email" || headers.name == "message")
        {
            field_name_ = headers.name;
            field_value_.clear();
            target_ = Target::Field;
        }
    }

    void UploadReceiver::on_part_data(std::string_view data)
    {
        switch (target_)
        {
        case Target::File:
            file_.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!file_)
            {
                throw TransferError(ErrorCode::StorageFailure,
                                    "Failed to write spool file " + current_file_->temp_path.string());
            }
            current_file_->size_bytes += data.size();
            break;
        case Target::Field:
            if (field_value_.size() + data.size() > kMaxFieldBytes)
            {
                throw http::MultipartError("Form field '" + field_name_ + "' is too large");
            }
            field_value_.append(data);
            break;
        case Target::Discard:
            break;
        }
    }

    void UploadReceiver::on_part_end()
    {
        if (target_ == Target::File)
        {
            file_.close();
            if (file_.fail())
            {
                throw TransferError(ErrorCode::StorageFailure,
                                    "Failed to flush spool file " + current_file_->temp_path.string());
            }
            form_.files.push_back(std::move(*current_file_));
            current_file_.reset();
        }
        else if (target_ == Target::Field && !field_value_.empty())
        {
            if (field_name_ == "email")
            {
                form_.email = field_value_;
            }
            else
            {
                form_.message = field_value_;
            }
        }
        target_ = Target::Discard;
    }

} // namespace sharelink::server
