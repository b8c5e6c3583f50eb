#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "sharelink/multipart.hpp"
#include "sharelink/server/content_store.hpp"
#include "sharelink/server/transfer_service.hpp"

namespace sharelink::server
{

    /**
     * Decodes an upload request body as it arrives.
     *
     * File parts of the "files" field are spooled into the content store's
     * incoming directory; the "email" and "message" fields are collected as
     * text. Spooled files still owned by the receiver when it is destroyed
     * are deleted, so an aborted upload leaves nothing behind.
     */
    class UploadReceiver
    {
    public:
        static constexpr std::string_view kFileField = "files";
        static constexpr std::size_t kMaxFieldBytes = 64 * 1024;

        UploadReceiver(ContentStore &store, std::string boundary);
        ~UploadReceiver();

        UploadReceiver(const UploadReceiver &) = delete;
        UploadReceiver &operator=(const UploadReceiver &) = delete;

        void feed(std::string_view chunk);

        // Hands the spooled parts over to the caller. Throws MultipartError if
        // the closing delimiter has not been seen.
        UploadForm finish();

    private:
        enum class Target
        {
            Discard,
            File,
            Field
        };

        void on_part_begin(const http::PartHeaders &headers);
        void on_part_data(std::string_view data);
        void on_part_end();

        ContentStore &store_;
        http::MultipartReader reader_;

        Target target_{Target::Discard};
        std::ofstream file_;
        std::optional<UploadPart> current_file_;
        std::string field_name_;
        std::string field_value_;

        UploadForm form_;
        bool released_{false};
    };

} // namespace sharelink::server
