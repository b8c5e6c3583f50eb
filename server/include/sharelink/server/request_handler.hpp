#pragma once

#include <string>
#include <variant>

#include "sharelink/http.hpp"
#include "sharelink/server/transfer_service.hpp"

namespace sharelink::server
{

    // Either a complete in-memory response or a stored file to stream.
    using Reply = std::variant<http::Response, FileDescriptor>;

    /**
     * Routes:
     *   GET  /                                  upload form
     *   POST /api/upload                        multipart/form-data; file parts are read from the
     *                                           "files" field only, other file fields are ignored,
     *                                           optional "email" and "message" text fields
     *   GET  /api/test                          health JSON
     *   GET  /download/:id                      the file itself, or a manifest for several files
     *   GET  /download-file/:id/:storedName     one file of a transfer
     */
    class RequestHandler
    {
    public:
        explicit RequestHandler(TransferService &service);

        static bool is_upload(const http::Request &request);

        // Routes every request except uploads, whose bodies the session streams into an UploadReceiver.
        Reply handle(const http::Request &request);

        http::Response handle_upload(UploadForm form);

        // JSON failure body in the shape of a regular upload response.
        http::Response upload_error(int status, const std::string &message) const;

    private:
        Reply download(const std::string &download_id);
        Reply download_file(const std::string &download_id, const std::string &stored_name);
        http::Response health() const;

        TransferService &service_;
    };

} // namespace sharelink::server
