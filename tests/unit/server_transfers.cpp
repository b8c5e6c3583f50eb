#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharelink/http.hpp"
#include "sharelink/multipart.hpp"
#include "sharelink/server/content_store.hpp"
#include "sharelink/server/pages.hpp"
#include "sharelink/server/request_handler.hpp"
#include "sharelink/server/transfer_error.hpp"
#include "sharelink/server/transfer_registry.hpp"
#include "sharelink/server/transfer_service.hpp"
#include "sharelink/server/upload_receiver.hpp"

using namespace sharelink;
using namespace sharelink::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / ("sharelink_" + name);
        cleanup_path(root);
        return root;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::size_t count_entries(const std::filesystem::path &directory)
    {
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(directory),
                                                      std::filesystem::directory_iterator()));
    }

    UploadPart spool(const ContentStore &store, const std::string &name, const std::string &content)
    {
        const auto temp = store.allocate_incoming();
        std::ofstream out(temp, std::ios::binary);
        out << content;
        out.close();
        return UploadPart{.original_name = name, .temp_path = temp, .size_bytes = content.size()};
    }

    // Store, registry, service and handler wired together over a throwaway directory.
    struct Fixture
    {
        explicit Fixture(const std::string &name)
            : root(fresh_root(name)),
              store(root),
              registry(store, RegistryOptions{.clock = [now = now] { return *now; }}),
              service(store, registry),
              handler(service) {}

        ~Fixture() { cleanup_path(root); }

        Reply get(const std::string &target)
        {
            return handler.handle(http::parse_request_head("GET " + target + " HTTP/1.1\r\nHost: test\r\n\r\n"));
        }

        std::shared_ptr<Clock::time_point> now = std::make_shared<Clock::time_point>(Clock::now());
        std::filesystem::path root;
        ContentStore store;
        TransferRegistry registry;
        TransferService service;
        RequestHandler handler;
    };

    http::Response as_response(const Reply &reply)
    {
        assert(std::holds_alternative<http::Response>(reply));
        return std::get<http::Response>(reply);
    }

    bool contains(const std::string &haystack, const std::string &needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    void test_format_size()
    {
        assert(TransferService::format_size(0) == "0 Bytes");
        assert(TransferService::format_size(1) == "1 Bytes");
        assert(TransferService::format_size(1023) == "1023 Bytes");
        assert(TransferService::format_size(1024) == "1 KB");
        assert(TransferService::format_size(1536) == "1.5 KB");
        assert(TransferService::format_size(1300) == "1.27 KB");
        assert(TransferService::format_size(10 * 1024) == "10 KB");
        assert(TransferService::format_size(1048576) == "1 MB");
        assert(TransferService::format_size(5368709120ULL) == "5 GB");
        assert(TransferService::format_size(1099511627776ULL) == "1024 GB");
    }

    void test_upload_then_download()
    {
        Fixture fx("service_roundtrip");
        const auto receipt = fx.service.handle_upload(UploadForm{
            .files = {spool(fx.store, "one.txt", "1"), spool(fx.store, "two.txt", "22"),
                      spool(fx.store, "three.txt", "333")},
            .email = std::string("carol@example.com"),
            .message = std::nullopt,
        });
        assert(receipt.file_count == 3);
        assert(std::filesystem::is_empty(fx.store.incoming_dir()));
        assert(count_entries(fx.store.files_dir()) == 3);

        const auto result = fx.service.handle_download(receipt.download_id);
        const auto *manifest = std::get_if<Manifest>(&result);
        assert(manifest);
        assert(manifest->download_id == receipt.download_id);
        assert(manifest->entries.size() == 3);
        assert(manifest->entries[0].display_name == "one.txt");
        assert(manifest->entries[1].display_name == "two.txt");
        assert(manifest->entries[2].display_name == "three.txt");
        assert(manifest->entries[2].size_text == "3 Bytes");

        const auto record = fx.registry.resolve(receipt.download_id);
        assert(manifest->entries[1].download_url ==
               "/download-file/" + receipt.download_id + "/" + record->files[1].stored_name);

        const auto file = fx.service.handle_file_download(receipt.download_id, record->files[1].stored_name);
        assert(file.display_name == "two.txt");
        assert(read_file(file.path) == "22");

        const auto single = fx.service.handle_upload(UploadForm{.files = {spool(fx.store, "solo.bin", "solo")}});
        const auto single_result = fx.service.handle_download(single.download_id);
        const auto *descriptor = std::get_if<FileDescriptor>(&single_result);
        assert(descriptor);
        assert(descriptor->display_name == "solo.bin");
        assert(descriptor->size_bytes == 4);
        assert(read_file(descriptor->path) == "solo");
    }

    void test_upload_rejects_empty_batch()
    {
        Fixture fx("service_empty");
        bool caught = false;
        try
        {
            (void)fx.service.handle_upload(UploadForm{});
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::InvalidInput);
            assert(std::string(ex.what()) == "Please select files to upload");
        }
        assert(caught);
        assert(fx.registry.size() == 0);
    }

    void test_upload_rolls_back_on_storage_failure()
    {
        Fixture fx("service_rollback");
        UploadForm form{.files = {spool(fx.store, "ok.txt", "ok"),
                                  UploadPart{.original_name = "lost.txt",
                                             .temp_path = fx.store.incoming_dir() / "missing.part",
                                             .size_bytes = 3},
                                  spool(fx.store, "later.txt", "later")}};
        bool caught = false;
        try
        {
            (void)fx.service.handle_upload(std::move(form));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::StorageFailure);
        }
        assert(caught);
        assert(fx.registry.size() == 0);
        assert(std::filesystem::is_empty(fx.store.files_dir()));
        assert(std::filesystem::is_empty(fx.store.incoming_dir()));
    }

    void test_file_download_url_encoding()
    {
        assert(TransferService::file_download_url("abc_-1", "1700000000000-42.txt") ==
               "/download-file/abc_-1/1700000000000-42.txt");
        assert(TransferService::file_download_url("a/b", "x y") == "/download-file/a%2Fb/x%20y");
    }

    void test_handler_routes()
    {
        Fixture fx("handler_routes");

        const auto &home = as_response(fx.get("/"));
        assert(home.status == 200);
        assert(contains(home.body, "enctype=\"multipart/form-data\""));
        assert(contains(home.body, "file parts under any other field name are ignored"));

        const auto health_reply = fx.get("/api/test");
        const auto &health = as_response(health_reply);
        assert(health.status == 200);
        assert(health.content_type == "application/json");
        const auto json = nlohmann::json::parse(health.body);
        assert(json.at("success") == true);
        assert(json.at("message") == "Server is working perfectly!");
        const auto timestamp = json.at("timestamp").get<std::string>();
        assert(timestamp.size() == 24 && timestamp.back() == 'Z' && timestamp[10] == 'T');

        assert(as_response(fx.get("/nowhere")).status == 404);
        assert(as_response(fx.get("/api/upload")).status == 405);

        const auto post_download = fx.handler.handle(http::parse_request_head("POST /download/abc HTTP/1.1\r\n\r\n"));
        const auto &not_allowed = as_response(post_download);
        assert(not_allowed.status == 405);
        assert(not_allowed.headers.size() == 1 && not_allowed.headers.front().second == "GET");

        assert(RequestHandler::is_upload(http::parse_request_head("POST /api/upload HTTP/1.1\r\n\r\n")));
        assert(!RequestHandler::is_upload(http::parse_request_head("GET /api/upload HTTP/1.1\r\n\r\n")));

        const auto &missing = as_response(fx.get("/download/unknown-id"));
        assert(missing.status == 404);
        assert(contains(missing.body, "File Not Found"));
        assert(contains(missing.body, "The download link is invalid or has expired."));

        const auto &missing_file = as_response(fx.get("/download-file/unknown-id/1-2.txt"));
        assert(missing_file.status == 404);
        assert(missing_file.body == "File not found");
    }

    void test_handler_downloads()
    {
        Fixture fx("handler_downloads");

        const auto &upload = fx.handler.handle_upload(UploadForm{
            .files = {spool(fx.store, "<b>bold</b>.txt", "x"), spool(fx.store, "Tom & Jerry's.txt", "yy")},
        });
        assert(upload.status == 200);
        const auto body = nlohmann::json::parse(upload.body);
        assert(body.at("success") == true);
        assert(body.at("fileCount") == 2);
        assert(body.at("message") == "Files uploaded successfully!");
        const auto id = body.at("downloadId").get<std::string>();

        const auto &page = as_response(fx.get("/download/" + id));
        assert(page.status == 200);
        assert(contains(page.content_type, "text/html"));
        assert(contains(page.body, "&lt;b&gt;bold&lt;/b&gt;.txt"));
        assert(contains(page.body, "Tom &amp; Jerry&#39;s.txt"));
        assert(!contains(page.body, "<b>bold"));
        assert(contains(page.body, "2 Bytes"));

        const auto record = fx.registry.resolve(id);
        const auto file_reply = fx.get("/download-file/" + id + "/" + record->files[1].stored_name);
        const auto *file = std::get_if<FileDescriptor>(&file_reply);
        assert(file);
        assert(file->display_name == "Tom & Jerry's.txt");

        const auto &empty = fx.handler.handle_upload(UploadForm{});
        assert(empty.status == 400);
        const auto error = nlohmann::json::parse(empty.body);
        assert(error.at("success") == false);
        assert(error.at("error") == "Please select files to upload");
        assert(!error.contains("downloadId"));

        const auto &length_required = fx.handler.upload_error(411, "Content-Length required");
        assert(length_required.status == 411);
        assert(nlohmann::json::parse(length_required.body).at("success") == false);
    }

    void test_handler_expired_links()
    {
        Fixture fx("handler_expired");
        const auto receipt = fx.service.handle_upload(UploadForm{.files = {spool(fx.store, "old.txt", "old")}});
        const auto batch = fx.service.handle_upload(
            UploadForm{.files = {spool(fx.store, "a.txt", "a"), spool(fx.store, "b.txt", "b")}});
        const auto stored = fx.registry.resolve(batch.download_id)->files.front().stored_name;

        *fx.now += kDefaultRetention + std::chrono::seconds{1};

        const auto &gone = as_response(fx.get("/download/" + receipt.download_id));
        assert(gone.status == 410);
        assert(contains(gone.body, "Download Link Expired"));
        assert(contains(gone.body, "This download link has expired (7 days limit)."));
        assert(as_response(fx.get("/download/" + receipt.download_id)).status == 404);

        assert(as_response(fx.get("/download-file/" + batch.download_id + "/" + stored)).status == 410);
        assert(as_response(fx.get("/download-file/" + batch.download_id + "/" + stored)).status == 404);
        assert(std::filesystem::is_empty(fx.store.files_dir()));
    }

    std::string multipart_body(const std::string &boundary)
    {
        const std::string dash = "--" + boundary;
        return dash + "\r\n"
                      "Content-Disposition: form-data; name=\"files\"; filename=\"a.txt\"\r\n"
                      "Content-Type: text/plain\r\n"
                      "\r\n"
                      "alpha\r\n" +
               dash + "\r\n"
                      "Content-Disposition: form-data; name=\"files\"; filename=\"C:\\\\fakepath\\\\b.bin\"\r\n"
                      "Content-Type: application/octet-stream\r\n"
                      "\r\n"
                      "b\r\nb\r\n" +
               dash + "\r\n"
                      "Content-Disposition: form-data; name=\"files\"; filename=\"\"\r\n"
                      "Content-Type: application/octet-stream\r\n"
                      "\r\n"
                      "\r\n" +
               dash + "\r\n"
                      "Content-Disposition: form-data; name=\"avatar\"; filename=\"x.png\"\r\n"
                      "\r\n"
                      "ignored\r\n" +
               dash + "\r\n"
                      "Content-Disposition: form-data; name=\"email\"\r\n"
                      "\r\n"
                      "bob@example.com\r\n" +
               dash + "\r\n"
                      "Content-Disposition: form-data; name=\"message\"\r\n"
                      "\r\n"
                      "\r\n" +
               dash + "--\r\n";
    }

    void test_upload_receiver()
    {
        Fixture fx("upload_receiver");
        const std::string boundary = "----FormBoundaryQ3";
        const auto body = multipart_body(boundary);

        UploadForm form;
        {
            UploadReceiver receiver(fx.store, boundary);
            for (std::size_t pos = 0; pos < body.size(); pos += 3)
            {
                receiver.feed(std::string_view(body).substr(pos, 3));
            }
            form = receiver.finish();
        }

        assert(form.files.size() == 2);
        assert(form.files[0].original_name == "a.txt");
        assert(form.files[0].size_bytes == 5);
        assert(read_file(form.files[0].temp_path) == "alpha");
        assert(form.files[1].original_name == "b.bin");
        assert(read_file(form.files[1].temp_path) == "b\r\nb");
        assert(form.email == std::optional<std::string>("bob@example.com"));
        assert(!form.message);
        assert(count_entries(fx.store.incoming_dir()) == 2);

        const auto receipt = fx.service.handle_upload(std::move(form));
        assert(receipt.file_count == 2);
        assert(std::filesystem::is_empty(fx.store.incoming_dir()));
    }

    void test_upload_receiver_cleans_up_aborted_uploads()
    {
        Fixture fx("upload_receiver_abort");
        const std::string boundary = "abortboundary";
        const auto body = multipart_body(boundary);

        {
            UploadReceiver receiver(fx.store, boundary);
            // Stop midway through the second file.
            receiver.feed(std::string_view(body).substr(0, body.find("b\r\nb") + 2));
            assert(count_entries(fx.store.incoming_dir()) == 2);

            bool caught = false;
            try
            {
                (void)receiver.finish();
            }
            catch (const http::MultipartError &)
            {
                caught = true;
            }
            assert(caught);
        }
        assert(std::filesystem::is_empty(fx.store.incoming_dir()));

        {
            UploadReceiver receiver(fx.store, boundary);
            receiver.feed(body);
        }
        assert(std::filesystem::is_empty(fx.store.incoming_dir()));
    }

    void test_upload_receiver_limits_text_fields()
    {
        Fixture fx("upload_receiver_limits");
        const std::string boundary = "limit";
        const std::string body = "--limit\r\n"
                                 "Content-Disposition: form-data; name=\"message\"\r\n"
                                 "\r\n" +
                                 std::string(UploadReceiver::kMaxFieldBytes + 1, 'm') + "\r\n--limit--\r\n";

        UploadReceiver receiver(fx.store, boundary);
        bool caught = false;
        try
        {
            receiver.feed(body);
        }
        catch (const http::MultipartError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_pages_escape()
    {
        assert(pages::html_escape("<a href=\"x\">Tom & 'Jerry'</a>") ==
               "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
        assert(contains(pages::expired(std::chrono::hours{24}), "(1 day limit)"));
        assert(contains(pages::expired(std::chrono::hours{36}), "(36 hours limit)"));
    }

} // namespace

void run_server_transfer_tests()
{
    test_format_size();
    test_upload_then_download();
    test_upload_rejects_empty_batch();
    test_upload_rolls_back_on_storage_failure();
    test_file_download_url_encoding();
    test_handler_routes();
    test_handler_downloads();
    test_handler_expired_links();
    test_upload_receiver();
    test_upload_receiver_cleans_up_aborted_uploads();
    test_upload_receiver_limits_text_fields();
    test_pages_escape();
}
