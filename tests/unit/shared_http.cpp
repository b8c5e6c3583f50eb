#include <cassert>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharelink/crypto.hpp"
#include "sharelink/encoding/base64url.hpp"
#include "sharelink/error_codes.hpp"
#include "sharelink/http.hpp"
#include "sharelink/multipart.hpp"
#include "sharelink/protocol.hpp"

using namespace sharelink;

void run_server_component_tests();
void run_server_transfer_tests();
void run_server_session_tests();

namespace
{

    struct CollectedPart
    {
        http::PartHeaders headers;
        std::string data;
        bool closed{};
    };

    std::vector<CollectedPart> collect_parts(const std::string &body, const std::string &boundary,
                                             std::size_t slice, bool *done = nullptr)
    {
        std::vector<CollectedPart> parts;
        http::MultipartReader reader(boundary, http::MultipartReader::Handler{
                                                   .on_part_begin = [&](const http::PartHeaders &headers)
                                                   { parts.push_back(CollectedPart{headers, {}, false}); },
                                                   .on_part_data = [&](std::string_view data)
                                                   { parts.back().data.append(data); },
                                                   .on_part_end = [&]
                                                   { parts.back().closed = true; },
                                               });
        for (std::size_t pos = 0; pos < body.size(); pos += slice)
        {
            reader.feed(std::string_view(body).substr(pos, slice));
        }
        if (done)
        {
            *done = reader.done();
        }
        return parts;
    }

    void test_parse_request_head()
    {
        const auto request = http::parse_request_head("GET /download-file/abc/a%20b.txt?x=1 HTTP/1.1\r\n"
                                                      "Host: localhost:3000\r\n"
                                                      "Content-Type: text/plain\r\n"
                                                      "\r\n");
        assert(request.method == "GET");
        assert(request.version == "HTTP/1.1");
        assert(request.query == "x=1");
        assert(request.segments.size() == 3);
        assert(request.segments[0] == "download-file");
        assert(request.segments[1] == "abc");
        assert(request.segments[2] == "a b.txt");
        assert(request.header("host") == std::optional<std::string>("localhost:3000"));
        assert(request.header("CONTENT-TYPE") == std::optional<std::string>("text/plain"));
        assert(!request.header("content-length"));

        const auto root = http::parse_request_head("GET / HTTP/1.0\r\n\r\n");
        assert(root.segments.empty());
    }

    void test_parse_request_head_rejects_garbage()
    {
        const auto expect_status = [](const std::string &head, int status)
        {
            try
            {
                (void)http::parse_request_head(head);
            }
            catch (const http::HttpError &ex)
            {
                assert(ex.status() == status);
                return;
            }
            assert(false && "request head should have been rejected");
        };
        expect_status("\r\n\r\n", 400);
        expect_status("GET /\r\n\r\n", 400);
        expect_status("GET / HTTP/2\r\n\r\n", 505);
        expect_status("GET download HTTP/1.1\r\n\r\n", 400);
        expect_status("GET / HTTP/1.1\r\nno colon here\r\n\r\n", 400);
    }

    void test_content_type_helpers()
    {
        const std::string value = "Multipart/Form-Data; charset=utf-8; boundary=\"----WebKitFormBoundary7MA4\"";
        assert(http::media_type(value) == "multipart/form-data");
        assert(http::extract_boundary(value) == "----WebKitFormBoundary7MA4");
        assert(http::extract_boundary("multipart/form-data").empty());
    }

    void test_percent_coding()
    {
        assert(http::percent_encode("a b/\xC3\xBC.txt") == "a%20b%2F%C3%BC.txt");
        assert(http::percent_decode("a%20b%2F%C3%BC.txt") == "a b/\xC3\xBC.txt");
        assert(http::percent_decode("100%") == "100%");
        assert(http::percent_decode("%zz") == "%zz");
    }

    void test_content_disposition()
    {
        const auto value = http::content_disposition_attachment("r\xC3\xA9sum\xC3\xA9 \"final\".pdf");
        assert(value == "attachment; filename=\"r__sum__ _final_.pdf\"; "
                        "filename*=UTF-8''r%C3%A9sum%C3%A9%20%22final%22.pdf");
        assert(http::content_disposition_attachment("").rfind("attachment; filename=\"download\"", 0) == 0);
    }

    void test_serialize_response()
    {
        auto response = http::Response::text(404, "Nope!");
        response.headers.emplace_back("Allow", "GET");
        const auto text = http::serialize(response);
        assert(text.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
        assert(text.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
        assert(text.find("Allow: GET\r\n") != std::string::npos);
        assert(text.find("Content-Length: 5\r\n") != std::string::npos);
        assert(text.find("Connection: close\r\n\r\nNope!") != std::string::npos);
        assert(http::status_text(410) == "Gone");
    }

    std::string sample_multipart_body()
    {
        std::string binary("\x00\x01\r\n--bound\r\n-", 14);
        return "preamble is ignored\r\n"
               "--XyZboundary\r\n"
               "Content-Disposition: form-data; name=\"email\"\r\n"
               "\r\n"
               "alice@example.com\r\n"
               "--XyZboundary\r\n"
               "Content-Disposition: form-data; name=\"files\"; filename=\"data.bin\"\r\n"
               "Content-Type: application/octet-stream\r\n"
               "\r\n" +
               binary +
               "\r\n"
               "--XyZboundary\r\n"
               "Content-Disposition: form-data; name=\"files\"; filename=\"\"\r\n"
               "\r\n"
               "\r\n"
               "--XyZboundary--\r\n"
               "epilogue";
    }

    void test_multipart_reader_slices()
    {
        const auto body = sample_multipart_body();
        for (const std::size_t slice : {std::size_t{1}, std::size_t{7}, body.size()})
        {
            bool done = false;
            const auto parts = collect_parts(body, "XyZboundary", slice, &done);
            assert(done);
            assert(parts.size() == 3);

            assert(parts[0].headers.name == "email");
            assert(!parts[0].headers.filename);
            assert(parts[0].data == "alice@example.com");

            assert(parts[1].headers.name == "files");
            assert(parts[1].headers.filename == std::optional<std::string>("data.bin"));
            assert(parts[1].headers.content_type == "application/octet-stream");
            assert(parts[1].data == std::string("\x00\x01\r\n--bound\r\n-", 14));

            assert(parts[2].headers.filename == std::optional<std::string>(""));
            assert(parts[2].data.empty());

            for (const auto &part : parts)
            {
                assert(part.closed);
            }
        }
    }

    void test_multipart_reader_truncated_and_malformed()
    {
        const auto body = sample_multipart_body();
        bool done = true;
        const auto parts = collect_parts(body.substr(0, body.size() / 2), "XyZboundary", 5, &done);
        assert(!done);
        assert(!parts.empty());

        bool threw = false;
        try
        {
            collect_parts("--XyZboundaryjunk\r\n\r\n", "XyZboundary", 4);
        }
        catch (const http::MultipartError &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            http::MultipartReader reader("", {});
        }
        catch (const http::MultipartError &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_header_parameters_quoted_strings()
    {
        const auto params =
            http::header_parameters("form-data; name=\"files\"; filename=\"a;b \\\"c\\\".txt\" ; flag; size=10");
        assert(params.size() == 3);
        assert(params[0] == std::make_pair(std::string("name"), std::string("files")));
        assert(params[1] == std::make_pair(std::string("filename"), std::string("a;b \"c\".txt")));
        assert(params[2] == std::make_pair(std::string("size"), std::string("10")));
        assert(http::header_parameters("form-data").empty());
    }

    void test_multipart_reader_quoted_semicolon_in_filename()
    {
        const std::string body = "--XyZ\r\n"
                                 "Content-Disposition: form-data; name=\"files\"; filename=\"report;v2.pdf\"\r\n"
                                 "\r\n"
                                 "abc\r\n"
                                 "--XyZ--\r\n";
        for (const std::size_t slice : {std::size_t{1}, body.size()})
        {
            bool done = false;
            const auto parts = collect_parts(body, "XyZ", slice, &done);
            assert(done);
            assert(parts.size() == 1);
            assert(parts[0].headers.name == "files");
            assert(parts[0].headers.filename == std::optional<std::string>("report;v2.pdf"));
            assert(parts[0].data == "abc");
        }
    }

    void test_upload_response_json()
    {
        protocol::UploadResponse ok{};
        ok.success = true;
        ok.download_id = "abc123";
        ok.message = "Files uploaded successfully!";
        ok.file_count = 3;
        const auto json = nlohmann::json(ok);
        assert(json.at("success") == true);
        assert(json.at("downloadId") == "abc123");
        assert(json.at("fileCount") == 3);
        assert(!json.contains("error"));

        const auto decoded = nlohmann::json::parse(R"({"success":false,"error":"Please select files to upload"})")
                                 .get<protocol::UploadResponse>();
        assert(!decoded.success);
        assert(!decoded.download_id);
        assert(decoded.error == std::optional<std::string>("Please select files to upload"));

        protocol::HealthResponse health{.success = true, .message = "up", .timestamp = "2024-01-01T00:00:00.000Z"};
        const auto health_back = nlohmann::json(health).get<protocol::HealthResponse>();
        assert(health_back.success);
        assert(health_back.timestamp == health.timestamp);
    }

    void test_base64url()
    {
        const std::vector<std::byte> bytes{std::byte{0xfb}, std::byte{0xff}};
        assert(encoding::encode_base64url(bytes) == "-_8");
        assert(encoding::encode_base64url({}).empty());
        const std::vector<std::byte> word{std::byte{'M'}, std::byte{'a'}, std::byte{'n'}};
        assert(encoding::encode_base64url(word) == "TWFu");
    }

    void test_error_codes()
    {
        assert(http_status(ErrorCode::InvalidInput) == 400);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::Expired) == 410);
        assert(http_status(ErrorCode::StorageFailure) == 500);
        assert(to_string(ErrorCode::Expired) == "expired");
    }

    void test_crypto_random()
    {
        assert(crypto::random_bytes(32).size() == 32);
        assert(crypto::random_bytes(0).empty());
        for (int i = 0; i < 100; ++i)
        {
            assert(crypto::random_uniform(10) < 10);
        }
        assert(crypto::random_uniform(1) == 0);
    }

} // namespace

int main()
{
    try
    {
        test_parse_request_head();
        test_parse_request_head_rejects_garbage();
        test_content_type_helpers();
        test_percent_coding();
        test_content_disposition();
        test_serialize_response();
        test_multipart_reader_slices();
        test_multipart_reader_truncated_and_malformed();
        test_header_parameters_quoted_strings();
        test_multipart_reader_quoted_semicolon_in_filename();
        test_upload_response_json();
        test_base64url();
        test_error_codes();
        test_crypto_random();
        run_server_component_tests();
        run_server_transfer_tests();
        run_server_session_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
