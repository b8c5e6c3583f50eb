/**
 * ShareLink - Incremental multipart/form-data decoder.
 *
 * The reader is fed the request body in arbitrary slices and reports each
 * part through callbacks, so file content can be streamed to disk without
 * holding the whole body in memory.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sharelink::http
{

    class MultipartError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct PartHeaders
    {
        std::string name;
        // Present for file parts, possibly empty when the form's file input was left blank.
        std::optional<std::string> filename;
        std::string content_type;
    };

    class MultipartReader
    {
    public:
        struct Handler
        {
            std::function<void(const PartHeaders &)> on_part_begin;
            std::function<void(std::string_view)> on_part_data;
            std::function<void()> on_part_end;
        };

        MultipartReader(std::string boundary, Handler handler);

        void feed(std::string_view chunk);

        // True once the closing delimiter has been consumed.
        bool done() const noexcept { return state_ == State::Epilogue; }

    private:
        enum class State
        {
            Preamble,
            AfterDelimiter,
            Headers,
            Body,
            Epilogue
        };

        bool step();
        void begin_part(std::string_view header_block);

        std::string delimiter_;
        std::string buffer_;
        State state_{State::Preamble};
        Handler handler_;
    };

} // namespace sharelink::http
