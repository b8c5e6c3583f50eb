#include "sharelink/multipart.hpp"

#include <cctype>

#include "sharelink/http.hpp"

namespace sharelink::http
{

    namespace
    {
        constexpr std::size_t kMaxBoundaryLength = 70;
        constexpr std::size_t kMaxHeaderBlock = 16 * 1024;
        constexpr std::string_view kCrlf = "\r\n";
        constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

        std::string lower_trimmed(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            std::string result(value);
            for (char &c : result)
            {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return result;
        }

    } // namespace

    MultipartReader::MultipartReader(std::string boundary, Handler handler)
        : handler_(std::move(handler))
    {
        if (boundary.empty() || boundary.size() > kMaxBoundaryLength)
        {
            throw MultipartError("Invalid multipart boundary");
        }
        delimiter_ = "\r\n--" + boundary;
        // Lets the opening delimiter at the very start of the body match like any other.
        buffer_ = kCrlf;
    }

    void MultipartReader::feed(std::string_view chunk)
    {
        if (state_ == State::Epilogue)
        {
            return;
        }
        buffer_.append(chunk);
        while (step())
        {
        }
    }

    bool MultipartReader::step()
    {
        switch (state_)
        {
        case State::Preamble:
        {
            const auto pos = buffer_.find(delimiter_);
            if (pos == std::string::npos)
            {
                if (buffer_.size() >= delimiter_.size())
                {
                    buffer_.erase(0, buffer_.size() - (delimiter_.size() - 1));
                }
                return false;
            }
            buffer_.erase(0, pos + delimiter_.size());
            state_ = State::AfterDelimiter;
            return true;
        }
        case State::AfterDelimiter:
        {
            if (buffer_.size() < 2)
            {
                return false;
            }
            if (buffer_.compare(0, 2, "--") == 0)
            {
                state_ = State::Epilogue;
                buffer_.clear();
                return false;
            }
            if (buffer_.compare(0, 2, kCrlf) != 0)
            {
                throw MultipartError("Malformed multipart delimiter");
            }
            buffer_.erase(0, 2);
            state_ = State::Headers;
            return true;
        }
        case State::Headers:
        {
            if (buffer_.size() < 2)
            {
                return false;
            }
            if (buffer_.compare(0, 2, kCrlf) == 0)
            {
                buffer_.erase(0, 2);
                begin_part({});
                return true;
            }
            const auto end = buffer_.find(kHeaderTerminator);
            if (end == std::string::npos)
            {
                if (buffer_.size() > kMaxHeaderBlock)
                {
                    throw MultipartError("Multipart part headers too large");
                }
                return false;
            }
            const std::string block = buffer_.substr(0, end);
            buffer_.erase(0, end + kHeaderTerminator.size());
            begin_part(block);
            return true;
        }
        case State::Body:
        {
            const auto pos = buffer_.find(delimiter_);
            if (pos == std::string::npos)
            {
                // The tail may hold the start of a delimiter split across feeds.
                if (buffer_.size() >= delimiter_.size())
                {
                    const auto safe = buffer_.size() - (delimiter_.size() - 1);
                    if (handler_.on_part_data)
                    {
                        handler_.on_part_data(std::string_view(buffer_).substr(0, safe));
                    }
                    buffer_.erase(0, safe);
                }
                return false;
            }
            if (pos > 0 && handler_.on_part_data)
            {
                handler_.on_part_data(std::string_view(buffer_).substr(0, pos));
            }
            buffer_.erase(0, pos + delimiter_.size());
            state_ = State::AfterDelimiter;
            if (handler_.on_part_end)
            {
                handler_.on_part_end();
            }
            return true;
        }
        case State::Epilogue:
            buffer_.clear();
            return false;
        }
        return false;
    }

    void MultipartReader::begin_part(std::string_view header_block)
    {
        PartHeaders headers;
        std::size_t pos = 0;
        while (pos < header_block.size())
        {
            auto eol = header_block.find(kCrlf, pos);
            if (eol == std::string_view::npos)
            {
                eol = header_block.size();
            }
            const auto line = header_block.substr(pos, eol - pos);
            pos = eol + kCrlf.size();

            const auto colon = line.find(':');
            if (colon == std::string_view::npos)
            {
                throw MultipartError("Malformed multipart header");
            }
            const auto name = lower_trimmed(line.substr(0, colon));
            const auto value = line.substr(colon + 1);
            if (name == "content-disposition")
            {
                for (const auto &[key, param] : header_parameters(value))
                {
                    if (key == "name")
                    {
                        headers.name = param;
                    }
                    else if (key == "filename")
                    {
                        headers.filename = param;
                    }
                }
            }
            else if (name == "content-type")
            {
                headers.content_type = lower_trimmed(value);
            }
        }

        state_ = State::Body;
        if (handler_.on_part_begin)
        {
            handler_.on_part_begin(headers);
        }
    }

} // namespace sharelink::http
