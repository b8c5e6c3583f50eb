#include "sharelink/server/pages.hpp"

#include <spdlog/fmt/fmt.h>

namespace sharelink::server::pages
{

    namespace
    {

        constexpr std::string_view kMessageBody =
            R"(<body style="font-family: Arial; text-align: center; padding: 50px;">)";

        std::string message_page(std::string_view title, std::string_view heading, std::string_view text)
        {
            return fmt::format("<!DOCTYPE html>\n<html>\n<head><title>{}</title></head>\n{}\n"
                               "<h2>{}</h2>\n<p>{}</p>\n<a href=\"/\">Go Back to Home</a>\n</body>\n</html>\n",
                               title, kMessageBody, heading, text);
        }

        std::string describe_retention(std::chrono::seconds retention)
        {
            const auto hours = std::chrono::duration_cast<std::chrono::hours>(retention).count();
            if (hours > 0 && hours % 24 == 0)
            {
                const auto days = hours / 24;
                return fmt::format("{} day{}", days, days == 1 ? "" : "s");
            }
            if (hours > 0)
            {
                return fmt::format("{} hour{}", hours, hours == 1 ? "" : "s");
            }
            return fmt::format("{} seconds", retention.count());
        }

    } // namespace

    std::string html_escape(std::string_view text)
    {
        std::string escaped;
        escaped.reserve(text.size());
        for (const char ch : text)
        {
            switch (ch)
            {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&#39;";
                break;
            default:
                escaped.push_back(ch);
            }
        }
        return escaped;
    }

    std::string home()
    {
        return R"(<!DOCTYPE html>
<html>
<head>
    <title>ShareLink</title>
    <style>
        body { font-family: Arial; padding: 40px; background: #f5f5f5; }
        .container { max-width: 600px; margin: 0 auto; background: white; padding: 30px; border-radius: 10px; box-shadow: 0 2px 10px rgba(0,0,0,0.1); }
        label { display: block; margin-top: 15px; }
        input, textarea { width: 100%; box-sizing: border-box; }
        .hint { color: #666; font-size: 0.85em; margin: 4px 0 0; }
    </style>
</head>
<body>
    <div class="container">
        <h2>Share Files</h2>
        <form id="upload" method="post" action="/api/upload" enctype="multipart/form-data">
            <label>Files <input type="file" name="files" multiple required></label>
            <p class="hint">API clients: send file parts in the <code>files</code> field; file parts under any other field name are ignored.</p>
            <label>Email (optional) <input type="email" name="email"></label>
            <label>Message (optional) <textarea name="message" rows="3"></textarea></label>
            <p><button type="submit">Upload</button></p>
        </form>
        <p id="result"></p>
    </div>
    <script>
        document.getElementById('upload').addEventListener('submit', async (event) => {
            event.preventDefault();
            const result = document.getElementById('result');
            result.textContent = 'Uploading...';
            const response = await fetch('/api/upload', { method: 'POST', body: new FormData(event.target) });
            const body = await response.json();
            if (body.success) {
                const link = location.origin + '/download/' + body.downloadId;
                result.innerHTML = '';
                const anchor = document.createElement('a');
                anchor.href = link;
                anchor.textContent = link;
                result.append(body.fileCount + ' file(s) ready: ', anchor);
            } else {
                result.textContent = body.error;
            }
        });
    </script>
</body>
</html>
)";
    }

    std::string manifest(const Manifest &manifest)
    {
        std::string items;
        for (const auto &entry : manifest.entries)
        {
            items += fmt::format("            <div class=\"file-item\">\n"
                                 "                <a href=\"{}\">{}</a>\n"
                                 "                <span style=\"color: #666; float: right;\">{}</span>\n"
                                 "            </div>\n",
                                 html_escape(entry.download_url), html_escape(entry.display_name),
                                 html_escape(entry.size_text));
        }

        return fmt::format(R"(<!DOCTYPE html>
<html>
<head>
    <title>Download Files</title>
    <style>
        body {{ font-family: Arial; padding: 40px; background: #f5f5f5; }}
        .container {{ max-width: 600px; margin: 0 auto; background: white; padding: 30px; border-radius: 10px; box-shadow: 0 2px 10px rgba(0,0,0,0.1); }}
        .file-item {{ padding: 15px; border: 1px solid #ddd; margin: 10px 0; border-radius: 5px; }}
        .file-item a {{ text-decoration: none; color: #007bff; font-weight: bold; }}
        .file-item:hover {{ background: #f8f9fa; }}
    </style>
</head>
<body>
    <div class="container">
        <h2>Download Your Files</h2>
        <p>Click on the files below to download:</p>
{}        <br>
        <a href="/">&larr; Share More Files</a>
    </div>
</body>
</html>
)",
                           items);
    }

    std::string not_found()
    {
        return message_page("File Not Found", "File Not Found", "The download link is invalid or has expired.");
    }

    std::string expired(std::chrono::seconds retention)
    {
        return message_page("Link Expired", "Download Link Expired",
                            "This download link has expired (" + describe_retention(retention) + " limit).");
    }

} // namespace sharelink::server::pages
