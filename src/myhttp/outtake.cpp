#include <array>
#include <format>
#include <string>
#include <utility>

#include "mycore/text.hpp"
#include "mynet/io_funcs.hpp"
#include "myhttp/headers.hpp"
#include "myhttp/outtake.hpp"

namespace ShelfHttpd::Http {
    struct MimeEntry {
        std::string_view extension;
        std::string_view mime;
    };

    constexpr std::array<MimeEntry, 10> mime_table {{
        {"html", html_mime},
        {"css", "text/css"},
        {"js", "application/javascript"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"pdf", "application/pdf"},
        {"json", "application/json"},
        {"txt", "text/plain"},
    }};

    constexpr std::string_view fallback_mime = "application/octet-stream";
    constexpr std::string_view text_reply_name = "response.html";

    auto content_type_for(std::string_view file_name) noexcept -> std::string_view {
        const auto dot_pos = file_name.rfind('.');

        if (dot_pos == std::string_view::npos || dot_pos == 0) {
            return fallback_mime;
        }

        const auto extension = file_name.substr(dot_pos + 1);

        for (const auto& [entry_ext, entry_mime] : mime_table) {
            if (entry_ext == extension) {
                return entry_mime;
            }
        }

        return fallback_mime;
    }

    auto resolve_response_body(const ResponseBody& body) -> Core::Result<std::optional<Core::BufferedFile>> {
        if (const auto file_body_p = std::get_if<FileBody>(&body); file_body_p) {
            auto file = Core::read_buffered_file(file_body_p->path);

            if (!file) {
                return std::unexpected {std::move(file.error())};
            }

            return {std::move(file.value())};
        } else if (const auto text_body_p = std::get_if<TextBody>(&body); text_body_p) {
            return {Core::BufferedFile {
                .name = std::string {text_reply_name},
                .content = Blob {text_body_p->text.begin(), text_body_p->text.end()},
            }};
        }

        return {std::nullopt};
    }


    void HttpOuttake::append_bytes(std::string_view sv) {
        m_reply_bytes.insert(m_reply_bytes.end(), sv.begin(), sv.end());
    }

    void HttpOuttake::write_status_line(const Response& res) {
        append_bytes(res.version);
        append_bytes(" ");
        append_bytes(status_enum_to_code(res.http_status));
        append_bytes(" ");
        append_bytes(status_enum_to_name(res.http_status));
        append_bytes("\r\n");
    }

    void HttpOuttake::write_headers(const HeaderMap& headers) {
        for (const auto& [header_key, header_value] : headers) {
            append_bytes(header_key);
            append_bytes(": ");
            append_bytes(header_value);
            append_bytes("\r\n");
        }

        append_bytes("\r\n");
    }

    HttpOuttake::HttpOuttake() noexcept
    : m_reply_bytes {} {}

    auto HttpOuttake::serialize(const Response& res) -> Core::Result<Blob> {
        m_reply_bytes.clear();

        // 1. Resolve the body description first: a missing file must fail before any byte is produced.
        auto body_file = resolve_response_body(res.body);

        if (!body_file) {
            return std::unexpected {std::move(body_file.error())};
        }

        // 2. Merge computed headers over the caller's headers.
        HeaderMap merged_headers = res.headers;

        if (const auto& file_opt = body_file.value(); file_opt) {
            const auto file_mime = content_type_for(file_opt->name);

            merged_headers.insert_or_assign(std::string {HeaderNames::content_length}, std::to_string(file_opt->content.size()));
            merged_headers.insert_or_assign(std::string {HeaderNames::content_type}, std::string {file_mime});

            if (!file_mime.starts_with("text/html")) {
                merged_headers.insert_or_assign(std::string {HeaderNames::content_disposition}, std::format("inline; filename=\"{}\"", file_opt->name));
            }
        } else {
            merged_headers.insert_or_assign(std::string {HeaderNames::content_length}, "0");
        }

        // 3. Emit status line, headers, blank line, and the payload.
        write_status_line(res);
        write_headers(merged_headers);

        if (const auto& file_opt = body_file.value(); file_opt) {
            m_reply_bytes.insert(m_reply_bytes.end(), file_opt->content.begin(), file_opt->content.end());
        }

        return {std::exchange(m_reply_bytes, {})};
    }

    auto HttpOuttake::operator()(int fd, const Blob& reply_bytes) -> Core::Result<std::size_t> {
        if (auto io_res = Net::socket_write_n(fd, reply_bytes.data(), reply_bytes.size()); !io_res) {
            return Core::make_error(Core::ErrorKind::io, std::format("Error writing response to stream: {}", io_res.error()));
        } else {
            return {io_res.value()};
        }
    }
}
