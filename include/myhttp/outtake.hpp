#ifndef SHELF_HTTPD_MYHTTP_OUTTAKE_HPP
#define SHELF_HTTPD_MYHTTP_OUTTAKE_HPP

#include <optional>
#include <string_view>

#include "mycore/buffered_file.hpp"
#include "mycore/errors.hpp"
#include "myhttp/msgs.hpp"

namespace ShelfHttpd::Http {
    constexpr std::string_view html_mime = "text/html; charset=UTF-8";

    /// NOTE: Maps a file name's extension to its MIME type, falling back to `application/octet-stream`.
    [[nodiscard]] auto content_type_for(std::string_view file_name) noexcept -> std::string_view;

    /// NOTE: `File` bodies are loaded from disk, `Text` bodies become a `response.html` file, and `Empty` bodies give nothing.
    [[nodiscard]] auto resolve_response_body(const ResponseBody& body) -> Core::Result<std::optional<Core::BufferedFile>>;

    class HttpOuttake {
    private:
        Blob m_reply_bytes;

        void append_bytes(std::string_view sv);

        void write_status_line(const Response& res);

        void write_headers(const HeaderMap& headers);

    public:
        HttpOuttake() noexcept;

        /**
         * @brief Encodes a full response: status line, headers, blank line, then the body bytes.
         * @note Computed `Content-Length`, `Content-Type` and `Content-Disposition` values replace any caller-supplied ones.
         */
        [[nodiscard]] auto serialize(const Response& res) -> Core::Result<Blob>;

        [[nodiscard]] auto operator()(int fd, const Blob& reply_bytes) -> Core::Result<std::size_t>;
    };
}

#endif
