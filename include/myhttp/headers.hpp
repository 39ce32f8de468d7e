#ifndef SHELF_HTTPD_MYHTTP_HEADERS_HPP
#define SHELF_HTTPD_MYHTTP_HEADERS_HPP

#include <string>
#include <string_view>

namespace ShelfHttpd::Http {
    namespace HeaderNames {
        constexpr std::string_view content_length = "Content-Length";
        constexpr std::string_view content_type = "Content-Type";
        constexpr std::string_view content_disposition = "Content-Disposition";
        constexpr std::string_view location = "Location";
        constexpr std::string_view connection = "Connection";
        constexpr std::string_view server = "Server";
        constexpr std::string_view date = "Date";
    }

    /// NOTE: Canonicalizes a header name to Header-Case: every `-`-delimited segment gets an uppercase first letter and a lowercase rest, e.g `cONTENT-length` -> `Content-Length`.
    [[nodiscard]] auto to_header_case(std::string_view name) -> std::string;
}

#endif
