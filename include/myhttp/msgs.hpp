#ifndef SHELF_HTTPD_MYHTTP_MSGS_HPP
#define SHELF_HTTPD_MYHTTP_MSGS_HPP

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "mycore/buffered_file.hpp"
#include "myhttp/enums.hpp"

namespace ShelfHttpd::Http {
    using Blob = Core::Blob;

    using HeaderMap = std::map<std::string, std::string>;

    struct EmptyBody {};

    /// NOTE: `Core::BufferedFile` is the decoded `multipart/form-data` upload.
    using RequestBody = std::variant<EmptyBody, Core::BufferedFile>;

    struct Request {
        RequestBody body;
        HeaderMap headers;
        std::string path;
        std::string version;
        Verb http_verb;

        [[nodiscard]] auto header(std::string_view canonical_name) const -> const std::string*;
    };

    /// Refers to a file on disk that gets loaded only during serialization.
    struct FileBody {
        std::filesystem::path path;
    };

    /// Inline text that gets served as `response.html`.
    struct TextBody {
        std::string text;
    };

    /// NOTE: A response only describes how to obtain its payload, see `HttpOuttake::serialize`.
    using ResponseBody = std::variant<EmptyBody, FileBody, TextBody>;

    struct Response {
        ResponseBody body;
        HeaderMap headers;
        std::string version;
        Status http_status;
    };

    class ResponseBuilder {
    private:
        ResponseBody m_body;
        HeaderMap m_headers;
        Status m_status;

    public:
        ResponseBuilder() noexcept;

        [[maybe_unused]] auto status(Status s) noexcept -> ResponseBuilder&;

        [[maybe_unused]] auto header(std::string_view name, std::string_view value) -> ResponseBuilder&;

        [[maybe_unused]] auto body(ResponseBody b) -> ResponseBuilder&;

        [[nodiscard]] auto build() -> Response;
    };
}

#endif
