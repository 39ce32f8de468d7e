#include <utility>

#include "myhttp/msgs.hpp"

namespace ShelfHttpd::Http {
    auto Request::header(std::string_view canonical_name) const -> const std::string* {
        if (auto header_it = headers.find(std::string {canonical_name}); header_it != headers.end()) {
            return &header_it->second;
        }

        return nullptr;
    }


    ResponseBuilder::ResponseBuilder() noexcept
    : m_body {EmptyBody {}}, m_headers {}, m_status {Status::http_ok} {}

    auto ResponseBuilder::status(Status s) noexcept -> ResponseBuilder& {
        m_status = s;

        return *this;
    }

    auto ResponseBuilder::header(std::string_view name, std::string_view value) -> ResponseBuilder& {
        m_headers.insert_or_assign(std::string {name}, std::string {value});

        return *this;
    }

    auto ResponseBuilder::body(ResponseBody b) -> ResponseBuilder& {
        m_body = std::move(b);

        return *this;
    }

    auto ResponseBuilder::build() -> Response {
        return Response {
            .body = std::exchange(m_body, EmptyBody {}),
            .headers = std::exchange(m_headers, {}),
            .version = "HTTP/1.1",
            .http_status = std::exchange(m_status, Status::http_ok),
        };
    }
}
