#include <array>
#include <format>

#include "myapp/contents.hpp"
#include "myapp/error_pages.hpp"

namespace ShelfHttpd::App {
    constexpr std::array<ErrorPageInfo, static_cast<std::size_t>(Core::ErrorKind::last)> error_page_table {{
        {TemplateNames::server_error, Http::Status::http_server_error, Core::LogLevel::error}, // io
        {TemplateNames::bad_request, Http::Status::http_not_found, Core::LogLevel::warning}, // invalid
        {TemplateNames::page_not_found, Http::Status::http_not_found, Core::LogLevel::warning}, // not_found
        {TemplateNames::access_denied, Http::Status::http_forbidden, Core::LogLevel::warning}, // not_permitted
        {TemplateNames::server_error, Http::Status::http_server_error, Core::LogLevel::error}, // unknown
    }};

    constexpr std::string_view builtin_error_page =
        "<!DOCTYPE html>\n<html><head><title>{0} {1}</title></head><body><h1>{0} {1}</h1></body></html>\n";

    auto error_page_info(Core::ErrorKind kind) noexcept -> ErrorPageInfo {
        return error_page_table[static_cast<std::size_t>(kind)];
    }


    ErrorPages::ErrorPages(const AppState& state) noexcept
    : m_state {state} {}

    auto ErrorPages::map_error(const Core::AppError& error) const -> Http::Response {
        const auto [template_name, status, severity] = error_page_info(error.kind);

        Core::log_message(severity, "{}: {}", Core::error_kind_to_name(error.kind), error.message);

        return Http::ResponseBuilder {}
            .status(status)
            .body(Http::FileBody {m_state.templates.path_of(template_name)})
            .build();
    }

    auto ErrorPages::fallback_for(Http::Status status, const Core::AppError& page_error) const -> Http::Response {
        Core::log_error("Error page unavailable, using built-in page: {}", page_error.message);

        return Http::ResponseBuilder {}
            .status(status)
            .body(Http::TextBody {std::format(builtin_error_page, Http::status_enum_to_code(status), Http::status_enum_to_name(status))})
            .build();
    }
}
