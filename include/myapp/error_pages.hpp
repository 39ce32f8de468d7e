#ifndef SHELF_HTTPD_MYAPP_ERROR_PAGES_HPP
#define SHELF_HTTPD_MYAPP_ERROR_PAGES_HPP

#include <string_view>

#include "mycore/errors.hpp"
#include "mycore/logging.hpp"
#include "myhttp/msgs.hpp"
#include "myapp/state.hpp"

namespace ShelfHttpd::App {
    struct ErrorPageInfo {
        std::string_view template_name;
        Http::Status status;
        Core::LogLevel severity;
    };

    /// NOTE: Total mapping from every error kind to its reply status, page template, and log severity.
    [[nodiscard]] auto error_page_info(Core::ErrorKind kind) noexcept -> ErrorPageInfo;

    /**
     * @brief The single place that logs request failures and turns them into error pages.
     * @note When the error template cannot be served either, `fallback_for` supplies a built-in page with the same status.
     */
    class ErrorPages {
    private:
        const AppState& m_state;

    public:
        explicit ErrorPages(const AppState& state) noexcept;

        /// NOTE: Logs `error` at its mapped severity and builds the templated error response.
        [[nodiscard]] auto map_error(const Core::AppError& error) const -> Http::Response;

        /// NOTE: Logs why the templated page failed and builds an inline page that needs no disk access.
        [[nodiscard]] auto fallback_for(Http::Status status, const Core::AppError& page_error) const -> Http::Response;
    };
}

#endif
