#ifndef SHELF_HTTPD_MYAPP_MSG_TASK_HPP
#define SHELF_HTTPD_MYAPP_MSG_TASK_HPP

#include "mycore/errors.hpp"
#include "myhttp/intake.hpp"
#include "myhttp/outtake.hpp"
#include "myapp/error_pages.hpp"
#include "myapp/routes.hpp"
#include "myapp/state.hpp"

namespace ShelfHttpd::App {
    constexpr std::string_view server_name = "shelfhttpd/0.1.0";

    /**
     * @brief Runs one whole request / response exchange on a connected socket: parse, route, serialize, write.
     * @note Any parse, routing, or serialization failure still yields a well-formed error reply. Only a failed socket write is reported back to the caller.
     */
    class MsgExchangeTask {
    private:
        Http::HttpIntake m_http_in;
        Http::HttpOuttake m_http_out;
        ErrorPages m_error_pages;
        const Routes& m_routes;

        /// NOTE: Decorates every reply with the connection-level headers, e.g Server, Connection, and Date.
        static void decorate(Http::Response& res);

        [[nodiscard]] auto reply_for_error(const Core::AppError& error) -> Http::Blob;

        [[nodiscard]] auto build_reply(int fd) -> Http::Blob;

    public:
        MsgExchangeTask(const Routes& routes, const AppState& state);

        [[nodiscard]] auto operator()(int fd) -> Core::Result<void>;
    };
}

#endif
