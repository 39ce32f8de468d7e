#include <exception>
#include <format>
#include <utility>

#include "mycore/clock.hpp"
#include "mycore/logging.hpp"
#include "myhttp/headers.hpp"
#include "myapp/msg_task.hpp"

namespace ShelfHttpd::App {
    void MsgExchangeTask::decorate(Http::Response& res) {
        res.headers.insert_or_assign(std::string {Http::HeaderNames::server}, std::string {server_name});
        res.headers.insert_or_assign(std::string {Http::HeaderNames::connection}, "close");
        res.headers.insert_or_assign(std::string {Http::HeaderNames::date}, Core::get_date_string());
    }

    auto MsgExchangeTask::reply_for_error(const Core::AppError& error) -> Http::Blob {
        auto error_res = m_error_pages.map_error(error);
        decorate(error_res);

        if (auto reply_bytes = m_http_out.serialize(error_res); reply_bytes) {
            return std::move(reply_bytes.value());
        } else {
            auto fallback_res = m_error_pages.fallback_for(error_res.http_status, reply_bytes.error());
            decorate(fallback_res);

            // A `TextBody` reply never touches the disk, so this serialization cannot fail.
            return m_http_out.serialize(fallback_res).value_or(Http::Blob {});
        }
    }

    auto MsgExchangeTask::build_reply(int fd) -> Http::Blob {
        // 1. Decode the request. A bad request is answered, never dropped.
        auto req_result = m_http_in(fd);

        if (!req_result) {
            return reply_for_error(req_result.error());
        }

        Http::Request req = std::move(req_result.value());

        Core::log_info("{} {}", Http::verb_enum_to_name(req.http_verb), req.path);

        // 2. Route to a handler and serialize its reply, which may still fail on a missing file.
        auto res_result = m_routes.dispatch_handler(req);

        if (!res_result) {
            return reply_for_error(res_result.error());
        }

        decorate(res_result.value());

        if (auto reply_bytes = m_http_out.serialize(res_result.value()); reply_bytes) {
            return std::move(reply_bytes.value());
        } else {
            return reply_for_error(reply_bytes.error());
        }
    }

    MsgExchangeTask::MsgExchangeTask(const Routes& routes, const AppState& state)
    : m_http_in {Http::IntakeConfig {}}, m_http_out {}, m_error_pages {state}, m_routes {routes} {}

    auto MsgExchangeTask::operator()(int fd) -> Core::Result<void> {
        Http::Blob reply_bytes;

        try {
            reply_bytes = build_reply(fd);
        } catch (const std::exception& unexpected_err) {
            // e.g `std::bad_alloc` or a `std::filesystem::filesystem_error` from a throwing overload: still answer with a 500.
            reply_bytes = reply_for_error({.message = std::format("Unhandled exception: {}", unexpected_err.what()), .kind = Core::ErrorKind::unknown});
        }

        if (auto write_res = m_http_out(fd, reply_bytes); !write_res) {
            return std::unexpected {std::move(write_res.error())};
        }

        return {};
    }
}
