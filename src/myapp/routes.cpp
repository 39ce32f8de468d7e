#include <algorithm>
#include <format>
#include <utility>

#include "myapp/handlers.hpp"
#include "myapp/routes.hpp"

namespace ShelfHttpd::App {
    auto route_path_of(std::string_view target) noexcept -> std::string_view {
        return target.substr(0, target.find('?'));
    }


    Routes::Routes()
    : m_handlers {} {}

    auto Routes::set_handler(Http::Verb verb, const std::string& route_path, RouteMatch match, Middleware handler_box) -> bool {
        if (std::ranges::any_of(m_handlers, [&](const RouteEntry& entry) {
            return entry.verb == verb && entry.match == match && entry.path == route_path;
        })) {
            return false;
        }

        m_handlers.emplace_back(RouteEntry {
            .handler = std::move(handler_box),
            .path = route_path,
            .verb = verb,
            .match = match,
        });

        return true;
    }

    auto Routes::dispatch_handler(Http::Request& req) const -> Core::Result<Http::Response> {
        const auto req_path = route_path_of(req.path);

        // 1. Try an exact route match first.
        if (auto handler_it = std::ranges::find_if(m_handlers, [&](const RouteEntry& entry) {
            return entry.match == RouteMatch::exact && entry.verb == req.http_verb && entry.path == req_path;
        }); handler_it != m_handlers.end()) {
            return handler_it->handler(req);
        }

        // 2. Then any prefix route, e.g `/uploads/` for served files.
        if (auto handler_it = std::ranges::find_if(m_handlers, [&](const RouteEntry& entry) {
            return entry.match == RouteMatch::prefix && entry.verb == req.http_verb && req_path.starts_with(entry.path);
        }); handler_it != m_handlers.end()) {
            return handler_it->handler(req);
        }

        // 3. No handler: answered with the "page not found" page.
        return Core::make_error(Core::ErrorKind::not_found, std::format("No route for {} {}", Http::verb_enum_to_name(req.http_verb), req.path));
    }

    auto make_app_routes(AppState& state) -> Routes {
        Routes app_routes;

        app_routes.set_handler(Http::Verb::http_get, "/", RouteMatch::exact, [&state]([[maybe_unused]] Http::Request& req) {
            return Handlers::list_files(state);
        });

        app_routes.set_handler(Http::Verb::http_get, "/upload", RouteMatch::exact, [&state]([[maybe_unused]] Http::Request& req) {
            return Handlers::get_upload_form(state);
        });

        app_routes.set_handler(Http::Verb::http_post, "/upload", RouteMatch::exact, [&state](Http::Request& req) {
            return Handlers::post_upload(state, std::exchange(req.body, Http::EmptyBody {}));
        });

        app_routes.set_handler(Http::Verb::http_get, "/uploads/", RouteMatch::prefix, [&state](Http::Request& req) {
            return Handlers::view_file(state, route_path_of(req.path));
        });

        return app_routes;
    }
}
