#ifndef SHELF_HTTPD_MYAPP_ROUTES_HPP
#define SHELF_HTTPD_MYAPP_ROUTES_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "mycore/errors.hpp"
#include "myhttp/msgs.hpp"
#include "myapp/state.hpp"

namespace ShelfHttpd::App {
    /// NOTE: Provides an alias for any callable entity that generates a web response from a parsed request.
    using Middleware = std::function<Core::Result<Http::Response>(Http::Request&)>;

    enum class RouteMatch : uint8_t {
        exact,
        prefix,
    };

    /// NOTE: Strips any `?query` suffix from a request target.
    [[nodiscard]] auto route_path_of(std::string_view target) noexcept -> std::string_view;

    class Routes {
    private:
        struct RouteEntry {
            Middleware handler;
            std::string path;
            Http::Verb verb;
            RouteMatch match;
        };

        std::vector<RouteEntry> m_handlers;

    public:
        Routes();

        /// NOTE: Gives false without replacing anything if the same verb, path and match mode are already routed.
        [[maybe_unused]] auto set_handler(Http::Verb verb, const std::string& route_path, RouteMatch match, Middleware handler_box) -> bool;

        /**
         * @brief Picks the handler for a request: exact routes win over prefix routes, and prefix routes are tried in registration order.
         * @note An unrouted request is `Core::ErrorKind::not_found`.
         */
        [[nodiscard]] auto dispatch_handler(Http::Request& req) const -> Core::Result<Http::Response>;
    };

    /// NOTE: Wires the four file-sharing routes to `Handlers`. `state` must outlive the returned routes.
    [[nodiscard]] auto make_app_routes(AppState& state) -> Routes;
}

#endif
