#ifndef SHELF_HTTPD_MYAPP_HANDLERS_HPP
#define SHELF_HTTPD_MYAPP_HANDLERS_HPP

#include <string_view>

#include "mycore/errors.hpp"
#include "myhttp/msgs.hpp"
#include "myapp/state.hpp"

namespace ShelfHttpd::App::Handlers {
    /// GET `/`: the index template with one `<li>` link per stored upload.
    [[nodiscard]] auto list_files(const AppState& state) -> Core::Result<Http::Response>;

    /// GET `/uploads/<relative-path>`
    [[nodiscard]] auto view_file(const AppState& state, std::string_view request_path) -> Core::Result<Http::Response>;

    /// GET `/upload`
    [[nodiscard]] auto get_upload_form(const AppState& state) -> Core::Result<Http::Response>;

    /**
     * @brief POST `/upload`: stores the single multipart file under the uploads root and redirects to `/`.
     * @note Saves of the same name are serialized through `AppState::upload_locks`; the last writer wins.
     */
    [[nodiscard]] auto post_upload(AppState& state, Http::RequestBody body) -> Core::Result<Http::Response>;
}

#endif
