#include <format>
#include <string>
#include <utility>

#include "mycore/buffered_file.hpp"
#include "mycore/text.hpp"
#include "myhttp/headers.hpp"
#include "myapp/file_store.hpp"
#include "myapp/paths.hpp"
#include "myapp/handlers.hpp"

namespace ShelfHttpd::App::Handlers {
    auto list_files(const AppState& state) -> Core::Result<Http::Response> {
        auto page = state.templates.load(TemplateNames::index_page);

        if (!page) {
            return std::unexpected {std::move(page.error())};
        }

        auto files = list_files_with_paths(state.uploads_root);

        if (!files) {
            return std::unexpected {std::move(files.error())};
        }

        std::string file_links;

        for (const auto& [file_name, file_path] : files.value()) {
            if (!file_links.empty()) {
                file_links.push_back('\n');
            }

            file_links.append(std::format(
                R"(<li><a href="/uploads/{}">{}</a></li>)",
                Core::percent_encode_path(file_name),
                Core::escape_html(file_name)
            ));
        }

        return Http::ResponseBuilder {}
            .body(Http::TextBody {PageTemplates::render(std::move(page.value()), files_list_token, file_links)})
            .build();
    }

    auto view_file(const AppState& state, std::string_view request_path) -> Core::Result<Http::Response> {
        const auto decoded_path = Core::percent_decode(request_path);

        if (!decoded_path) {
            return Core::make_error(Core::ErrorKind::invalid, std::format("Malformed percent-escape in path: {}", request_path));
        }

        auto resolved_path = resolve_view_path(state.uploads_root, *decoded_path);

        if (!resolved_path) {
            return std::unexpected {std::move(resolved_path.error())};
        }

        return Http::ResponseBuilder {}
            .body(Http::FileBody {std::move(resolved_path.value())})
            .build();
    }

    auto get_upload_form(const AppState& state) -> Core::Result<Http::Response> {
        return Http::ResponseBuilder {}
            .body(Http::FileBody {state.templates.path_of(TemplateNames::upload_page)})
            .build();
    }

    auto post_upload(AppState& state, Http::RequestBody body) -> Core::Result<Http::Response> {
        auto upload_p = std::get_if<Core::BufferedFile>(&body);

        if (!upload_p) {
            return Core::make_error(Core::ErrorKind::invalid, "Upload requires a multipart/form-data body");
        }

        auto target_path = resolve_upload_path(state.uploads_root, upload_p->name);

        if (!target_path) {
            return std::unexpected {std::move(target_path.error())};
        }

        {
            auto upload_lock = state.upload_locks.acquire(upload_p->name);

            if (auto save_res = Core::save_buffered_file(target_path.value(), *upload_p); !save_res) {
                return std::unexpected {std::move(save_res.error())};
            }
        }

        return Http::ResponseBuilder {}
            .status(Http::Status::http_see_other)
            .header(Http::HeaderNames::location, "/")
            .build();
    }
}
