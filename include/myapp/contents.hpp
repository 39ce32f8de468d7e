#ifndef SHELF_HTTPD_MYAPP_CONTENTS_HPP
#define SHELF_HTTPD_MYAPP_CONTENTS_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "mycore/errors.hpp"

namespace ShelfHttpd::App {
    namespace TemplateNames {
        constexpr std::string_view index_page = "index.html";
        constexpr std::string_view upload_page = "upload.html";
        constexpr std::string_view page_not_found = "page-not-found.html";
        constexpr std::string_view bad_request = "bad-request.html";
        constexpr std::string_view access_denied = "access-denied.html";
        constexpr std::string_view server_error = "server-error.html";
    }

    constexpr std::string_view files_list_token = "{{FILES_LIST}}";

    /// NOTE: HTML page templates are opaque text with `{{TOKEN}}` placeholders. No escaping happens during substitution.
    class PageTemplates {
    private:
        std::filesystem::path m_root;

    public:
        explicit PageTemplates(std::filesystem::path root) noexcept;

        [[nodiscard]] auto path_of(std::string_view template_name) const -> std::filesystem::path;

        /// NOTE: A missing or unreadable template is `Core::ErrorKind::io`: the server install is broken, not the request.
        [[nodiscard]] auto load(std::string_view template_name) const -> Core::Result<std::string>;

        [[nodiscard]] static auto render(std::string page, std::string_view token, std::string_view replacement) -> std::string;
    };
}

#endif
