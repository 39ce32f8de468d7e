#include <format>
#include <fstream>
#include <iterator>
#include <utility>

#include "mycore/text.hpp"
#include "myapp/contents.hpp"

namespace ShelfHttpd::App {
    PageTemplates::PageTemplates(std::filesystem::path root) noexcept
    : m_root (std::move(root)) {}

    auto PageTemplates::path_of(std::string_view template_name) const -> std::filesystem::path {
        return m_root / template_name;
    }

    auto PageTemplates::load(std::string_view template_name) const -> Core::Result<std::string> {
        const auto template_path = path_of(template_name);
        std::ifstream template_in {template_path, std::ios::in | std::ios::binary};

        if (!template_in.is_open()) {
            return Core::make_error(Core::ErrorKind::io, std::format("Failed to open template: {}", template_path.string()));
        }

        std::string page {std::istreambuf_iterator<char> {template_in}, std::istreambuf_iterator<char> {}};

        if (template_in.bad()) {
            return Core::make_error(Core::ErrorKind::io, std::format("Failed to read template: {}", template_path.string()));
        }

        return page;
    }

    auto PageTemplates::render(std::string page, std::string_view token, std::string_view replacement) -> std::string {
        return Core::replace_all(std::move(page), token, replacement);
    }
}
