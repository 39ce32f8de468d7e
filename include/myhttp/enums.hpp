#ifndef SHELF_HTTPD_MYHTTP_ENUMS_HPP
#define SHELF_HTTPD_MYHTTP_ENUMS_HPP

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "mycore/errors.hpp"

namespace ShelfHttpd::Http {
    enum class Verb : uint8_t {
        http_get,
        http_post,
        http_put,
        http_patch,
        http_delete,
        http_head,
        http_options,
        http_trace,
        http_connect,
        last,
    };

    enum class Status : uint32_t {
        http_ok,
        http_see_other,
        http_forbidden,
        http_not_found,
        http_server_error,
        last,
    };

    [[nodiscard]] auto verb_enum_to_name(Verb v) noexcept -> std::string_view;

    /// NOTE: Matches method tokens case-insensitively, so `get` and `GET` both give `Verb::http_get`.
    [[nodiscard]] auto verb_name_to_enum(std::string_view name) -> Core::Result<Verb>;

    [[nodiscard]] auto status_enum_to_name(Status s) noexcept -> std::string_view;

    [[nodiscard]] auto status_enum_to_code(Status s) noexcept -> std::string_view;

    template <typename E> requires requires {{E::last};} && std::is_enum_v<E>
    [[nodiscard]] consteval auto scoped_enum_len() noexcept -> std::size_t {
        return static_cast<std::size_t>(E::last);
    }
}

#endif
