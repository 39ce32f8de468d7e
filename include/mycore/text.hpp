#ifndef SHELF_HTTPD_MYCORE_TEXT_HPP
#define SHELF_HTTPD_MYCORE_TEXT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace ShelfHttpd::Core {
    [[nodiscard]] constexpr auto is_space(char c) noexcept -> bool {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }

    [[nodiscard]] constexpr auto to_ascii_lower(char c) noexcept -> char {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    [[nodiscard]] constexpr auto to_ascii_upper(char c) noexcept -> char {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    [[nodiscard]] auto trim_view(std::string_view sv) noexcept -> std::string_view;

    [[nodiscard]] auto to_upper_copy(std::string_view sv) -> std::string;

    /// NOTE: Rejects overlong encodings, surrogates, and code points past U+10FFFF.
    [[nodiscard]] auto is_valid_utf8(std::string_view sv) noexcept -> bool;

    [[nodiscard]] auto escape_html(std::string_view sv) -> std::string;

    /// NOTE: Decodes `%XX` escapes in a URI path. Gives nothing for a truncated or non-hex escape. A `+` stays a literal `+`.
    [[nodiscard]] auto percent_decode(std::string_view sv) -> std::optional<std::string>;

    /// NOTE: Escapes every byte outside `A-Z a-z 0-9 - . _ ~ /` for use in a URI path.
    [[nodiscard]] auto percent_encode_path(std::string_view sv) -> std::string;

    /// Replaces every occurrence of `token` inside `text`.
    [[nodiscard]] auto replace_all(std::string text, std::string_view token, std::string_view replacement) -> std::string;
}

#endif
