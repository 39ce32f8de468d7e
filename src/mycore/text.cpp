#include <cstdint>
#include <string>

#include "mycore/text.hpp"

namespace ShelfHttpd::Core {
    auto trim_view(std::string_view sv) noexcept -> std::string_view {
        while (!sv.empty() && is_space(sv.front())) {
            sv.remove_prefix(1);
        }

        while (!sv.empty() && is_space(sv.back())) {
            sv.remove_suffix(1);
        }

        return sv;
    }

    auto to_upper_copy(std::string_view sv) -> std::string {
        std::string result;
        result.reserve(sv.length());

        for (const auto c : sv) {
            result.push_back(to_ascii_upper(c));
        }

        return result;
    }

    auto is_valid_utf8(std::string_view sv) noexcept -> bool {
        std::size_t pos = 0;
        const auto end = sv.length();

        while (pos < end) {
            const auto lead = static_cast<uint8_t>(sv[pos]);
            std::size_t trail_n = 0;
            uint32_t code_point = 0;

            if (lead < 0x80) {
                ++pos;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                trail_n = 1;
                code_point = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                trail_n = 2;
                code_point = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                trail_n = 3;
                code_point = lead & 0x07;
            } else {
                return false;
            }

            if (pos + trail_n >= end) {
                return false;
            }

            for (std::size_t trail_idx = 1; trail_idx <= trail_n; ++trail_idx) {
                const auto trail = static_cast<uint8_t>(sv[pos + trail_idx]);

                if ((trail & 0xC0) != 0x80) {
                    return false;
                }

                code_point = (code_point << 6) | (trail & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates and out-of-range code points.
            if ((trail_n == 1 && code_point < 0x80)
                || (trail_n == 2 && code_point < 0x800)
                || (trail_n == 3 && code_point < 0x10000)
                || (code_point >= 0xD800 && code_point <= 0xDFFF)
                || code_point > 0x10FFFF) {
                return false;
            }

            pos += trail_n + 1;
        }

        return true;
    }

    auto escape_html(std::string_view sv) -> std::string {
        std::string result;
        result.reserve(sv.length());

        for (const auto c : sv) {
            switch (c) {
            case '&': result.append("&amp;"); break;
            case '<': result.append("&lt;"); break;
            case '>': result.append("&gt;"); break;
            case '"': result.append("&quot;"); break;
            case '\'': result.append("&#39;"); break;
            default: result.push_back(c); break;
            }
        }

        return result;
    }

    [[nodiscard]] static constexpr auto hex_digit_value(char c) noexcept -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        } else if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        } else if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }

        return -1;
    }

    auto percent_decode(std::string_view sv) -> std::optional<std::string> {
        std::string result;
        result.reserve(sv.length());

        for (std::size_t pos = 0; pos < sv.length(); ++pos) {
            if (sv[pos] != '%') {
                result.push_back(sv[pos]);
                continue;
            }

            if (pos + 2 >= sv.length()) {
                return {};
            }

            const auto hex_high = hex_digit_value(sv[pos + 1]);
            const auto hex_low = hex_digit_value(sv[pos + 2]);

            if (hex_high < 0 || hex_low < 0) {
                return {};
            }

            result.push_back(static_cast<char>((hex_high << 4) | hex_low));
            pos += 2;
        }

        return result;
    }

    auto percent_encode_path(std::string_view sv) -> std::string {
        constexpr std::string_view hex_digits = "0123456789ABCDEF";

        std::string result;
        result.reserve(sv.length());

        for (const auto c : sv) {
            const auto byte = static_cast<uint8_t>(c);

            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                || c == '-' || c == '.' || c == '_' || c == '~' || c == '/') {
                result.push_back(c);
            } else {
                result.push_back('%');
                result.push_back(hex_digits[byte >> 4]);
                result.push_back(hex_digits[byte & 0x0F]);
            }
        }

        return result;
    }

    auto replace_all(std::string text, std::string_view token, std::string_view replacement) -> std::string {
        if (token.empty()) {
            return text;
        }

        std::size_t search_pos = 0;

        while ((search_pos = text.find(token, search_pos)) != std::string::npos) {
            text.replace(search_pos, token.length(), replacement);
            search_pos += replacement.length();
        }

        return text;
    }
}
