#include <array>
#include <format>
#include <string_view>

#include "mycore/text.hpp"
#include "myhttp/enums.hpp"

namespace ShelfHttpd::Http {
    constexpr std::array<std::string_view, scoped_enum_len<Verb>()> verb_names {
        "GET",
        "POST",
        "PUT",
        "PATCH",
        "DELETE",
        "HEAD",
        "OPTIONS",
        "TRACE",
        "CONNECT",
    };

    constexpr std::array<std::string_view, scoped_enum_len<Status>()> status_names {
        "OK",
        "See Other",
        "Forbidden",
        "Not Found",
        "Internal Server Error",
    };

    constexpr std::array<std::string_view, scoped_enum_len<Status>()> status_code_names {
        "200",
        "303",
        "403",
        "404",
        "500",
    };

    auto verb_enum_to_name(Verb v) noexcept -> std::string_view {
        return verb_names[static_cast<std::size_t>(v)];
    }

    auto verb_name_to_enum(std::string_view name) -> Core::Result<Verb> {
        const auto upper_name = Core::to_upper_copy(name);

        for (std::size_t verb_idx = 0; verb_idx < verb_names.size(); ++verb_idx) {
            if (verb_names[verb_idx] == upper_name) {
                return static_cast<Verb>(verb_idx);
            }
        }

        return Core::make_error(Core::ErrorKind::invalid, std::format("Unknown method: {}", name));
    }

    auto status_enum_to_name(Status s) noexcept -> std::string_view {
        return status_names[static_cast<std::size_t>(s)];
    }

    auto status_enum_to_code(Status s) noexcept -> std::string_view {
        return status_code_names[static_cast<std::size_t>(s)];
    }
}
