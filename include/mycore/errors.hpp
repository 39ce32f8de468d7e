#ifndef SHELF_HTTPD_MYCORE_ERRORS_HPP
#define SHELF_HTTPD_MYCORE_ERRORS_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ShelfHttpd::Core {
    enum class ErrorKind : uint8_t {
        io, // environment or config problem: critical
        invalid, // malformed client input
        not_found,
        not_permitted, // traversal or containment violation
        unknown,
        last,
    };

    struct AppError {
        std::string message;
        ErrorKind kind;
    };

    /// NOTE: Every fallible core operation reports through this alias, never through exceptions.
    template <typename Data>
    using Result = std::expected<Data, AppError>;

    [[nodiscard]] auto error_kind_to_name(ErrorKind kind) noexcept -> std::string_view;

    [[nodiscard]] inline auto make_error(ErrorKind kind, std::string message) -> std::unexpected<AppError> {
        return std::unexpected {AppError {
            .message = std::move(message),
            .kind = kind,
        }};
    }
}

#endif
