#ifndef SHELF_HTTPD_MYCORE_LOGGING_HPP
#define SHELF_HTTPD_MYCORE_LOGGING_HPP

#include <cstdint>
#include <format>
#include <iostream>
#include <print>
#include <string_view>
#include <utility>

#include "mycore/clock.hpp"

namespace ShelfHttpd::Core {
    enum class LogLevel : uint8_t {
        info,
        warning,
        error,
        last,
    };

    [[nodiscard]] auto log_level_to_name(LogLevel level) noexcept -> std::string_view;

    /// NOTE: Info lines go to stdout, warnings and errors go to stderr. Each line is emitted by a single `std::println` call so concurrent workers never interleave within a line.
    template <typename ... Args>
    void log_message(LogLevel level, std::format_string<Args...> fmt, Args&& ... args) {
        auto& log_out = (level == LogLevel::info) ? std::cout : std::cerr;

        std::println(log_out, "{} [{}] {}", log_level_to_name(level), get_log_time_string(), std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename ... Args>
    void log_info(std::format_string<Args...> fmt, Args&& ... args) {
        log_message(LogLevel::info, fmt, std::forward<Args>(args)...);
    }

    template <typename ... Args>
    void log_warn(std::format_string<Args...> fmt, Args&& ... args) {
        log_message(LogLevel::warning, fmt, std::forward<Args>(args)...);
    }

    template <typename ... Args>
    void log_error(std::format_string<Args...> fmt, Args&& ... args) {
        log_message(LogLevel::error, fmt, std::forward<Args>(args)...);
    }
}

#endif
