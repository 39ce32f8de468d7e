#include <array>

#include "mycore/logging.hpp"

namespace ShelfHttpd::Core {
    constexpr std::array<std::string_view, static_cast<std::size_t>(LogLevel::last)> log_level_names {
        "INFO",
        "WARN",
        "ERROR",
    };

    auto log_level_to_name(LogLevel level) noexcept -> std::string_view {
        return log_level_names[static_cast<std::size_t>(level)];
    }
}
