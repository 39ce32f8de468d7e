#include <array>
#include <string_view>

#include "mycore/errors.hpp"

namespace ShelfHttpd::Core {
    constexpr std::array<std::string_view, static_cast<std::size_t>(ErrorKind::last)> error_kind_names {
        "IO",
        "Invalid",
        "NotFound",
        "NotPermitted",
        "Unknown",
    };

    auto error_kind_to_name(ErrorKind kind) noexcept -> std::string_view {
        return error_kind_names[static_cast<std::size_t>(kind)];
    }
}
