#include <chrono>
#include <format>

#include "mycore/clock.hpp"

namespace ShelfHttpd::Core {
    auto get_date_string() -> std::string {
        auto now_time = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());

        return std::format("{0:%a}, {0:%d} {0:%b} {0:%Y} {0:%H}:{0:%M}:{0:%S} GMT", now_time);
    }

    auto get_log_time_string() -> std::string {
        auto now_time = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());

        return std::format("{0:%Y}-{0:%m}-{0:%d}T{0:%H}:{0:%M}:{0:%S}", now_time);
    }
}
