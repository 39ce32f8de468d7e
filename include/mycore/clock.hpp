#ifndef SHELF_HTTPD_MYCORE_CLOCK_HPP
#define SHELF_HTTPD_MYCORE_CLOCK_HPP

#include <string>

namespace ShelfHttpd::Core {
    // Generates a GMT string for HTTP/1.1 responses: `%a, %d %b %Y %T GMT`, referencing: https://developer.mozilla.org/en-US/docs/Web/HTTP/Reference/Headers/Date
    [[nodiscard]] auto get_date_string() -> std::string;

    /// NOTE: Military-style UTC timestamp for log lines, e.g `2024-03-01T13:45:09`.
    [[nodiscard]] auto get_log_time_string() -> std::string;
}

#endif
