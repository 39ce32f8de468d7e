#ifndef SHELF_HTTPD_MYNET_IO_FUNCS_HPP
#define SHELF_HTTPD_MYNET_IO_FUNCS_HPP

#include <sys/types.h>

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace ShelfHttpd::Net {
    template <typename Data>
    using IOResult = std::expected<Data, std::string>;

    enum class LineStatus : uint8_t {
        complete, // found LF, excluding it and any CR from the output
        peer_closed, // EOF came before LF
        too_long, // exceeded the caller's length bound before LF
    };

    /// NOTE: Reads one byte at a time so no bytes past the LF are consumed. Reports only `recv` failures as errors.
    [[nodiscard]] auto socket_read_line(int fd, std::string& dest, std::size_t max_n) -> IOResult<LineStatus>;

    /// NOTE: Appends up to `n` bytes to `dest`, returning the appended count which is below `n` only if the peer closed early.
    [[nodiscard]] auto socket_read_exact(int fd, std::size_t n, std::vector<char>& dest) -> IOResult<std::size_t>;

    [[nodiscard]] auto socket_write_n(int fd, const char* src, std::size_t n) noexcept -> IOResult<std::size_t>;
}

#endif
